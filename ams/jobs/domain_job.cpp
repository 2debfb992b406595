/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <cerrno>
#include <set>

#include "ams/jobs/domain_job.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

namespace {
json::value model_entry (const std::string &uq_type,
                         const std::string &model_path,
                         const json::value &threshold,
                         const std::string &label)
{
    json::value m;
    m.emplace_object ();
    dict::put (m, "uq_type", uq_type);
    dict::put (m, "model_path", model_path);
    dict::put (m, "uq_aggregate", std::string ("mean"));
    m.set ("threshold", threshold);
    dict::put (m, "db_label", label);
    return m;
}
}  // namespace

domain_job_t::domain_job_t (job_desc_t desc,
                            std::vector<std::string> domain_names,
                            std::optional<std::string> stage_dir)
    : m_desc (std::move (desc)),
      m_domain_names (std::move (domain_names)),
      m_stage_dir (std::move (stage_dir))
{
    std::set<std::string> seen;
    for (auto &d : m_domain_names) {
        if (!seen.insert (d).second)
            throw config_error ("domain job " + m_desc.name + ": duplicate domain name " + d);
    }
}

job_desc_t &domain_job_t::desc ()
{
    return m_desc;
}

const job_desc_t &domain_job_t::desc () const
{
    return m_desc;
}

const std::vector<std::string> &domain_job_t::domain_names () const
{
    return m_domain_names;
}

const std::optional<std::string> &domain_job_t::stage_dir () const
{
    return m_stage_dir;
}

const std::string &domain_job_t::ams_objects_path () const
{
    return m_ams_objects_path;
}

json::value domain_job_t::ams_objects (const data_store_base_t &store,
                                       const rmq_config_t *rmq) const
{
    json::value top, db, ml_models, domain_models;

    top.emplace_object ();
    db.emplace_object ();
    if (rmq) {
        db.set ("rmq_config", rmq->to_connection_descriptor (true));
        dict::put (db, "dbType", std::string ("rmq"));
        dict::put (db, "update_surrogate", false);
    } else {
        dict::put (db, "fs_path", m_stage_dir.value_or (store.candidate_path ().string ()));
        dict::put (db, "dbType", std::string ("hdf5"));
    }
    top.set ("db", db);

    ml_models.emplace_object ();
    domain_models.emplace_object ();
    for (size_t i = 0; i < m_domain_names.size (); i++) {
        const std::string &name = m_domain_names[i];
        std::string key = "model_" + std::to_string (i);
        std::vector<model_record_t> models = store.search (name, "models", "latest");
        json::value threshold;

        if (models.empty ()) {
            // no surrogate yet: every sample is uncertain and gets collected
            json::to_json (threshold, 1);
            ml_models.set (key.c_str (), model_entry ("random", "", threshold, name));
        } else {
            const model_record_t &m = models.front ();
            json::to_json (threshold, m.threshold);
            ml_models.set (key.c_str (), model_entry (m.uq_type, m.file, threshold, name));
        }
        dict::put (domain_models, name.c_str (), key);
    }
    top.set ("ml_models", ml_models);
    top.set ("domain_models", domain_models);
    return top;
}

void domain_job_t::precede_deploy (const data_store_base_t &store, const rmq_config_t *rmq)
{
    json::value objects = ams_objects (store, rmq);
    std::filesystem::path tmp = store.mkdir ("tmp");
    std::string fn = (tmp / (data_store_base_t::unique_filename () + ".json")).string ();

    errno = 0;
    if (json_dump_file (objects.get (), fn.c_str (), JSON_INDENT (4)) < 0)
        throw io_error ("cannot write " + fn, errno ? errno : EIO);

    m_ams_objects_path = fn;
    m_desc.environment["AMS_OBJECTS"] = fn;
    if (m_desc.ams_log)
        m_desc.environment["AMS_LOG_LEVEL"] = "debug";
}

void domain_job_t::dict_fields (json::value &o) const
{
    json::value v;
    json::to_json (v, m_domain_names);
    o.set ("domain_names", v);
    dict::put (o, "stage_dir", m_stage_dir);
}

domain_job_t domain_job_t::from_dict (const json_t *o)
{
    job_desc_t desc = job_desc_t::from_dict (o);
    json_t *names = json_object_get (o, "domain_names");
    std::vector<std::string> domain_names;
    size_t index;
    json_t *v;

    if (!names || !json_is_array (names))
        throw config_error ("domain job: \"domain_names\" must be a list");
    json_array_foreach (names, index, v) {
        if (!json_is_string (v))
            throw config_error ("domain job: domain names must be strings");
        domain_names.push_back (json_string_value (v));
    }
    return domain_job_t (std::move (desc),
                         std::move (domain_names),
                         dict::get_opt_string (o, "stage_dir"));
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
