/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <filesystem>

#include "ams/jobs/stage_job.hpp"
#include "ams/jobs/domain_job.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

void stage_params_t::validate () const
{
    if (!prune_module_path)
        return;
    std::error_code ec;
    if (!std::filesystem::exists (*prune_module_path, ec))
        throw config_error ("pruning module " + *prune_module_path + " does not exist");
    if (!prune_class || prune_class->empty ())
        throw config_error ("pruning module " + *prune_module_path
                            + " given without a pruning class");
}

void stage_params_t::dict_fields (json::value &o) const
{
    dict::put (o, "dest", dest);
    dict::put (o, "persistent_db_path", persistent_db_path);
    dict::put (o, "store", store);
    dict::put (o, "db_type", db_type);
    dict::put (o, "policy", policy);
    dict::put (o, "prune_module_path", prune_module_path);
    dict::put (o, "prune_class", prune_class);
}

stage_params_t stage_params_t::from_dict (const json_t *o)
{
    stage_params_t p;
    p.dest = dict::get_string (o, "dest");
    p.persistent_db_path = dict::get_string (o, "persistent_db_path");
    p.store = dict::get_bool (o, "store", true);
    if (auto t = dict::get_opt_string (o, "db_type"))
        p.db_type = *t;
    if (auto t = dict::get_opt_string (o, "policy"))
        p.policy = *t;
    p.prune_module_path = dict::get_opt_string (o, "prune_module_path");
    p.prune_class = dict::get_opt_string (o, "prune_class");
    return p;
}

stage_job_base_t::stage_job_base_t (job_desc_t base, stage_params_t params)
    : m_params (std::move (params))
{
    m_params.validate ();
    m_user_args = std::move (base.cli_args);
    m_user_kwargs = std::move (base.cli_kwargs);
    m_desc = std::move (base);
}

job_desc_t &stage_job_base_t::desc ()
{
    return m_desc;
}

const job_desc_t &stage_job_base_t::desc () const
{
    return m_desc;
}

const stage_params_t &stage_job_base_t::params () const
{
    return m_params;
}

void stage_job_base_t::assemble (const std::string &name,
                                 const cli_kwargs_t &source_flags,
                                 const std::vector<std::string> &source_args)
{
    cli_kwargs_t kwargs = m_user_kwargs;
    std::vector<std::string> args = m_user_args;

    for (auto &[flag, value] : source_flags)
        kwargs.set (flag, value);
    kwargs.set ("--dest", m_params.dest);
    kwargs.set ("--persistent-db-path", m_params.persistent_db_path);
    kwargs.set ("--db-type", m_params.db_type);
    kwargs.set ("--policy", m_params.policy);
    if (m_params.prune_module_path) {
        kwargs.set ("--load", *m_params.prune_module_path);
        kwargs.set ("--class", *m_params.prune_class);
    }

    args.insert (args.end (), source_args.begin (), source_args.end ());
    args.push_back (m_params.store ? "--store" : "--no-store");

    m_desc.name = name;
    m_desc.executable = STAGE_EXECUTABLE;
    m_desc.cli_args = std::move (args);
    m_desc.cli_kwargs = std::move (kwargs);
}

void stage_job_base_t::base_dict_fields (json::value &o) const
{
    json::value v, kw;
    m_params.dict_fields (o);
    json::to_json (v, m_user_args);
    o.set ("user_cli_args", v);
    kw.emplace_object ();
    for (auto &[flag, value] : m_user_kwargs)
        dict::put (kw, flag.c_str (), value);
    o.set ("user_cli_kwargs", kw);
}

job_desc_t stage_job_base_t::base_from_dict (const json_t *o)
{
    job_desc_t d = job_desc_t::from_dict (o);
    json_t *kw = json_object_get (o, "user_cli_kwargs");
    const char *flag;
    json_t *value;

    d.cli_args = dict::get_scalar_list (o, "user_cli_args");
    d.cli_kwargs = cli_kwargs_t ();
    if (kw && !json_is_null (kw)) {
        if (!json_is_object (kw))
            throw config_error ("\"user_cli_kwargs\" must be a mapping");
        json_object_foreach (kw, flag, value) {
            d.cli_kwargs.set (flag, dict::scalar_to_cli (value, flag));
        }
    }
    return d;
}

fs_stage_job_t::fs_stage_job_t (job_desc_t base,
                                stage_params_t params,
                                std::string src,
                                std::string src_type,
                                std::string pattern)
    : stage_job_base_t (std::move (base), std::move (params)),
      m_src (std::move (src)),
      m_src_type (std::move (src_type)),
      m_pattern (std::move (pattern))
{
    assemble ("AMSStageJob",
              {{"--src", m_src},
               {"--src-type", m_src_type},
               {"--pattern", m_pattern},
               {"--mechanism", "fs"}},
              {});
}

void fs_stage_job_t::dict_fields (json::value &o) const
{
    base_dict_fields (o);
    dict::put (o, "src", m_src);
    dict::put (o, "src_type", m_src_type);
    dict::put (o, "pattern", m_pattern);
}

fs_stage_job_t fs_stage_job_t::from_dict (const json_t *o)
{
    return fs_stage_job_t (base_from_dict (o),
                           stage_params_t::from_dict (o),
                           dict::get_string (o, "src"),
                           dict::get_string (o, "src_type"),
                           dict::get_string (o, "pattern"));
}

network_stage_job_t::network_stage_job_t (job_desc_t base,
                                          stage_params_t params,
                                          std::string creds,
                                          bool update_models)
    : stage_job_base_t (std::move (base), std::move (params)),
      m_creds (std::move (creds)),
      m_update_models (update_models)
{
    std::vector<std::string> source_args;
    if (m_update_models)
        source_args.push_back ("--update-rmq-models");
    assemble ("AMSStageJob", {{"--creds", m_creds}, {"--mechanism", "network"}}, source_args);
}

void network_stage_job_t::dict_fields (json::value &o) const
{
    base_dict_fields (o);
    dict::put (o, "creds", m_creds);
    dict::put (o, "update_models", m_update_models);
}

network_stage_job_t network_stage_job_t::from_dict (const json_t *o)
{
    return network_stage_job_t (base_from_dict (o),
                                stage_params_t::from_dict (o),
                                dict::get_string (o, "creds"),
                                dict::get_bool (o, "update_models", false));
}

namespace {
stage_params_t temp_stage_params (std::string store_dir,
                                  std::string dest_dir,
                                  std::optional<std::string> prune_module_path,
                                  std::optional<std::string> prune_class)
{
    stage_params_t p;
    p.dest = std::move (dest_dir);
    p.persistent_db_path = std::move (store_dir);
    p.prune_module_path = std::move (prune_module_path);
    p.prune_class = std::move (prune_class);
    return p;
}
}  // namespace

fs_temp_stage_job_t::fs_temp_stage_job_t (job_desc_t base,
                                          std::string store_dir,
                                          std::string src_dir,
                                          std::string dest_dir,
                                          std::optional<std::string> prune_module_path,
                                          std::optional<std::string> prune_class)
    : stage_job_base_t (std::move (base),
                        temp_stage_params (std::move (store_dir),
                                           std::move (dest_dir),
                                           std::move (prune_module_path),
                                           std::move (prune_class))),
      m_src (std::move (src_dir))
{
    assemble ("AMSStage", {{"--src", m_src}, {"--pattern", "*.h5"}, {"--mechanism", "fs"}}, {});
}

job_resources_t fs_temp_stage_job_t::resources_from_domain_job (const domain_job_t &domain_job)
{
    const std::optional<job_resources_t> &r = domain_job.desc ().resources;
    if (!r)
        throw resource_error ("domain job " + domain_job.desc ().name
                              + " has no resources to derive a stage allocation from");
    return job_resources_t (r->nodes (), 1, 5, false, r->gpus_per_task ());
}

void fs_temp_stage_job_t::dict_fields (json::value &o) const
{
    base_dict_fields (o);
    dict::put (o, "src", m_src);
}

fs_temp_stage_job_t fs_temp_stage_job_t::from_dict (const json_t *o)
{
    stage_params_t p = stage_params_t::from_dict (o);
    return fs_temp_stage_job_t (base_from_dict (o),
                                p.persistent_db_path,
                                dict::get_string (o, "src"),
                                p.dest,
                                p.prune_module_path,
                                p.prune_class);
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
