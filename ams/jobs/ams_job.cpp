/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <optional>
#include <sstream>
#include <type_traits>

#include "ams/jobs/ams_job.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

generic_job_t::generic_job_t (job_desc_t desc) : m_desc (std::move (desc))
{
}

job_desc_t &generic_job_t::desc ()
{
    return m_desc;
}

const job_desc_t &generic_job_t::desc () const
{
    return m_desc;
}

void generic_job_t::dict_fields (json::value &) const
{
}

generic_job_t generic_job_t::from_dict (const json_t *o)
{
    return generic_job_t (job_desc_t::from_dict (o));
}

namespace {
template<typename... Ts>
std::optional<ams_job_t> from_kind (std::variant<Ts...> *,
                                    const std::string &kind,
                                    const json_t *o)
{
    std::optional<ams_job_t> job;
    ((kind == Ts::kind && (job.emplace (Ts::from_dict (o)), true)) || ...);
    return job;
}
}  // namespace

const char *ams_job_t::kind () const
{
    return std::visit ([] (const auto &j) -> const char * { return j.kind; }, m_job);
}

job_desc_t &ams_job_t::desc ()
{
    return std::visit ([] (auto &j) -> job_desc_t & { return j.desc (); }, m_job);
}

const job_desc_t &ams_job_t::desc () const
{
    return std::visit ([] (const auto &j) -> const job_desc_t & { return j.desc (); }, m_job);
}

std::vector<std::string> ams_job_t::generate_command () const
{
    return desc ().generate_command ();
}

submission_spec_t ams_job_t::to_submission_spec (const std::string &cwd) const
{
    return desc ().to_submission_spec (cwd);
}

void ams_job_t::precede_deploy (const data_store_base_t &store, const rmq_config_t *rmq)
{
    std::visit (
        [&] (auto &j) {
            if constexpr (deployable<std::decay_t<decltype (j)>>)
                j.precede_deploy (store, rmq);
        },
        m_job);
}

json::value ams_job_t::to_dict () const
{
    json::value o = desc ().to_dict ();
    std::visit ([&o] (const auto &j) { j.dict_fields (o); }, m_job);
    dict::put (o, "kind", std::string (kind ()));
    return o;
}

ams_job_t ams_job_t::from_dict (const json_t *o)
{
    if (!o || !json_is_object (o))
        throw config_error ("job dictionary must be a mapping");
    std::string kind = dict::get_string (o, "kind");
    std::optional<ams_job_t> job = from_kind (static_cast<variant_t *> (nullptr), kind, o);
    if (!job)
        throw config_error ("unknown job kind \"" + kind + "\"");
    return std::move (*job);
}

std::string ams_job_t::describe () const
{
    std::ostringstream os;

    os << kind () << " CLI:";
    for (auto &arg : generate_command ())
        os << " " << arg;
    os << " JOB-Descr:" << to_dict ().dump ();
    return os.str ();
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
