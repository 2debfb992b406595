/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/jobs/orchestrator_job.hpp"
#include "ams/jobs/dict_util.hpp"

namespace AMS {
namespace workflow {

orchestrator_job_t::orchestrator_job_t (const std::string &flux_uri,
                                        const std::string &rmq_config,
                                        env_map_t environment)
    : m_flux_uri (flux_uri), m_rmq_config (rmq_config)
{
    m_desc.name = "AMSOrchestrator";
    m_desc.executable = "AMSOrchestrator";
    m_desc.stdout_path = "AMSOrchestrator-log.out";
    m_desc.stderr_path = "AMSOrchestrator-log.err";
    m_desc.environment = std::move (environment);
    m_desc.cli_kwargs = {{"--ml-uri", m_flux_uri}, {"--ams-rmq-config", m_rmq_config}};
    m_desc.resources = job_resources_t (1, 1, 1, false, 0);
}

job_desc_t &orchestrator_job_t::desc ()
{
    return m_desc;
}

const job_desc_t &orchestrator_job_t::desc () const
{
    return m_desc;
}

const std::string &orchestrator_job_t::flux_uri () const
{
    return m_flux_uri;
}

const std::string &orchestrator_job_t::rmq_config () const
{
    return m_rmq_config;
}

void orchestrator_job_t::dict_fields (json::value &o) const
{
    dict::put (o, "flux_uri", m_flux_uri);
    dict::put (o, "rmq_config", m_rmq_config);
}

orchestrator_job_t orchestrator_job_t::from_dict (const json_t *o)
{
    return orchestrator_job_t (dict::get_string (o, "flux_uri"),
                               dict::get_string (o, "rmq_config"),
                               env_from_json (json_object_get (o, "environment")));
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
