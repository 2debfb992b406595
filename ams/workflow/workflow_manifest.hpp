/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef WORKFLOW_MANIFEST_HPP
#define WORKFLOW_MANIFEST_HPP

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "ams/jobs/ams_job.hpp"

namespace AMS {
namespace workflow {

/*! The jobs of one AMS workflow, built from a manifest document:
 *
 *    domain-job:   the application (required)
 *    stage-job:    type fs or rmq
 *    ml-jobs:      train and sub-select
 *    orchestrator: flux_uri and rmq_config
 *
 *  The domain, stage and ML sections take an optional "environment"
 *  mapping laid over the base environment (over an empty one for the ML
 *  jobs).  Jobs come out in that order.  Any unknown key, missing key or badly
 *  typed value raises config_error.
 */
class workflow_manifest_t {
   public:
    /*!
     * \param doc        parsed manifest
     * \param store      store the ML templates and stage paths resolve
     *                   against
     * \param base_env   environment given to the domain, stage and
     *                   orchestrator jobs
     * \param rmq        broker configuration; required by an rmq stage
     * \param stage_dir  directory the application writes candidates to;
     *                   the store candidate path when unset
     */
    workflow_manifest_t (const YAML::Node &doc,
                         const data_store_base_t &store,
                         const env_map_t &base_env,
                         const rmq_config_t *rmq = nullptr,
                         std::optional<std::string> stage_dir = std::nullopt);

    static workflow_manifest_t load (const std::string &path,
                                     const data_store_base_t &store,
                                     const env_map_t &base_env,
                                     const rmq_config_t *rmq = nullptr,
                                     std::optional<std::string> stage_dir = std::nullopt);

    std::vector<ams_job_t> &jobs ();
    const std::vector<ams_job_t> &jobs () const;

    domain_job_t &domain_job ();

   private:
    std::vector<ams_job_t> m_jobs;
};

}  // namespace workflow
}  // namespace AMS

#endif  // WORKFLOW_MANIFEST_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
