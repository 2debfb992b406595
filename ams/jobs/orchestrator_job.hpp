/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef ORCHESTRATOR_JOB_HPP
#define ORCHESTRATOR_JOB_HPP

#include <string>

#include "ams/jobs/job_desc.hpp"

namespace AMS {
namespace workflow {

/*! A job that schedules further jobs itself, currently inside the same
 *  allocation.  It takes one core on one node and shares the node.
 */
class orchestrator_job_t {
   public:
    static constexpr const char *kind = "orchestrator";

    orchestrator_job_t (const std::string &flux_uri,
                        const std::string &rmq_config,
                        env_map_t environment = {});

    job_desc_t &desc ();
    const job_desc_t &desc () const;
    const std::string &flux_uri () const;
    const std::string &rmq_config () const;

    void dict_fields (json::value &o) const;
    static orchestrator_job_t from_dict (const json_t *o);

   private:
    job_desc_t m_desc;
    std::string m_flux_uri;
    std::string m_rmq_config;
};

}  // namespace workflow
}  // namespace AMS

#endif  // ORCHESTRATOR_JOB_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
