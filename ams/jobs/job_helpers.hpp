/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef JOB_HELPERS_HPP
#define JOB_HELPERS_HPP

#include <optional>
#include <string>

#include "ams/jobs/submission_spec.hpp"
#include "ams/libjobspec/jobspec.hpp"

namespace AMS {
namespace workflow {

/*! Jobspec for a nested Flux instance that holds a partition of the
 *  allocation.  The instance runs "sleep <time>" so the partition stays
 *  reserved until the instance is cancelled; it is exclusive so the
 *  parent cannot place other work on the same resources.
 */
Jobspec::Jobspec nested_instance_jobspec (unsigned num_nodes,
                                          unsigned cores_per_node,
                                          unsigned gpus_per_node,
                                          const std::string &cwd,
                                          const env_map_t &environment,
                                          const std::string &time = "inf",
                                          const std::optional<std::string> &stdout_path = {},
                                          const std::optional<std::string> &stderr_path = {});

Jobspec::Jobspec echo_jobspec (const std::string &message);

}  // namespace workflow
}  // namespace AMS

#endif  // JOB_HELPERS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
