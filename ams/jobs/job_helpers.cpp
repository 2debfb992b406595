/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/jobs/job_helpers.hpp"

namespace AMS {
namespace workflow {

Jobspec::Jobspec nested_instance_jobspec (unsigned num_nodes,
                                          unsigned cores_per_node,
                                          unsigned gpus_per_node,
                                          const std::string &cwd,
                                          const env_map_t &environment,
                                          const std::string &time,
                                          const std::optional<std::string> &stdout_path,
                                          const std::optional<std::string> &stderr_path)
{
    Jobspec::Jobspec js = Jobspec::Jobspec::from_nest_command ({"sleep", time},
                                                               num_nodes,
                                                               cores_per_node,
                                                               gpus_per_node,
                                                               num_nodes,
                                                               true);
    if (stdout_path)
        js.set_stdout (*stdout_path);
    if (stderr_path)
        js.set_stderr (*stderr_path);
    js.attributes.system.cwd = cwd;
    js.attributes.system.environment = environment;
    return js;
}

Jobspec::Jobspec echo_jobspec (const std::string &message)
{
    return Jobspec::Jobspec::from_command ({"echo", message}, 1, 1, 0, 1, true);
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
