/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/jobs/submission_spec.hpp"

namespace AMS {
namespace workflow {

Jobspec::Jobspec submission_spec_t::to_jobspec () const
{
    Jobspec::Jobspec js = Jobspec::Jobspec::from_command (command,
                                                          total_tasks,
                                                          cores_per_task,
                                                          gpus_per_task,
                                                          nodes,
                                                          exclusive);
    if (mpi)
        js.set_shell_option ("mpi", *mpi);
    if (gpu_affinity)
        js.set_shell_option ("gpu-affinity", *gpu_affinity);
    js.set_stdout (stdout_path);
    js.set_stderr (stderr_path);
    js.attributes.system.environment = environment;
    js.attributes.system.cwd = cwd;
    return js;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
