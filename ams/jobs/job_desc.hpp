/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef JOB_DESC_HPP
#define JOB_DESC_HPP

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "ams/jobs/cli_command.hpp"
#include "ams/jobs/job_resources.hpp"
#include "ams/jobs/submission_spec.hpp"
#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace workflow {

/*! Description fields shared by every AMS job kind.  A job description
 *  only changes through its precede_deploy () hook, and never after its
 *  submission spec has been generated.
 */
struct job_desc_t {
    std::string name;
    std::string executable;
    env_map_t environment;
    std::optional<job_resources_t> resources;
    std::optional<std::string> stdout_path;
    std::optional<std::string> stderr_path;
    std::vector<std::string> cli_args;
    cli_kwargs_t cli_kwargs;
    bool is_mpi = false;
    bool ams_log = false;

    std::vector<std::string> generate_command () const;

    /*! Build the scheduler request.
     *
     * \param cwd    working directory of the job; the current directory
     *               of this process when empty.
     * \return       submission spec.  Throws resource_error when the
     *               job has no resources.
     */
    submission_spec_t to_submission_spec (const std::string &cwd = "") const;

    json::value to_dict () const;
    static job_desc_t from_dict (const json_t *o);
};

/*! Validate an environment given as a manifest or dictionary node: it must
 *  be null (empty environment) or a string-to-string mapping.
 *  Throws config_error otherwise.
 */
env_map_t env_from_yaml (const YAML::Node &n);
env_map_t env_from_json (const json_t *o);

/*! Copy a NULL-terminated "KEY=VALUE" array (e.g., main's envp).
 */
env_map_t env_from_envp (char **envp);

}  // namespace workflow
}  // namespace AMS

#endif  // JOB_DESC_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
