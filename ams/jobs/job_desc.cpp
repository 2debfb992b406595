/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <cstring>
#include <filesystem>
#include <set>

#include "ams/jobs/job_desc.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

std::vector<std::string> job_desc_t::generate_command () const
{
    return construct_cli_cmd (executable, cli_args, cli_kwargs);
}

submission_spec_t job_desc_t::to_submission_spec (const std::string &cwd) const
{
    submission_spec_t spec;

    if (!resources)
        throw resource_error ("job " + name + " has no resources to submit with");

    spec.command = generate_command ();
    spec.total_tasks = resources->total_tasks ();
    spec.nodes = resources->nodes ();
    spec.cores_per_task = resources->cores_per_task ();
    spec.gpus_per_task = resources->gpus_per_task ();
    spec.exclusive = resources->exclusive ();
    spec.stdout_path = stdout_path.value_or (DEFAULT_STDOUT);
    spec.stderr_path = stderr_path.value_or (DEFAULT_STDERR);
    spec.environment = environment;
    spec.cwd = cwd.empty () ? std::filesystem::current_path ().string () : cwd;
    if (is_mpi)
        spec.mpi = "spectrum";
    spec.gpu_affinity = "per-task";
    return spec;
}

json::value job_desc_t::to_dict () const
{
    json::value o, v;
    o.emplace_object ();

    dict::put (o, "name", name);
    dict::put (o, "executable", executable);
    dict::put (o, "stdout", stdout_path);
    dict::put (o, "stderr", stderr_path);
    json::to_json (v, cli_args);
    o.set ("cli_args", v);

    json::value kw;
    kw.emplace_object ();
    for (auto &[flag, value] : cli_kwargs)
        dict::put (kw, flag.c_str (), value);
    o.set ("cli_kwargs", kw);

    if (resources)
        o.set ("resources", resources->to_dict ());
    else
        o.set ("resources", json::value::take (json_null ()));
    json::to_json (v, environment);
    o.set ("environment", v);
    dict::put (o, "is_mpi", is_mpi);
    dict::put (o, "ams_log", ams_log);
    return o;
}

job_desc_t job_desc_t::from_dict (const json_t *o)
{
    job_desc_t d;
    json_t *v;

    if (!o || !json_is_object (o))
        throw config_error ("job description must be a mapping");

    d.name = dict::get_string (o, "name");
    d.executable = dict::get_string (o, "executable");
    d.stdout_path = dict::get_opt_string (o, "stdout");
    d.stderr_path = dict::get_opt_string (o, "stderr");
    d.cli_args = dict::get_scalar_list (o, "cli_args");

    v = json_object_get (o, "cli_kwargs");
    if (v && !json_is_null (v)) {
        const char *flag;
        json_t *value;
        if (!json_is_object (v))
            throw config_error ("\"cli_kwargs\" must be a mapping");
        json_object_foreach (v, flag, value) {
            d.cli_kwargs.set (flag, dict::scalar_to_cli (value, flag));
        }
    }

    v = json_object_get (o, "resources");
    if (v && !json_is_null (v))
        d.resources = job_resources_t::from_dict (v);
    d.environment = env_from_json (json_object_get (o, "environment"));
    d.is_mpi = dict::get_bool (o, "is_mpi", false);
    d.ams_log = dict::get_bool (o, "ams_log", false);
    return d;
}

env_map_t env_from_yaml (const YAML::Node &n)
{
    env_map_t env;

    if (!n || n.IsNull ())
        return env;
    if (!n.IsMap ())
        throw config_error ("environment must be a mapping of strings to strings");
    for (auto &&kv : n) {
        if (!kv.first.IsScalar () || !kv.second.IsScalar ())
            throw config_error ("environment must be a mapping of strings to strings");
        env[kv.first.as<std::string> ()] = kv.second.as<std::string> ();
    }
    return env;
}

env_map_t env_from_json (const json_t *o)
{
    env_map_t env;
    const char *key;
    json_t *v;

    if (!o || json_is_null (o))
        return env;
    if (!json_is_object (o))
        throw config_error ("environment must be a mapping of strings to strings");
    json_object_foreach (const_cast<json_t *> (o), key, v) {
        if (!json_is_string (v))
            throw config_error (std::string ("environment: value of ") + key
                                + " is not a string");
        env[key] = json_string_value (v);
    }
    return env;
}

env_map_t env_from_envp (char **envp)
{
    env_map_t env;

    for (char **e = envp; e && *e; e++) {
        const char *eq = strchr (*e, '=');
        if (!eq)
            continue;
        env[std::string (*e, eq - *e)] = std::string (eq + 1);
    }
    return env;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
