/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <set>

#include "ams/workflow/workflow_manifest.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

namespace {

void check_keys (const YAML::Node &n,
                 const std::string &section,
                 const std::set<std::string> &allowed)
{
    if (!n.IsMap ())
        throw config_error (section + " must be a mapping");
    for (auto &&kv : n) {
        std::string key = kv.first.as<std::string> ();
        if (allowed.find (key) == allowed.end ())
            throw config_error (section + ": unknown key \"" + key + "\"");
    }
}

YAML::Node require (const YAML::Node &n, const std::string &section, const char *key)
{
    if (!n[key] || n[key].IsNull ())
        throw config_error (section + ": missing key \"" + key + "\"");
    return n[key];
}

std::string get_str (const YAML::Node &n, const std::string &section, const char *key)
{
    YAML::Node v = require (n, section, key);
    if (!v.IsScalar ())
        throw config_error (section + ": \"" + key + "\" must be a string");
    return v.as<std::string> ();
}

std::optional<std::string> get_opt_str (const YAML::Node &n,
                                        const std::string &section,
                                        const char *key)
{
    if (!n[key] || n[key].IsNull ())
        return std::nullopt;
    return get_str (n, section, key);
}

bool get_bool (const YAML::Node &n, const std::string &section, const char *key, bool dflt)
{
    bool b;
    if (!n[key] || n[key].IsNull ())
        return dflt;
    if (!n[key].IsScalar () || !YAML::convert<bool>::decode (n[key], b))
        throw config_error (section + ": \"" + key + "\" must be a boolean");
    return b;
}

/* Plain scalars are typed the way the YAML core schema types them so
 * that "true" and "1.50" print as the consumer tools expect.
 */
std::string scalar_to_cli (const YAML::Node &v, const std::string &what)
{
    static const std::set<std::string> truthy = {"true", "True", "TRUE"};
    static const std::set<std::string> falsy = {"false", "False", "FALSE"};
    long long i;
    double d;

    if (!v.IsScalar ())
        throw config_error (what + ": cannot convert a non-scalar value to a string");
    if (v.Tag () == "!")
        return v.Scalar ();
    if (truthy.count (v.Scalar ()))
        return to_cli_string (true);
    if (falsy.count (v.Scalar ()))
        return to_cli_string (false);
    if (YAML::convert<long long>::decode (v, i))
        return to_cli_string (i);
    if (YAML::convert<double>::decode (v, d))
        return to_cli_string (d);
    return v.Scalar ();
}

/* base overlaid with the section's own "environment" mapping
 */
env_map_t section_env (const YAML::Node &n, const std::string &section, const env_map_t &base)
{
    env_map_t env = base;
    try {
        for (auto &[k, v] : env_from_yaml (n["environment"]))
            env[k] = v;
    } catch (config_error &e) {
        throw config_error (section + ": " + e.what ());
    }
    return env;
}

/* The "cli" section: everything but the executable is optional.
 */
void parse_cli (const YAML::Node &cli,
                const std::string &section,
                job_desc_t &desc,
                bool with_executable)
{
    if (with_executable) {
        check_keys (cli, section,
                    {"executable", "cli_args", "cli_kwargs", "stdout", "stderr", "is_mpi"});
        desc.executable = get_str (cli, section, "executable");
        desc.is_mpi = get_bool (cli, section, "is_mpi", false);
    } else {
        check_keys (cli, section, {"cli_args", "cli_kwargs", "stdout", "stderr"});
    }
    desc.stdout_path = get_opt_str (cli, section, "stdout");
    desc.stderr_path = get_opt_str (cli, section, "stderr");

    if (cli["cli_args"] && !cli["cli_args"].IsNull ()) {
        if (!cli["cli_args"].IsSequence ())
            throw config_error (section + ": \"cli_args\" must be a list");
        for (auto &&a : cli["cli_args"])
            desc.cli_args.push_back (scalar_to_cli (a, section + ".cli_args"));
    }
    if (cli["cli_kwargs"] && !cli["cli_kwargs"].IsNull ()) {
        if (!cli["cli_kwargs"].IsMap ())
            throw config_error (section + ": \"cli_kwargs\" must be a mapping");
        for (auto &&kv : cli["cli_kwargs"]) {
            std::string flag = kv.first.as<std::string> ();
            desc.cli_kwargs.set (flag, scalar_to_cli (kv.second, section + "." + flag));
        }
    }
}

domain_job_t parse_domain_job (const YAML::Node &n,
                               const env_map_t &base_env,
                               std::optional<std::string> stage_dir)
{
    const std::string section = "domain-job";
    job_desc_t desc;
    std::vector<std::string> domain_names;

    check_keys (n, section,
                {"name", "domain_names", "ams_log", "resources", "cli", "environment"});
    desc.name = get_str (n, section, "name");
    desc.ams_log = get_bool (n, section, "ams_log", false);
    desc.resources = job_resources_t::from_yaml (require (n, section, "resources"));
    desc.environment = section_env (n, section, base_env);
    parse_cli (require (n, section, "cli"), section + ".cli", desc, true);

    YAML::Node names = require (n, section, "domain_names");
    if (!names.IsSequence ())
        throw config_error (section + ": \"domain_names\" must be a list");
    for (auto &&d : names) {
        if (!d.IsScalar ())
            throw config_error (section + ": domain names must be strings");
        domain_names.push_back (d.as<std::string> ());
    }
    return domain_job_t (std::move (desc), std::move (domain_names), std::move (stage_dir));
}

template<typename job_t>
job_t parse_ml_job (const YAML::Node &n, const std::string &section, const data_store_base_t &store)
{
    job_desc_t desc;

    check_keys (n, section,
                {"name", "domain_name", "resources", "cli", "ams_log", "environment"});
    desc.environment = section_env (n, section, {});
    desc.name = get_str (n, section, "name");
    desc.ams_log = get_bool (n, section, "ams_log", false);
    desc.resources = job_resources_t::from_yaml (require (n, section, "resources"));
    parse_cli (require (n, section, "cli"), section + ".cli", desc, true);
    return job_t (std::move (desc), get_str (n, section, "domain_name"), store);
}

ams_job_t parse_stage_job (const YAML::Node &n,
                           const domain_job_t &domain,
                           const data_store_base_t &store,
                           const env_map_t &base_env,
                           const rmq_config_t *rmq)
{
    const std::string section = "stage-job";
    const std::string root = store.root_path ().string ();
    job_desc_t base;

    check_keys (n, section,
                {"type", "resources", "cli", "environment", "store", "db_type", "policy",
                 "update_models", "prune_module_path", "prune_class"});
    std::string type = get_str (n, section, "type");

    base.environment = section_env (n, section, base_env);
    if (n["resources"] && !n["resources"].IsNull ())
        base.resources = job_resources_t::from_yaml (n["resources"]);
    else
        base.resources = fs_temp_stage_job_t::resources_from_domain_job (domain);
    if (n["cli"] && !n["cli"].IsNull ())
        parse_cli (n["cli"], section + ".cli", base, false);

    std::optional<std::string> prune_module_path = get_opt_str (n, section, "prune_module_path");
    std::optional<std::string> prune_class = get_opt_str (n, section, "prune_class");

    if (type == "fs") {
        for (const char *key : {"store", "db_type", "policy", "update_models"}) {
            if (n[key])
                throw config_error (section + ": \"" + key + "\" does not apply to an fs stage");
        }
        std::string src = domain.stage_dir ().value_or (store.candidate_path ().string ());
        return fs_temp_stage_job_t (std::move (base),
                                    root,
                                    src,
                                    root,
                                    std::move (prune_module_path),
                                    std::move (prune_class));
    }
    if (type == "rmq") {
        stage_params_t params;
        if (!rmq)
            throw config_error (section + ": an rmq stage needs a broker configuration");
        params.dest = root;
        params.persistent_db_path = root;
        params.store = get_bool (n, section, "store", true);
        if (auto t = get_opt_str (n, section, "db_type"))
            params.db_type = *t;
        if (auto t = get_opt_str (n, section, "policy"))
            params.policy = *t;
        params.prune_module_path = std::move (prune_module_path);
        params.prune_class = std::move (prune_class);
        return network_stage_job_t (std::move (base),
                                    std::move (params),
                                    rmq->path (),
                                    get_bool (n, section, "update_models", false));
    }
    throw config_error (section + ": unknown stage type \"" + type + "\"");
}

}  // namespace

workflow_manifest_t::workflow_manifest_t (const YAML::Node &doc,
                                          const data_store_base_t &store,
                                          const env_map_t &base_env,
                                          const rmq_config_t *rmq,
                                          std::optional<std::string> stage_dir)
{
    check_keys (doc, "manifest", {"domain-job", "stage-job", "ml-jobs", "orchestrator"});

    m_jobs.reserve (5);
    try {
        m_jobs.push_back (parse_domain_job (require (doc, "manifest", "domain-job"),
                                            base_env,
                                            std::move (stage_dir)));
        const domain_job_t &domain = *m_jobs.front ().get_if<domain_job_t> ();

        if (doc["stage-job"] && !doc["stage-job"].IsNull ())
            m_jobs.push_back (parse_stage_job (doc["stage-job"], domain, store, base_env, rmq));

        const YAML::Node &ml = doc["ml-jobs"];
        if (ml && !ml.IsNull ()) {
            check_keys (ml, "ml-jobs", {"train", "sub-select"});
            if (ml["train"])
                m_jobs.push_back (parse_ml_job<ml_train_job_t> (ml["train"], "ml-jobs.train", store));
            if (ml["sub-select"])
                m_jobs.push_back (parse_ml_job<ml_subselect_job_t> (ml["sub-select"],
                                                                    "ml-jobs.sub-select",
                                                                    store));
        }

        const YAML::Node &orch = doc["orchestrator"];
        if (orch && !orch.IsNull ()) {
            check_keys (orch, "orchestrator", {"flux_uri", "rmq_config"});
            m_jobs.push_back (orchestrator_job_t (get_str (orch, "orchestrator", "flux_uri"),
                                                  get_str (orch, "orchestrator", "rmq_config"),
                                                  base_env));
        }
    } catch (YAML::Exception &e) {
        throw config_error (std::string ("manifest: ") + e.what ());
    }
}

workflow_manifest_t workflow_manifest_t::load (const std::string &path,
                                               const data_store_base_t &store,
                                               const env_map_t &base_env,
                                               const rmq_config_t *rmq,
                                               std::optional<std::string> stage_dir)
{
    YAML::Node doc;
    try {
        doc = YAML::LoadFile (path);
    } catch (YAML::Exception &e) {
        throw config_error (path + ": " + e.what ());
    }
    return workflow_manifest_t (doc, store, base_env, rmq, std::move (stage_dir));
}

std::vector<ams_job_t> &workflow_manifest_t::jobs ()
{
    return m_jobs;
}

const std::vector<ams_job_t> &workflow_manifest_t::jobs () const
{
    return m_jobs;
}

domain_job_t &workflow_manifest_t::domain_job ()
{
    return *m_jobs.front ().get_if<domain_job_t> ();
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
