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
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>

#include "ams/jobs/ams_job.hpp"
#include "ams/common/errors.hpp"
#include "ams/store/test/temp_store.hpp"

using namespace AMS::workflow;
using namespace AMS::workflow::test;

using cmd_t = std::vector<std::string>;

static job_desc_t make_desc (const std::string &name)
{
    job_desc_t d;
    d.name = name;
    d.executable = name + "-exe";
    d.resources = job_resources_t (1, 2, 1, true, 0);
    d.cli_args = {"a"};
    return d;
}

static std::vector<ams_job_t> every_kind (const data_store_base_t &store)
{
    stage_params_t p;
    p.dest = "/dest";
    p.persistent_db_path = "/db";

    std::vector<ams_job_t> jobs;
    jobs.emplace_back (generic_job_t (make_desc ("plain")));
    jobs.emplace_back (domain_job_t (make_desc ("physics"), {"hydro", "eos"}, "/stage"));
    jobs.emplace_back (ml_train_job_t (make_desc ("train"), "hydro", store));
    jobs.emplace_back (ml_subselect_job_t (make_desc ("select"), "eos", store));
    jobs.emplace_back (fs_stage_job_t (make_desc ("stage"), p, "/src"));
    jobs.emplace_back (network_stage_job_t (make_desc ("stage"), p, "/creds.json", true));
    jobs.emplace_back (fs_temp_stage_job_t (make_desc ("stage"), "/store", "/src", "/store"));
    jobs.emplace_back (orchestrator_job_t ("local:///run/flux", "/creds.json", {{"A", "1"}}));
    return jobs;
}

TEST_CASE ("every kind reports its name", "[ams_job]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    std::vector<ams_job_t> jobs = every_kind (store);
    std::vector<std::string> kinds;

    for (auto &j : jobs)
        kinds.push_back (j.kind ());
    CHECK (kinds
           == cmd_t{"ams_job", "domain", "train", "subselect", "fs_stage", "network_stage",
                    "fs_temp_stage", "orchestrator"});
}

TEST_CASE ("every kind survives a dictionary round trip", "[ams_job]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());

    for (auto &job : every_kind (store)) {
        json::value o = job.to_dict ();
        ams_job_t back = ams_job_t::from_dict (o.get ());
        INFO (job.kind ());
        CHECK (std::strcmp (back.kind (), job.kind ()) == 0);
        CHECK (back.generate_command () == job.generate_command ());
        CHECK (back.desc ().environment == job.desc ().environment);
        CHECK (back.desc ().resources == job.desc ().resources);
        CHECK (back.to_dict ().dump () == o.dump ());
    }
}

TEST_CASE ("unknown or missing kinds are rejected", "[ams_job]")
{
    json::value o = make_desc ("plain").to_dict ();
    CHECK_THROWS_AS (ams_job_t::from_dict (o.get ()), config_error);

    json::value k;
    json::to_json (k, "no_such_kind");
    o.set ("kind", k);
    CHECK_THROWS_AS (ams_job_t::from_dict (o.get ()), config_error);
    CHECK_THROWS_AS (ams_job_t::from_dict (nullptr), config_error);
}

TEST_CASE ("describe prints the kind, command and dictionary", "[ams_job]")
{
    ams_job_t job (generic_job_t (make_desc ("plain")));
    std::string s = job.describe ();

    CHECK (s.rfind ("ams_job CLI: plain-exe a JOB-Descr:{", 0) == 0);
    CHECK (s.find ("\"kind\":\"ams_job\"") != std::string::npos);
}

TEST_CASE ("only domain jobs act before deployment", "[ams_job]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());

    for (auto &job : every_kind (store)) {
        env_map_t before = job.desc ().environment;
        job.precede_deploy (store);
        INFO (job.kind ());
        if (job.get_if<domain_job_t> ()) {
            CHECK (job.desc ().environment.count ("AMS_OBJECTS") == 1);
            CHECK (job.get_if<domain_job_t> ()->ams_objects_path ()
                   == job.desc ().environment.at ("AMS_OBJECTS"));
        } else {
            CHECK (job.desc ().environment == before);
        }
    }
    CHECK (std::filesystem::exists (tmp.path () / "tmp"));
}

TEST_CASE ("orchestrator job shape", "[ams_job]")
{
    ams_job_t job (orchestrator_job_t ("local:///run/flux", "/creds.json"));

    CHECK (job.generate_command ()
           == cmd_t{"AMSOrchestrator", "--ml-uri", "local:///run/flux", "--ams-rmq-config",
                    "/creds.json"});
    CHECK (job.desc ().stdout_path == "AMSOrchestrator-log.out");
    CHECK (job.desc ().stderr_path == "AMSOrchestrator-log.err");

    submission_spec_t s = job.to_submission_spec ("/work");
    CHECK (s.nodes == 1);
    CHECK (s.total_tasks == 1);
    CHECK (s.cores_per_task == 1);
    CHECK (s.gpus_per_task == 0);
    CHECK_FALSE (s.exclusive);
    CHECK (s.cwd == "/work");
    REQUIRE (job.get_if<orchestrator_job_t> ());
    CHECK (job.get_if<orchestrator_job_t> ()->flux_uri () == "local:///run/flux");
    CHECK_FALSE (job.get_if<domain_job_t> ());
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
