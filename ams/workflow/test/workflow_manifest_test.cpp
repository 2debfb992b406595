/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <fstream>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <yaml-cpp/yaml.h>

#include "ams/workflow/workflow_manifest.hpp"
#include "ams/common/errors.hpp"
#include "ams/store/test/temp_store.hpp"

using namespace AMS::workflow;
using namespace AMS::workflow::test;

using cmd_t = std::vector<std::string>;

static const char *domain_section = R"(
domain-job:
  name: physics
  domain_names: [hydro, eos]
  ams_log: true
  resources: {nodes: 2, tasks_per_node: 4, cores_per_task: 2, gpus_per_task: 1}
  cli:
    executable: miniapp
    is_mpi: true
    cli_args: [input.yaml, 3, '7']
    cli_kwargs: {--scale: 1.50, --verbose: true, --label: 'true'}
)";

static std::string with (const std::string &extra)
{
    return std::string (domain_section) + extra;
}

static rmq_config_t write_rmq (const temp_dir_t &tmp)
{
    std::string path = (tmp.path () / "creds.json").string ();
    std::ofstream f (path);
    f << R"({"service-port": 5671, "service-host": "h", "rabbitmq-erlang-cookie": "c",
             "rabbitmq-name": "n", "rabbitmq-password": "p", "rabbitmq-user": "u",
             "rabbitmq-vhost": "v", "rabbitmq-cert": "/ca", "rabbitmq-inbound-queue": "i",
             "rabbitmq-outbound-queue": "o", "rabbitmq-exchange": "e",
             "rabbitmq-routing-key": "r"})";
    f.close ();
    return rmq_config_t::from_file (path);
}

TEST_CASE ("domain job from a manifest", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    env_map_t env{{"HOME", "/home/ams"}};

    workflow_manifest_t m (YAML::Load (domain_section), store, env);
    REQUIRE (m.jobs ().size () == 1);

    domain_job_t &d = m.domain_job ();
    CHECK (d.domain_names () == cmd_t{"hydro", "eos"});
    CHECK (d.desc ().ams_log);
    CHECK (d.desc ().is_mpi);
    CHECK (d.desc ().environment == env);
    CHECK (d.desc ().resources == job_resources_t (2, 4, 2, true, 1));
    CHECK (d.desc ().generate_command ()
           == cmd_t{"miniapp", "--scale", "1.5", "--verbose", "True", "--label", "true",
                    "input.yaml", "3", "7"});
}

TEST_CASE ("full workflow with a filesystem stage", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    std::string root = tmp.path ().string ();

    YAML::Node doc = YAML::Load (with (R"(
stage-job:
  type: fs
ml-jobs:
  train:
    name: trainer
    domain_name: hydro
    resources: {nodes: 1, tasks_per_node: 1}
    cli:
      executable: python
      cli_args: [train.py]
      cli_kwargs: {--store: '{AMS_STORE_PATH}'}
  sub-select:
    name: selector
    domain_name: eos
    resources: {nodes: 1, tasks_per_node: 1}
    cli: {executable: python, cli_args: ['{AMS_STORE_PATH}/select.py']}
orchestrator:
  flux_uri: local:///run/flux
  rmq_config: /creds.json
)"));
    workflow_manifest_t m (doc, store, {{"A", "1"}}, nullptr, "/stage");
    std::vector<std::string> kinds;
    for (auto &j : m.jobs ())
        kinds.push_back (j.kind ());
    CHECK (kinds == cmd_t{"domain", "fs_temp_stage", "train", "subselect", "orchestrator"});

    ams_job_t &stage = m.jobs ()[1];
    CHECK (stage.desc ().resources == job_resources_t (2, 1, 5, false, 1));
    CHECK (*stage.desc ().cli_kwargs.find ("--src") == "/stage");
    CHECK (*stage.desc ().cli_kwargs.find ("--dest") == root);
    CHECK (stage.desc ().environment.at ("A") == "1");

    CHECK (m.jobs ()[2].generate_command () == cmd_t{"python", "--store", root, "train.py"});
    CHECK (m.jobs ()[3].desc ().cli_args == cmd_t{root + "/select.py"});
    CHECK (m.jobs ()[3].desc ().environment.empty ());
    CHECK (m.jobs ()[4].desc ().environment.at ("A") == "1");
}

TEST_CASE ("rmq stage uses the broker credentials", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    rmq_config_t rmq = write_rmq (tmp);

    YAML::Node doc = YAML::Load (with (R"(
stage-job:
  type: rmq
  resources: {nodes: 1, tasks_per_node: 1}
  store: false
  policy: thread
  update_models: true
)"));
    CHECK_THROWS_AS (workflow_manifest_t (doc, store, {}), config_error);

    workflow_manifest_t m (doc, store, {}, &rmq);
    ams_job_t &stage = m.jobs ()[1];
    REQUIRE (stage.get_if<network_stage_job_t> ());
    CHECK (*stage.desc ().cli_kwargs.find ("--creds") == rmq.path ());
    CHECK (*stage.desc ().cli_kwargs.find ("--policy") == "thread");
    CHECK (stage.generate_command ().back () == "--no-store");
    CHECK (stage.desc ().resources == job_resources_t (1, 1, 1, true, 0));
}

TEST_CASE ("section environments overlay the base environment", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    env_map_t env{{"HOME", "/home/ams"}, {"OMP_NUM_THREADS", "1"}};

    YAML::Node doc = YAML::Load (R"(
domain-job:
  name: physics
  domain_names: [hydro]
  resources: {nodes: 1, tasks_per_node: 1}
  cli: {executable: miniapp}
  environment: {OMP_NUM_THREADS: 8, AMS_TRACE: 'on'}
stage-job:
  type: fs
  environment: {STAGE_ONLY: yes}
ml-jobs:
  train:
    name: trainer
    domain_name: hydro
    resources: {nodes: 1, tasks_per_node: 1}
    cli: {executable: python}
    environment: {CUDA_VISIBLE_DEVICES: 0}
)");
    workflow_manifest_t m (doc, store, env);
    REQUIRE (m.jobs ().size () == 3);

    const env_map_t &domain = m.jobs ()[0].desc ().environment;
    CHECK (domain.at ("HOME") == "/home/ams");
    CHECK (domain.at ("OMP_NUM_THREADS") == "8");
    CHECK (domain.at ("AMS_TRACE") == "on");
    CHECK (domain.count ("STAGE_ONLY") == 0);

    const env_map_t &stage = m.jobs ()[1].desc ().environment;
    CHECK (stage.at ("STAGE_ONLY") == "yes");
    CHECK (stage.at ("OMP_NUM_THREADS") == "1");

    CHECK (m.jobs ()[2].desc ().environment == env_map_t{{"CUDA_VISIBLE_DEVICES", "0"}});

    CHECK_THROWS_AS (workflow_manifest_t (YAML::Load (R"(
domain-job:
  name: physics
  domain_names: [hydro]
  resources: {nodes: 1, tasks_per_node: 1}
  cli: {executable: miniapp}
  environment: [A, B]
)"),
                                          store,
                                          env),
                     config_error);
}

TEST_CASE ("manifest errors raise config_error", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());

    auto load = [&] (const std::string &text) {
        return workflow_manifest_t (YAML::Load (text), store, {});
    };

    CHECK_THROWS_AS (load ("orchestrator: {flux_uri: a, rmq_config: b}\n"), config_error);
    CHECK_THROWS_AS (load (with ("extra-job: {}\n")), config_error);
    CHECK_THROWS_AS (load (with ("stage-job: {type: fs, store: false}\n")), config_error);
    CHECK_THROWS_AS (load (with ("stage-job: {type: tape}\n")), config_error);
    CHECK_THROWS_AS (load (with ("orchestrator: {flux_uri: a}\n")), config_error);
    CHECK_THROWS_AS (load (with ("ml-jobs: {evaluate: {}}\n")), config_error);
    CHECK_THROWS_AS (load (R"(
domain-job:
  name: physics
  domain_names: [hydro]
  resources: {nodes: 1, tasks_per_node: 1}
  cli: {executable: miniapp, cli_args: [[nested]]}
)"),
                     config_error);
    CHECK_THROWS_AS (load (R"(
domain-job:
  name: physics
  domain_names: [hydro]
  resources: {nodes: 0, tasks_per_node: 1}
  cli: {executable: miniapp}
)"),
                     config_error);
    CHECK_THROWS_AS (load (R"(
domain-job:
  name: physics
  domain_names: [hydro]
  resources: {nodes: 1, tasks_per_node: 1}
  cli: {executable: miniapp, cli_args: ['{AMS_STORE_PATH}']}
ml-jobs:
  train:
    name: t
    domain_name: hydro
    resources: {nodes: 1, tasks_per_node: 1}
    cli: {executable: python, cli_args: ['{NOPE}']}
)"),
                     config_error);
}

TEST_CASE ("manifest files load from disk", "[workflow_manifest]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    std::string path = (tmp.path () / "manifest.yaml").string ();
    {
        std::ofstream f (path);
        f << domain_section;
    }

    workflow_manifest_t m = workflow_manifest_t::load (path, store, {});
    CHECK (m.jobs ().size () == 1);
    CHECK_THROWS_AS (workflow_manifest_t::load ((tmp.path () / "none.yaml").string (), store, {}),
                     config_error);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
