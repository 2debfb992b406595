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
#include <catch2/catch_test_macros.hpp>

#include "ams/rmq/rmq_config.hpp"
#include "ams/common/errors.hpp"
#include "ams/store/test/temp_store.hpp"

using namespace AMS::workflow;
using namespace AMS::workflow::test;

static const char *creds = R"({
    "service-port": 31029,
    "service-host": "rmq.example",
    "rabbitmq-erlang-cookie": "cookie",
    "rabbitmq-name": "ams",
    "rabbitmq-password": "pw",
    "rabbitmq-user": "user",
    "rabbitmq-vhost": "vhost",
    "rabbitmq-cert": "/certs/ca.crt",
    "rabbitmq-inbound-queue": "in",
    "rabbitmq-outbound-queue": "out",
    "rabbitmq-exchange": "ex",
    "rabbitmq-routing-key": "rk"
})";

TEST_CASE ("credentials load from a file", "[rmq_config]")
{
    temp_dir_t tmp;
    std::string path = (tmp.path () / "creds.json").string ();
    {
        std::ofstream f (path);
        f << creds;
    }

    rmq_config_t c = rmq_config_t::from_file (path);
    CHECK (c.path () == path);
    CHECK (c.service_port == 31029);
    CHECK (c.service_host == "rmq.example");
    CHECK (c.erlang_cookie == "cookie");
    CHECK (c.inbound_queue == "in");
    CHECK (c.routing_key == "rk");

    CHECK_THROWS_AS (rmq_config_t::from_file ((tmp.path () / "missing.json").string ()),
                     config_error);
}

TEST_CASE ("library descriptor omits broker-side keys", "[rmq_config]")
{
    json::value o = json::loads (creds);
    rmq_config_t c = rmq_config_t::from_json (o.get ());

    json::value lib = c.to_connection_descriptor (true);
    CHECK (json_object_size (lib.get ()) == 10);
    CHECK (json_object_get (lib.get (), "rabbitmq-erlang-cookie") == nullptr);
    CHECK (json_object_get (lib.get (), "rabbitmq-inbound-queue") == nullptr);
    CHECK (json_integer_value (json_object_get (lib.get (), "service-port")) == 31029);

    json::value full = c.to_connection_descriptor (false);
    CHECK (json_object_size (full.get ()) == 12);
    CHECK (json_equal (full.get (), o.get ()));
}

TEST_CASE ("missing or mistyped keys are rejected", "[rmq_config]")
{
    json::value o = json::loads (creds);
    json_object_del (o.get (), "rabbitmq-vhost");
    CHECK_THROWS_AS (rmq_config_t::from_json (o.get ()), config_error);
    CHECK_THROWS_WITH (rmq_config_t::from_json (o.get ()),
                       "rmq config: missing key \"rabbitmq-vhost\"");

    o = json::loads (creds);
    json::value num;
    json::to_json (num, 7);
    o.set ("rabbitmq-user", num);
    CHECK_THROWS_WITH (rmq_config_t::from_json (o.get ()),
                       "rmq config: \"rabbitmq-user\" must be a string");

    o = json::loads (creds);
    json::value bad;
    json::to_json (bad, "31029");
    o.set ("service-port", bad);
    CHECK_THROWS_AS (rmq_config_t::from_json (o.get ()), config_error);

    json::to_json (bad, 70000);
    o.set ("service-port", bad);
    CHECK_THROWS_AS (rmq_config_t::from_json (o.get ()), config_error);

    o = json::loads ("[1, 2]");
    CHECK_THROWS_AS (rmq_config_t::from_json (o.get ()), config_error);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
