/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/rmq/rmq_config.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

namespace {
int64_t get_port (const json_t *o, const char *key)
{
    json_t *v = json_object_get (o, key);
    if (!v)
        throw config_error (std::string ("missing key \"") + key + "\"");
    if (!json_is_integer (v) || json_integer_value (v) <= 0 || json_integer_value (v) > 65535)
        throw config_error (std::string ("\"") + key + "\" must be an integer port number");
    return json_integer_value (v);
}
}  // namespace

rmq_config_t rmq_config_t::from_json (const json_t *o)
{
    using dict::get_string;
    rmq_config_t c;

    if (!o || !json_is_object (o))
        throw config_error ("rmq config: top level is not an object");
    try {
        c.service_port = get_port (o, "service-port");
        c.service_host = get_string (o, "service-host");
        c.erlang_cookie = get_string (o, "rabbitmq-erlang-cookie");
        c.name = get_string (o, "rabbitmq-name");
        c.password = get_string (o, "rabbitmq-password");
        c.user = get_string (o, "rabbitmq-user");
        c.vhost = get_string (o, "rabbitmq-vhost");
        c.cert = get_string (o, "rabbitmq-cert");
        c.inbound_queue = get_string (o, "rabbitmq-inbound-queue");
        c.outbound_queue = get_string (o, "rabbitmq-outbound-queue");
        c.exchange = get_string (o, "rabbitmq-exchange");
        c.routing_key = get_string (o, "rabbitmq-routing-key");
    } catch (config_error &e) {
        throw config_error (std::string ("rmq config: ") + e.what ());
    }
    return c;
}

rmq_config_t rmq_config_t::from_file (const std::string &path)
{
    json::value o;
    try {
        o = json::load_file (path);
    } catch (std::invalid_argument &e) {
        throw config_error (std::string ("rmq config: ") + e.what ());
    }
    rmq_config_t c = from_json (o.get ());
    c.m_path = path;
    return c;
}

json::value rmq_config_t::to_connection_descriptor (bool for_library) const
{
    using dict::put;
    json::value o, port;
    o.emplace_object ();
    json::to_json (port, service_port);
    o.set ("service-port", port);
    put (o, "service-host", service_host);
    put (o, "rabbitmq-name", name);
    put (o, "rabbitmq-password", password);
    put (o, "rabbitmq-user", user);
    put (o, "rabbitmq-vhost", vhost);
    put (o, "rabbitmq-cert", cert);
    put (o, "rabbitmq-outbound-queue", outbound_queue);
    put (o, "rabbitmq-exchange", exchange);
    put (o, "rabbitmq-routing-key", routing_key);
    if (!for_library) {
        put (o, "rabbitmq-erlang-cookie", erlang_cookie);
        put (o, "rabbitmq-inbound-queue", inbound_queue);
    }
    return o;
}

const std::string &rmq_config_t::path () const
{
    return m_path;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
