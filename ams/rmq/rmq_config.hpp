/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef RMQ_CONFIG_HPP
#define RMQ_CONFIG_HPP

#include <cstdint>
#include <string>
#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace workflow {

/*! RabbitMQ connection settings shared by the application (AMSlib),
 *  the staging consumers and the orchestrator.
 */
class rmq_config_t {
   public:
    rmq_config_t () = default;

    /*! Load the credentials file written by the broker deployment.
     *  Throws config_error on a missing file, missing or mistyped key.
     */
    static rmq_config_t from_file (const std::string &path);
    static rmq_config_t from_json (const json_t *o);

    /*! Serializable connection descriptor.
     *
     * \param for_library  true to produce the subset of keys the AMS
     *                     library consumes; false for every key.
     */
    json::value to_connection_descriptor (bool for_library) const;

    const std::string &path () const;

    int64_t service_port = 0;
    std::string service_host;
    std::string erlang_cookie;
    std::string name;
    std::string password;
    std::string user;
    std::string vhost;
    std::string cert;
    std::string inbound_queue;
    std::string outbound_queue;
    std::string exchange;
    std::string routing_key;

   private:
    std::string m_path;
};

}  // namespace workflow
}  // namespace AMS

#endif  // RMQ_CONFIG_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
