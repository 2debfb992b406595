/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

/*
 * Exceptions raised while building and deploying AMS job descriptions.
 *
 *   config_error    invalid job description input; raised at construction
 *   resource_error  a job is lowered to a submission spec without resources
 *   store_error     the data store could not answer a lookup
 *   io_error        a side file could not be written (carries errno)
 */

#ifndef AMS_ERRORS_HPP
#define AMS_ERRORS_HPP

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace AMS {
namespace workflow {

class config_error : public std::runtime_error {
   public:
    explicit config_error (const std::string &msg) : std::runtime_error (msg)
    {
    }
};

class resource_error : public std::runtime_error {
   public:
    explicit resource_error (const std::string &msg) : std::runtime_error (msg)
    {
    }
};

class store_error : public std::runtime_error {
   public:
    explicit store_error (const std::string &msg) : std::runtime_error (msg)
    {
    }
};

class io_error : public std::runtime_error {
   public:
    int errnum;
    io_error (const std::string &msg, int en)
        : std::runtime_error (msg + ": " + strerror (en)), errnum (en)
    {
    }
};

}  // namespace workflow
}  // namespace AMS

#endif  // AMS_ERRORS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
