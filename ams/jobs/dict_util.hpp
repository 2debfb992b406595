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
 * Typed accessors for job dictionaries.  Every accessor throws config_error
 * naming the key when the value has the wrong shape.
 */

#ifndef DICT_UTIL_HPP
#define DICT_UTIL_HPP

#include <optional>
#include <string>
#include <vector>

#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace workflow {
namespace dict {

std::string get_string (const json_t *o, const char *key);
std::optional<std::string> get_opt_string (const json_t *o, const char *key);
bool get_bool (const json_t *o, const char *key, bool dflt);

/*! Stringify a scalar (string, integer, real, boolean) the way the
 *  command builder does.
 */
std::string scalar_to_cli (const json_t *v, const std::string &what);
std::vector<std::string> get_scalar_list (const json_t *o, const char *key);

void put (json::value &o, const char *key, const std::string &s);
void put (json::value &o, const char *key, const std::optional<std::string> &s);
void put (json::value &o, const char *key, bool b);

}  // namespace dict
}  // namespace workflow
}  // namespace AMS

#endif  // DICT_UTIL_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
