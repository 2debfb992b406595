/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/jobs/dict_util.hpp"
#include "ams/jobs/cli_command.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {
namespace dict {

std::string get_string (const json_t *o, const char *key)
{
    json_t *v = json_object_get (o, key);
    if (!v)
        throw config_error (std::string ("missing key \"") + key + "\"");
    if (!json_is_string (v))
        throw config_error (std::string ("\"") + key + "\" must be a string");
    return json_string_value (v);
}

std::optional<std::string> get_opt_string (const json_t *o, const char *key)
{
    json_t *v = json_object_get (o, key);
    if (!v || json_is_null (v))
        return std::nullopt;
    if (!json_is_string (v))
        throw config_error (std::string ("\"") + key + "\" must be a string or null");
    return std::string (json_string_value (v));
}

bool get_bool (const json_t *o, const char *key, bool dflt)
{
    json_t *v = json_object_get (o, key);
    if (!v || json_is_null (v))
        return dflt;
    if (!json_is_boolean (v))
        throw config_error (std::string ("\"") + key + "\" must be a boolean");
    return json_is_true (v);
}

std::string scalar_to_cli (const json_t *v, const std::string &what)
{
    switch (json_typeof (v)) {
        case JSON_STRING:
            return json_string_value (v);
        case JSON_INTEGER:
            return to_cli_string (static_cast<long long> (json_integer_value (v)));
        case JSON_REAL:
            return to_cli_string (json_real_value (v));
        case JSON_TRUE:
            return to_cli_string (true);
        case JSON_FALSE:
            return to_cli_string (false);
        default:
            throw config_error (what + ": cannot convert a non-scalar value to a string");
    }
}

std::vector<std::string> get_scalar_list (const json_t *o, const char *key)
{
    std::vector<std::string> out;
    json_t *v = json_object_get (o, key);
    size_t index;
    json_t *e;

    if (!v || json_is_null (v))
        return out;
    if (!json_is_array (v))
        throw config_error (std::string ("\"") + key + "\" must be a list");
    json_array_foreach (v, index, e) {
        out.push_back (scalar_to_cli (e, key));
    }
    return out;
}

void put (json::value &o, const char *key, const std::string &s)
{
    json::value v;
    json::to_json (v, s);
    o.set (key, v);
}

void put (json::value &o, const char *key, const std::optional<std::string> &s)
{
    if (s)
        put (o, key, *s);
    else
        o.set (key, json::value::take (json_null ()));
}

void put (json::value &o, const char *key, bool b)
{
    json::value v;
    json::to_json (v, b);
    o.set (key, v);
}

}  // namespace dict
}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
