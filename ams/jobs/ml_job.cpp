/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "ams/jobs/ml_job.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

formatting_t generate_formatting (const data_store_base_t &store)
{
    return formatting_t{{AMS_STORE_PATH, store.root_path ().string ()}};
}

std::string format_template (const std::string &tmpl, const formatting_t &ctx)
{
    std::string out;
    size_t i = 0;

    while (i < tmpl.size ()) {
        char c = tmpl[i];
        if (c == '{' && i + 1 < tmpl.size () && tmpl[i + 1] == '{') {
            out += '{';
            i += 2;
        } else if (c == '}' && i + 1 < tmpl.size () && tmpl[i + 1] == '}') {
            out += '}';
            i += 2;
        } else if (c == '{') {
            size_t end = tmpl.find ('}', i + 1);
            if (end == std::string::npos)
                throw config_error ("unbalanced '{' in \"" + tmpl + "\"");
            std::string key = tmpl.substr (i + 1, end - i - 1);
            auto it = ctx.find (key);
            if (it == ctx.end ())
                throw config_error ("unknown template key \"" + key + "\" in \"" + tmpl + "\"");
            out += it->second;
            i = end + 1;
        } else if (c == '}') {
            throw config_error ("unbalanced '}' in \"" + tmpl + "\"");
        } else {
            out += c;
            i++;
        }
    }
    return out;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
