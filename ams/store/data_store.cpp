/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

extern "C" {
#include <uuid/uuid.h>
}

#include <system_error>

#include "ams/store/data_store.hpp"
#include "ams/common/errors.hpp"

namespace fs = std::filesystem;

namespace AMS {
namespace workflow {

data_store_base_t::~data_store_base_t ()
{
}

fs::path data_store_base_t::mkdir (const std::string &subpath) const
{
    std::error_code ec;
    fs::path dir = root_path () / subpath;
    fs::create_directories (dir, ec);
    if (ec)
        throw io_error ("cannot create " + dir.string (), ec.value ());
    return dir;
}

std::string data_store_base_t::unique_filename ()
{
    uuid_t uuid;
    char s[37];
    uuid_generate (uuid);
    uuid_unparse_lower (uuid, s);
    return std::string (s);
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
