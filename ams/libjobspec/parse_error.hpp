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
 * separate AMS::Jobspec::parse_error header so that emitters can report
 * errors without pulling in the whole data model
 */

#ifndef AMS_JOBSPEC_PARSE_ERROR_HPP
#define AMS_JOBSPEC_PARSE_ERROR_HPP

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace AMS {
namespace Jobspec {

class parse_error : public std::runtime_error {
   public:
    int position;
    int line;
    int column;
    parse_error (const char *msg);
    parse_error (const YAML::Node &node, const char *msg);
};

}  // namespace Jobspec
}  // namespace AMS

#endif  // AMS_JOBSPEC_PARSE_ERROR_HPP
