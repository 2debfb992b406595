/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef JOB_RESOURCES_HPP
#define JOB_RESOURCES_HPP

#include <yaml-cpp/yaml.h>
#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace workflow {

/*! Node/task/core/gpu request of a single job.  Immutable once built;
 *  the constructor throws config_error on a zero node, task or core count.
 */
class job_resources_t {
   public:
    job_resources_t (unsigned nodes,
                     unsigned tasks_per_node,
                     unsigned cores_per_task = 1,
                     bool exclusive = true,
                     unsigned gpus_per_task = 0);

    unsigned nodes () const;
    unsigned tasks_per_node () const;
    unsigned cores_per_task () const;
    bool exclusive () const;
    unsigned gpus_per_task () const;

    /*! nodes * tasks_per_node
     */
    unsigned total_tasks () const;

    json::value to_dict () const;
    static job_resources_t from_dict (const json_t *o);
    static job_resources_t from_yaml (const YAML::Node &n);

    bool operator== (const job_resources_t &o) const = default;

   private:
    unsigned m_nodes;
    unsigned m_tasks_per_node;
    unsigned m_cores_per_task;
    bool m_exclusive;
    unsigned m_gpus_per_task;
};

}  // namespace workflow
}  // namespace AMS

#endif  // JOB_RESOURCES_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
