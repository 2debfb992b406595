/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <limits>
#include <set>
#include <string>

#include "ams/jobs/job_resources.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {

namespace {
const std::set<std::string> resource_keys =
    {"nodes", "tasks_per_node", "cores_per_task", "exclusive", "gpus_per_task"};

unsigned get_count (const json_t *o, const char *key, bool required, unsigned dflt)
{
    json_t *v = json_object_get (o, key);
    if (!v || json_is_null (v)) {
        if (required)
            throw config_error (std::string ("resources: missing key \"") + key + "\"");
        return dflt;
    }
    if (!json_is_integer (v) || json_integer_value (v) < 0
        || json_integer_value (v) > std::numeric_limits<unsigned>::max ())
        throw config_error (std::string ("resources: \"") + key
                            + "\" must be a non-negative integer");
    return static_cast<unsigned> (json_integer_value (v));
}

unsigned get_count (const YAML::Node &n, const char *key, bool required, unsigned dflt)
{
    if (!n[key] || n[key].IsNull ()) {
        if (required)
            throw config_error (std::string ("resources: missing key \"") + key + "\"");
        return dflt;
    }
    try {
        if (!n[key].IsScalar () || n[key].as<long long> () < 0)
            throw config_error (std::string ("resources: \"") + key
                                + "\" must be a non-negative integer");
        return n[key].as<unsigned> ();
    } catch (YAML::Exception &e) {
        throw config_error (std::string ("resources: \"") + key + "\": " + e.what ());
    }
}
}  // namespace

job_resources_t::job_resources_t (unsigned nodes,
                                  unsigned tasks_per_node,
                                  unsigned cores_per_task,
                                  bool exclusive,
                                  unsigned gpus_per_task)
    : m_nodes (nodes),
      m_tasks_per_node (tasks_per_node),
      m_cores_per_task (cores_per_task),
      m_exclusive (exclusive),
      m_gpus_per_task (gpus_per_task)
{
    if (m_nodes == 0)
        throw config_error ("resources: nodes must be greater than zero");
    if (m_tasks_per_node == 0)
        throw config_error ("resources: tasks_per_node must be greater than zero");
    if (m_cores_per_task == 0)
        throw config_error ("resources: cores_per_task must be at least one");
    if (m_tasks_per_node > std::numeric_limits<unsigned>::max () / m_nodes)
        throw config_error ("resources: nodes * tasks_per_node overflows the task count");
}

unsigned job_resources_t::nodes () const
{
    return m_nodes;
}

unsigned job_resources_t::tasks_per_node () const
{
    return m_tasks_per_node;
}

unsigned job_resources_t::cores_per_task () const
{
    return m_cores_per_task;
}

bool job_resources_t::exclusive () const
{
    return m_exclusive;
}

unsigned job_resources_t::gpus_per_task () const
{
    return m_gpus_per_task;
}

unsigned job_resources_t::total_tasks () const
{
    return m_nodes * m_tasks_per_node;
}

json::value job_resources_t::to_dict () const
{
    json::value o, v;
    o.emplace_object ();
    json::to_json (v, m_nodes);
    o.set ("nodes", v);
    json::to_json (v, m_tasks_per_node);
    o.set ("tasks_per_node", v);
    json::to_json (v, m_cores_per_task);
    o.set ("cores_per_task", v);
    json::to_json (v, m_exclusive);
    o.set ("exclusive", v);
    json::to_json (v, m_gpus_per_task);
    o.set ("gpus_per_task", v);
    return o;
}

job_resources_t job_resources_t::from_dict (const json_t *o)
{
    const char *key;
    json_t *v;

    if (!o || !json_is_object (o))
        throw config_error ("resources must be a mapping");
    json_object_foreach (const_cast<json_t *> (o), key, v) {
        if (resource_keys.find (key) == resource_keys.end ())
            throw config_error (std::string ("resources: unknown key \"") + key + "\"");
    }
    bool exclusive = true;
    json_t *ex = json_object_get (o, "exclusive");
    if (ex && !json_is_null (ex)) {
        if (!json_is_boolean (ex))
            throw config_error ("resources: \"exclusive\" must be a boolean");
        exclusive = json_is_true (ex);
    }
    return job_resources_t (get_count (o, "nodes", true, 0),
                            get_count (o, "tasks_per_node", true, 0),
                            get_count (o, "cores_per_task", false, 1),
                            exclusive,
                            get_count (o, "gpus_per_task", false, 0));
}

job_resources_t job_resources_t::from_yaml (const YAML::Node &n)
{
    if (!n.IsMap ())
        throw config_error ("resources must be a mapping");
    for (auto &&kv : n) {
        std::string key = kv.first.as<std::string> ();
        if (resource_keys.find (key) == resource_keys.end ())
            throw config_error ("resources: unknown key \"" + key + "\"");
    }
    bool exclusive = true;
    if (n["exclusive"] && !n["exclusive"].IsNull ()) {
        try {
            exclusive = n["exclusive"].as<bool> ();
        } catch (YAML::Exception &e) {
            throw config_error ("resources: \"exclusive\" must be a boolean");
        }
    }
    return job_resources_t (get_count (n, "nodes", true, 0),
                            get_count (n, "tasks_per_node", true, 0),
                            get_count (n, "cores_per_task", false, 1),
                            exclusive,
                            get_count (n, "gpus_per_task", false, 0));
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
