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
 * This jobspec module builds, emits and re-reads the Flux jobspec format
 * (version 1) as specified in Spec 14 of the Flux RFC project:
 * https://github.com/flux-framework/rfc
 *
 * AMS job descriptions are lowered into an AMS::Jobspec::Jobspec through
 * Jobspec::from_command () (a plain task set spread over nodes) or
 * Jobspec::from_nest_command () (a nested Flux instance holding a resource
 * partition).  The result can be emitted as YAML with to_yaml () or as the
 * JSON payload flux_job_submit () expects with to_json ().
 *
 * The parsing constructors accept a std::string, std::istream or a
 * pre-processed YAML::Node.  When errors are found the library raises
 * AMS::Jobspec::parse_error.  If the location of the error in the yaml
 * stream is known it appears in the position, line, and column members,
 * otherwise all three are -1.
 */

#ifndef AMS_JOBSPEC_HPP
#define AMS_JOBSPEC_HPP

#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "parse_error.hpp"
#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace Jobspec {

enum class tristate_t { FALSE, TRUE, UNSPECIFIED };

class Resource {
   public:
    std::string type;
    unsigned count = 1;
    std::string label;
    tristate_t exclusive = tristate_t::UNSPECIFIED;
    std::vector<Resource> with;

    Resource () = default;
    Resource (const std::string &t, unsigned c);
    Resource (const YAML::Node &);
};

class Task {
   public:
    std::vector<std::string> command;
    std::string slot;
    // exactly one of "per_slot" or "total"
    std::map<std::string, unsigned> count;

    Task () = default;
    Task (const YAML::Node &);
};

struct System {
    double duration = 0.0f;
    std::string queue = "";
    std::string cwd = "";
    std::map<std::string, std::string> environment;

    // attributes.system.shell.options, flattened; nested option names use
    // dots (e.g., "output.stdout.path")
    std::map<std::string, std::string> shell_options;
};

struct Attributes {
    System system;
};

class Jobspec {
   public:
    unsigned int version = 1;
    std::vector<Resource> resources;
    std::vector<Task> tasks;
    Attributes attributes;

    Jobspec () = default;
    Jobspec (const YAML::Node &);
    Jobspec (std::istream &is);
    Jobspec (const std::string &s);

    /*! Build a jobspec running command as num_tasks tasks.  When num_nodes
     *  is non-zero the task slots are spread across that many nodes;
     *  uneven distributions use a "total" task count.
     */
    static Jobspec from_command (const std::vector<std::string> &command,
                                 unsigned num_tasks,
                                 unsigned cores_per_task,
                                 unsigned gpus_per_task,
                                 unsigned num_nodes,
                                 bool exclusive);

    /*! Build a jobspec that starts a nested Flux instance running command
     *  ("flux broker [broker_opts...] command...").
     */
    static Jobspec from_nest_command (const std::vector<std::string> &command,
                                      unsigned num_slots,
                                      unsigned cores_per_slot,
                                      unsigned gpus_per_slot,
                                      unsigned num_nodes,
                                      bool exclusive,
                                      const std::vector<std::string> &broker_opts = {});

    void set_shell_option (const std::string &key, const std::string &value);
    void set_stdout (const std::string &path);
    void set_stderr (const std::string &path);

    YAML::Node to_yaml () const;
    json::value to_json () const;
    std::string dump_yaml () const;
    std::string dump_json () const;
};

std::ostream &operator<< (std::ostream &s, Jobspec const &js);
std::ostream &operator<< (std::ostream &s, Resource const &r);
std::ostream &operator<< (std::ostream &s, Task const &t);

}  // namespace Jobspec
}  // namespace AMS

#endif  // AMS_JOBSPEC_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
