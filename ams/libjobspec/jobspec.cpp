/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include "jobspec.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>

using namespace AMS::Jobspec;

parse_error::parse_error (const char *msg)
    : runtime_error (msg), position (-1), line (-1), column (-1)
{
}

parse_error::parse_error (const YAML::Node &node, const char *msg)
    : runtime_error (msg),
      position (node.Mark ().pos),
      line (node.Mark ().line + 1),
      column (node.Mark ().column)
{
}

namespace {
const std::set<std::string> known_resource_types = {"node", "slot", "core", "gpu"};

void parse_yaml_count (Resource &res, const YAML::Node &cnode)
{
    /* count can have an unsigned integer value */
    if (cnode.IsScalar ()) {
        if (cnode.as<long long> () < 1)
            throw parse_error (cnode, "\"count\" must be greater than zero");
        res.count = cnode.as<unsigned> ();
        return;
    }

    /* or the verbose form, of which only "min" is honored */
    if (!cnode.IsMap ()) {
        throw parse_error (cnode, "count is not a mapping");
    }
    if (!cnode["min"]) {
        throw parse_error (cnode, "Key \"min\" missing from count");
    }
    if (!cnode["min"].IsScalar ()) {
        throw parse_error (cnode["min"], "Value of \"min\" must be a scalar");
    }
    if (cnode["min"].as<long long> () < 1) {
        throw parse_error (cnode["min"], "\"min\" must be greater than zero");
    }
    res.count = cnode["min"].as<unsigned> ();
}

std::vector<Resource> parse_yaml_resources (const YAML::Node &resources);
}  // namespace

Resource::Resource (const std::string &t, unsigned c) : type (t), count (c)
{
}

Resource::Resource (const YAML::Node &resnode)
{
    unsigned field_count = 0;

    /* The resource must be a mapping */
    if (!resnode.IsMap ()) {
        throw parse_error (resnode, "resource is not a mapping");
    }
    if (!resnode["type"]) {
        throw parse_error (resnode, "Key \"type\" missing from resource");
    }
    if (!resnode["type"].IsScalar ()) {
        throw parse_error (resnode["type"], "Value of \"type\" must be a scalar");
    }
    type = resnode["type"].as<std::string> ();
    if (known_resource_types.find (type) == known_resource_types.end ()) {
        throw parse_error (resnode["type"],
                           "Value of \"type\" must be one of node, slot, core or gpu");
    }
    field_count++;

    if (!resnode["count"]) {
        throw parse_error (resnode, "Key \"count\" missing from resource");
    }
    parse_yaml_count (*this, resnode["count"]);
    field_count++;

    if (resnode["exclusive"]) {
        if (!resnode["exclusive"].IsScalar ()) {
            throw parse_error (resnode["exclusive"], "Value of \"exclusive\" must be a scalar");
        }
        field_count++;
        std::string val = resnode["exclusive"].as<std::string> ();
        if (val == "false") {
            exclusive = tristate_t::FALSE;
        } else if (val == "true") {
            exclusive = tristate_t::TRUE;
        } else {
            throw parse_error (resnode["exclusive"],
                               "Value of \"exclusive\" must be either \"true\" or \"false\"");
        }
    }

    if (resnode["with"]) {
        field_count++;
        with = parse_yaml_resources (resnode["with"]);
    }

    if (resnode["label"]) {
        if (!resnode["label"].IsScalar ()) {
            throw parse_error (resnode["label"], "Value of \"label\" must be a scalar");
        }
        field_count++;
        label = resnode["label"].as<std::string> ();
    } else if (type == "slot") {
        throw parse_error (resnode, "All slots must be labeled");
    }

    if (field_count != resnode.size ()) {
        throw parse_error (resnode, "Unrecognized key in resource mapping");
    }
}

Task::Task (const YAML::Node &tasknode)
{
    /* The task node must be a mapping */
    if (!tasknode.IsMap ()) {
        throw parse_error (tasknode, "task is not a mapping");
    }
    if (!tasknode["command"]) {
        throw parse_error (tasknode, "Key \"command\" missing from task");
    }
    if (tasknode["command"].IsSequence ()) {
        command = tasknode["command"].as<std::vector<std::string>> ();
    } else {
        throw parse_error (tasknode["command"], "\"command\" value must be a sequence");
    }

    /* Import slot */
    if (!tasknode["slot"]) {
        throw parse_error (tasknode, "Key \"slot\" missing from task");
    }
    if (!tasknode["slot"].IsScalar ()) {
        throw parse_error (tasknode["slot"], "Value of task \"slot\" must be a YAML scalar");
    }
    slot = tasknode["slot"].as<std::string> ();

    /* Import count mapping */
    if (!tasknode["count"]) {
        throw parse_error (tasknode, "Key \"count\" missing from task");
    }
    YAML::Node count_node = tasknode["count"];
    if (!count_node.IsMap ()) {
        throw parse_error (count_node, "\"count\" in task is not a mapping");
    }
    if (count_node.size () != 1) {
        throw parse_error (count_node, "\"count\" in task must have exactly one entry");
    }
    for (auto &&entry : count_node) {
        std::string k = entry.first.as<std::string> ();
        if (k != "per_slot" && k != "total")
            throw parse_error (count_node, "\"count\" in task must be per_slot or total");
        count[k] = entry.second.as<unsigned> ();
    }

    if (tasknode.size () != 3) {
        throw parse_error (tasknode, "impossible number of entries in task mapping");
    }
}

namespace {
std::vector<Task> parse_yaml_tasks (const YAML::Node &tasks)
{
    std::vector<Task> taskvec;

    /* "tasks" must be a sequence */
    if (!tasks.IsSequence ()) {
        throw parse_error (tasks, "\"tasks\" is not a sequence");
    }

    for (auto &&task : tasks) {
        taskvec.push_back (Task (task));
    }

    return taskvec;
}

std::vector<Resource> parse_yaml_resources (const YAML::Node &resources)
{
    std::vector<Resource> resvec;

    /* "resources" must be a sequence */
    if (!resources.IsSequence ()) {
        throw parse_error (resources, "\"resources\" is not a sequence");
    }

    for (auto &&resource : resources) {
        resvec.push_back (Resource (resource));
    }

    return resvec;
}

void flatten_shell_options (const YAML::Node &node,
                            const std::string &prefix,
                            std::map<std::string, std::string> &out)
{
    if (node.IsMap ()) {
        for (auto &&kv : node) {
            std::string k = kv.first.as<std::string> ();
            flatten_shell_options (kv.second, prefix.empty () ? k : prefix + "." + k, out);
        }
    } else if (node.IsScalar ()) {
        out[prefix] = node.as<std::string> ();
    } else {
        throw parse_error (node, "shell options must be scalars or mappings");
    }
}

Attributes parse_yaml_attributes (const YAML::Node &attrs)
{
    Attributes a;

    if (!attrs.IsMap ()) {
        throw parse_error (attrs, "\"attributes\" is not a map");
    }
    for (auto &&kv : attrs) {
        if (kv.first.as<std::string> () == "user") {
            continue;
        } else if (kv.first.as<std::string> () == "system") {
            for (auto &&s : kv.second) {
                if (s.first.as<std::string> () == "duration") {
                    a.system.duration = s.second.as<double> ();
                } else if (s.first.as<std::string> () == "queue") {
                    a.system.queue = s.second.as<std::string> ();
                } else if (s.first.as<std::string> () == "cwd") {
                    a.system.cwd = s.second.as<std::string> ();
                } else if (s.first.as<std::string> () == "environment") {
                    for (auto &&e : s.second) {
                        a.system.environment[e.first.as<std::string> ()] =
                            e.second.as<std::string> ();
                    }
                } else if (s.first.as<std::string> () == "shell") {
                    if (s.second["options"])
                        flatten_shell_options (s.second["options"], "", a.system.shell_options);
                }
            }
        } else {
            throw parse_error (kv.second, "Unknown key in \"attributes\"");
        }
    }
    return a;
}

/* Place value at the dotted key path inside a YAML mapping */
void unflatten_into (YAML::Node root, const std::string &dotted, const std::string &value)
{
    std::vector<std::string> parts;
    boost::split (parts, dotted, boost::is_any_of ("."));
    YAML::Node cur = root;
    for (size_t i = 0; i + 1 < parts.size (); ++i) {
        if (!cur[parts[i]])
            cur[parts[i]] = YAML::Node (YAML::NodeType::Map);
        cur.reset (cur[parts[i]]);
    }
    cur[parts.back ()] = value;
}

void unflatten_into (json::value &root, const std::string &dotted, const std::string &value)
{
    std::vector<std::string> parts;
    boost::split (parts, dotted, boost::is_any_of ("."));
    json_t *cur = root.get ();
    for (size_t i = 0; i + 1 < parts.size (); ++i) {
        json_t *next = json_object_get (cur, parts[i].c_str ());
        if (!next) {
            json::value o;
            o.emplace_object ();
            if (json_object_set (cur, parts[i].c_str (), o.get ()) < 0)
                throw std::bad_alloc ();
            next = o.get ();
        }
        cur = next;
    }
    json::value v;
    json::to_json (v, value);
    if (json_object_set (cur, parts.back ().c_str (), v.get ()) < 0)
        throw std::bad_alloc ();
}

YAML::Node resource_to_yaml (const Resource &r)
{
    YAML::Node n;
    n["type"] = r.type;
    n["count"] = r.count;
    if (r.exclusive == tristate_t::TRUE)
        n["exclusive"] = true;
    else if (r.exclusive == tristate_t::FALSE)
        n["exclusive"] = false;
    if (!r.label.empty ())
        n["label"] = r.label;
    for (auto &&child : r.with)
        n["with"].push_back (resource_to_yaml (child));
    return n;
}

json::value resource_to_json (const Resource &r)
{
    json::value n, v;
    n.emplace_object ();
    json::to_json (v, r.type);
    n.set ("type", v);
    json::to_json (v, r.count);
    n.set ("count", v);
    if (r.exclusive != tristate_t::UNSPECIFIED) {
        json::to_json (v, r.exclusive == tristate_t::TRUE);
        n.set ("exclusive", v);
    }
    if (!r.label.empty ()) {
        json::to_json (v, r.label);
        n.set ("label", v);
    }
    if (!r.with.empty ()) {
        json::value with;
        with.emplace_array ();
        for (auto &&child : r.with)
            with.append (resource_to_json (child));
        n.set ("with", with);
    }
    return n;
}

std::vector<Resource> slot_children (unsigned cores, unsigned gpus)
{
    std::vector<Resource> children;
    children.emplace_back ("core", cores);
    if (gpus > 0)
        children.emplace_back ("gpu", gpus);
    return children;
}

Resource make_slot (unsigned count, std::vector<Resource> children)
{
    Resource slot ("slot", count);
    slot.label = "task";
    slot.with = std::move (children);
    return slot;
}
}  // namespace

Jobspec::Jobspec (const YAML::Node &top)
{
    try {
        /* The top yaml node of the jobspec must be a mapping */
        if (!top.IsMap ()) {
            throw parse_error (top, "Top level of jobspec is not a mapping");
        }
        /* The four keys must be the following */
        if (!top["version"]) {
            throw parse_error (top, "Missing key \"version\" in top level mapping");
        }
        if (!top["resources"]) {
            throw parse_error (top, "Missing key \"resource\" in top level mapping");
        }
        if (!top["tasks"]) {
            throw parse_error (top, "Missing key \"tasks\" in top level mapping");
        }
        if (!top["attributes"]) {
            throw parse_error (top, "Missing key \"attributes\" in top level mapping");
        }
        /* There must be exactly four entries in the mapping */
        if (top.size () != 4) {
            throw parse_error (top, "Top mapping in jobspec must have exactly four entries");
        }

        /* Import version */
        if (!top["version"].IsScalar ()) {
            throw parse_error (top["version"], "\"version\" must be an unsigned integer");
        }
        version = top["version"].as<unsigned int> ();
        if (version != 1) {
            throw parse_error (top["version"], "Only jobspec \"version\" 1 is supported");
        }

        if (!top["attributes"].IsNull ())
            attributes = parse_yaml_attributes (top["attributes"]);
        resources = parse_yaml_resources (top["resources"]);
        tasks = parse_yaml_tasks (top["tasks"]);
    } catch (YAML::Exception &e) {
        throw parse_error (e.what ());
    }
}

Jobspec::Jobspec (std::istream &is)
try : Jobspec{YAML::Load (is)} {
} catch (YAML::Exception &e) {
    throw parse_error (e.what ());
}

Jobspec::Jobspec (const std::string &s)
try : Jobspec{YAML::Load (s)} {
} catch (YAML::Exception &e) {
    throw parse_error (e.what ());
}

Jobspec Jobspec::from_command (const std::vector<std::string> &command,
                               unsigned num_tasks,
                               unsigned cores_per_task,
                               unsigned gpus_per_task,
                               unsigned num_nodes,
                               bool exclusive)
{
    Jobspec js;
    Task task;

    if (command.empty ())
        throw std::invalid_argument ("command must be a non-empty list");
    if (num_tasks < 1)
        throw std::invalid_argument ("task count must be greater than or equal to 1");
    if (cores_per_task < 1)
        throw std::invalid_argument ("cores per task must be greater than or equal to 1");
    if (num_nodes > num_tasks)
        throw std::invalid_argument ("number of nodes greater than the number of tasks");

    task.command = command;
    task.slot = "task";
    if (num_nodes > 0) {
        unsigned num_slots = num_tasks / num_nodes + (num_tasks % num_nodes ? 1 : 0);
        Resource node ("node", num_nodes);
        node.with.push_back (make_slot (num_slots, slot_children (cores_per_task, gpus_per_task)));
        if (exclusive)
            node.exclusive = tristate_t::TRUE;
        js.resources.push_back (std::move (node));
        // uneven distribution wastes task slots, so count tasks in total
        if (num_tasks % num_nodes != 0)
            task.count["total"] = num_tasks;
        else
            task.count["per_slot"] = 1;
    } else {
        js.resources.push_back (
            make_slot (num_tasks, slot_children (cores_per_task, gpus_per_task)));
        task.count["per_slot"] = 1;
    }
    js.tasks.push_back (std::move (task));
    return js;
}

Jobspec Jobspec::from_nest_command (const std::vector<std::string> &command,
                                    unsigned num_slots,
                                    unsigned cores_per_slot,
                                    unsigned gpus_per_slot,
                                    unsigned num_nodes,
                                    bool exclusive,
                                    const std::vector<std::string> &broker_opts)
{
    std::vector<std::string> nest_cmd = {"flux", "broker"};
    nest_cmd.insert (nest_cmd.end (), broker_opts.begin (), broker_opts.end ());
    nest_cmd.insert (nest_cmd.end (), command.begin (), command.end ());

    Jobspec js = from_command (nest_cmd, num_slots, cores_per_slot, gpus_per_slot, num_nodes,
                               exclusive);
    // one broker per slot regardless of how the slots fall on the nodes
    js.tasks.front ().count.clear ();
    js.tasks.front ().count["per_slot"] = 1;
    return js;
}

void Jobspec::set_shell_option (const std::string &key, const std::string &value)
{
    attributes.system.shell_options[key] = value;
}

void Jobspec::set_stdout (const std::string &path)
{
    set_shell_option ("output.stdout.type", "file");
    set_shell_option ("output.stdout.path", path);
}

void Jobspec::set_stderr (const std::string &path)
{
    set_shell_option ("output.stderr.type", "file");
    set_shell_option ("output.stderr.path", path);
}

YAML::Node Jobspec::to_yaml () const
{
    YAML::Node top;
    top["version"] = version;
    for (auto &&r : resources)
        top["resources"].push_back (resource_to_yaml (r));
    for (auto &&t : tasks) {
        YAML::Node tn;
        for (auto &&arg : t.command)
            tn["command"].push_back (arg);
        tn["slot"] = t.slot;
        for (auto &&c : t.count)
            tn["count"][c.first] = c.second;
        top["tasks"].push_back (tn);
    }
    YAML::Node system;
    system["duration"] = attributes.system.duration;
    if (!attributes.system.queue.empty ())
        system["queue"] = attributes.system.queue;
    if (!attributes.system.cwd.empty ())
        system["cwd"] = attributes.system.cwd;
    system["environment"] = YAML::Node (YAML::NodeType::Map);
    for (auto &&e : attributes.system.environment)
        system["environment"][e.first] = e.second;
    if (!attributes.system.shell_options.empty ()) {
        YAML::Node options (YAML::NodeType::Map);
        for (auto &&o : attributes.system.shell_options)
            unflatten_into (options, o.first, o.second);
        system["shell"]["options"] = options;
    }
    top["attributes"]["system"] = system;
    return top;
}

json::value Jobspec::to_json () const
{
    json::value top, v;
    top.emplace_object ();
    json::to_json (v, version);
    top.set ("version", v);

    json::value res;
    res.emplace_array ();
    for (auto &&r : resources)
        res.append (resource_to_json (r));
    top.set ("resources", res);

    json::value tasks_arr;
    tasks_arr.emplace_array ();
    for (auto &&t : tasks) {
        json::value tn;
        tn.emplace_object ();
        json::to_json (v, t.command);
        tn.set ("command", v);
        json::to_json (v, t.slot);
        tn.set ("slot", v);
        json::to_json (v, t.count);
        tn.set ("count", v);
        tasks_arr.append (tn);
    }
    top.set ("tasks", tasks_arr);

    json::value system;
    system.emplace_object ();
    json::to_json (v, attributes.system.duration);
    system.set ("duration", v);
    if (!attributes.system.queue.empty ()) {
        json::to_json (v, attributes.system.queue);
        system.set ("queue", v);
    }
    if (!attributes.system.cwd.empty ()) {
        json::to_json (v, attributes.system.cwd);
        system.set ("cwd", v);
    }
    json::to_json (v, attributes.system.environment);
    system.set ("environment", v);
    if (!attributes.system.shell_options.empty ()) {
        json::value options, shell;
        options.emplace_object ();
        for (auto &&o : attributes.system.shell_options)
            unflatten_into (options, o.first, o.second);
        shell.emplace_object ();
        shell.set ("options", options);
        system.set ("shell", shell);
    }
    json::value attrs;
    attrs.emplace_object ();
    attrs.set ("system", system);
    top.set ("attributes", attrs);
    return top;
}

std::string Jobspec::dump_yaml () const
{
    YAML::Emitter out;
    out << to_yaml ();
    if (!out.good ())
        throw parse_error (out.GetLastError ().c_str ());
    return std::string (out.c_str ()) + "\n";
}

std::string Jobspec::dump_json () const
{
    return to_json ().dump (JSON_COMPACT);
}

namespace {
/*
 * This class magically makes everything in 'dest' stream
 * indented as long as this class is in scope.  Once it
 * it goes out of scope and is destroyed, the indenting
 * disappears.
 */
class IndentingOStreambuf : public std::streambuf {
    std::streambuf *myDest;
    bool myIsAtStartOfLine;
    std::string myIndent;
    std::ostream *myOwner;

   protected:
    virtual int overflow (int ch)
    {
        if (myIsAtStartOfLine && ch != '\n') {
            myDest->sputn (myIndent.data (), myIndent.size ());
        }
        myIsAtStartOfLine = ch == '\n';
        return myDest->sputc (ch);
    }

   public:
    explicit IndentingOStreambuf (std::ostream &dest, int indent = 2)
        : myDest (dest.rdbuf ()), myIsAtStartOfLine (true), myIndent (indent, ' '), myOwner (&dest)
    {
        myOwner->rdbuf (this);
    }
    virtual ~IndentingOStreambuf ()
    {
        myOwner->rdbuf (myDest);
    }
};
}  // namespace

std::ostream &AMS::Jobspec::operator<< (std::ostream &s, Jobspec const &jobspec)
{
    s << "version: " << jobspec.version << std::endl;
    s << "resources: " << std::endl;
    for (auto &&resource : jobspec.resources) {
        IndentingOStreambuf indent (s);
        s << resource;
    }
    s << "tasks: " << std::endl;
    for (auto &&task : jobspec.tasks) {
        IndentingOStreambuf indent (s);
        s << task;
    }
    s << "attributes:" << std::endl;
    s << "  system:" << std::endl;
    s << "    duration: " << jobspec.attributes.system.duration << std::endl;
    s << "    cwd: " << jobspec.attributes.system.cwd << std::endl;
    s << "    queue: " << jobspec.attributes.system.queue << std::endl;
    s << "    environment:" << std::endl;
    for (auto &&e : jobspec.attributes.system.environment) {
        s << "      " << e.first << ": " << e.second << std::endl;
    }
    s << "    shell options:" << std::endl;
    for (auto &&o : jobspec.attributes.system.shell_options) {
        s << "      " << o.first << ": " << o.second << std::endl;
    }
    return s;
}

std::ostream &AMS::Jobspec::operator<< (std::ostream &s, Resource const &resource)
{
    s << "- type: " << resource.type << std::endl;
    s << "  count: " << resource.count << std::endl;
    if (resource.label.size () > 0)
        s << "  label: " << resource.label << std::endl;
    if (resource.exclusive == tristate_t::TRUE)
        s << "  exclusive: true" << std::endl;
    else if (resource.exclusive == tristate_t::FALSE)
        s << "  exclusive: false" << std::endl;
    if (resource.with.size () > 0) {
        s << "  with:" << std::endl;
        IndentingOStreambuf indent (s, 4);
        for (auto &&child_resource : resource.with) {
            s << child_resource;
        }
    }

    return s;
}

std::ostream &AMS::Jobspec::operator<< (std::ostream &s, Task const &task)
{
    bool first = true;
    s << "- command: [ ";
    for (auto &&field : task.command) {
        if (!first)
            s << ", ";
        else
            first = false;
        s << "\"" << field << "\"";
    }
    s << " ]" << std::endl;
    s << "  slot: " << task.slot << std::endl;
    if (task.count.size () > 0) {
        s << "  count:" << std::endl;
        IndentingOStreambuf indent (s, 4);
        for (auto &&c : task.count) {
            s << c.first << ": " << c.second << std::endl;
        }
    }

    return s;
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
