/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <algorithm>
#include <charconv>
#include <cmath>

#include "ams/jobs/cli_command.hpp"

namespace AMS {
namespace workflow {

std::string to_cli_string (const std::string &s)
{
    return s;
}

std::string to_cli_string (const char *s)
{
    return std::string (s);
}

std::string to_cli_string (const std::filesystem::path &p)
{
    return p.string ();
}

// the consumers of these command lines are Python tools
std::string to_cli_string (bool b)
{
    return b ? "True" : "False";
}

std::string to_cli_string (long long i)
{
    return std::to_string (i);
}

std::string to_cli_string (unsigned long long i)
{
    return std::to_string (i);
}

std::string to_cli_string (double d)
{
    if (std::isnan (d))
        return "nan";
    if (std::isinf (d))
        return d > 0 ? "inf" : "-inf";
    char buf[64];
    auto [ptr, ec] = std::to_chars (buf, buf + sizeof (buf), d);
    std::string s (buf, ptr);
    if (s.find_first_of (".e") == std::string::npos)
        s += ".0";
    return s;
}

cli_kwargs_t::cli_kwargs_t (std::initializer_list<entry_t> init)
{
    for (auto &e : init)
        set_str (e.first, e.second);
}

cli_kwargs_t &cli_kwargs_t::set_str (const std::string &flag, std::string v)
{
    auto it = std::find_if (m_entries.begin (), m_entries.end (), [&flag] (const entry_t &e) {
        return e.first == flag;
    });
    if (it != m_entries.end ())
        it->second = std::move (v);
    else
        m_entries.emplace_back (flag, std::move (v));
    return *this;
}

const std::string *cli_kwargs_t::find (const std::string &flag) const
{
    for (auto &e : m_entries)
        if (e.first == flag)
            return &e.second;
    return nullptr;
}

bool cli_kwargs_t::contains (const std::string &flag) const
{
    return find (flag) != nullptr;
}

size_t cli_kwargs_t::size () const
{
    return m_entries.size ();
}

bool cli_kwargs_t::empty () const
{
    return m_entries.empty ();
}

cli_kwargs_t::const_iterator cli_kwargs_t::begin () const
{
    return m_entries.begin ();
}

cli_kwargs_t::const_iterator cli_kwargs_t::end () const
{
    return m_entries.end ();
}

std::vector<std::string> construct_cli_cmd (const std::string &executable,
                                            const std::vector<std::string> &args,
                                            const cli_kwargs_t &kwargs)
{
    std::vector<std::string> command;
    command.reserve (1 + 2 * kwargs.size () + args.size ());
    command.push_back (executable);
    for (auto &[k, v] : kwargs) {
        command.push_back (k);
        command.push_back (v);
    }
    for (auto &a : args)
        command.push_back (a);
    return command;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
