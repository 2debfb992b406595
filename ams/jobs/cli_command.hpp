/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include <concepts>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace AMS {
namespace workflow {

std::string to_cli_string (const std::string &s);
std::string to_cli_string (const char *s);
std::string to_cli_string (const std::filesystem::path &p);
std::string to_cli_string (bool b);
std::string to_cli_string (long long i);
std::string to_cli_string (unsigned long long i);
std::string to_cli_string (double d);

template<typename T>
    requires std::signed_integral<T> && (!std::same_as<T, bool>)
std::string to_cli_string (T i)
{
    return to_cli_string (static_cast<long long> (i));
}

template<typename T>
    requires std::unsigned_integral<T> && (!std::same_as<T, bool>)
std::string to_cli_string (T i)
{
    return to_cli_string (static_cast<unsigned long long> (i));
}

/*! Keyed command-line arguments.  Flags are unique and iterate in
 *  insertion order; setting an existing flag replaces its value in place.
 */
class cli_kwargs_t {
   public:
    using entry_t = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry_t>::const_iterator;

    cli_kwargs_t () = default;
    cli_kwargs_t (std::initializer_list<entry_t> init);

    template<typename T>
    cli_kwargs_t &set (const std::string &flag, const T &v)
    {
        return set_str (flag, to_cli_string (v));
    }

    /*! Return the value of flag or nullptr when unset.
     */
    const std::string *find (const std::string &flag) const;
    bool contains (const std::string &flag) const;
    size_t size () const;
    bool empty () const;
    const_iterator begin () const;
    const_iterator end () const;

    bool operator== (const cli_kwargs_t &o) const = default;

   private:
    cli_kwargs_t &set_str (const std::string &flag, std::string v);

    std::vector<entry_t> m_entries;
};

/*! Build [executable, flag1, value1, ..., positional1, ...].
 */
std::vector<std::string> construct_cli_cmd (const std::string &executable,
                                            const std::vector<std::string> &args,
                                            const cli_kwargs_t &kwargs);

}  // namespace workflow
}  // namespace AMS

#endif  // CLI_COMMAND_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
