/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef JANSSON_HPP
#define JANSSON_HPP

#include <concepts>
#include <cstdlib>
#include <map>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <jansson.h>
}

namespace json {

struct no_incref {};

/*! Reference-counting owner of a jansson json_t.
 *  Copies share the underlying object; moves transfer ownership.
 */
class value {
    json_t *_v = nullptr;

   public:
    value () = default;
    value (value &&rhs) noexcept : _v (rhs._v)
    {
        rhs._v = nullptr;
    }
    value &operator= (value &&rhs) noexcept
    {
        if (this != &rhs) {
            json_decref (_v);
            _v = rhs._v;
            rhs._v = nullptr;
        }
        return *this;
    }
    value (value const &rhs) : _v (rhs._v)
    {
        json_incref (_v);
    }
    value &operator= (value const &rhs)
    {
        if (this != &rhs) {
            json_decref (_v);
            _v = rhs._v;
            json_incref (_v);
        }
        return *this;
    }
    explicit value (json_t *v) : _v (v)
    {
        json_incref (_v);
    }
    value (no_incref, json_t *v) : _v (v)
    {
    }
    ~value ()
    {
        json_decref (_v);
    }

    /*! Adopt a new reference (e.g., the return value of json_object ())
     *  without bumping its reference count. Throws std::bad_alloc on null.
     */
    static value take (json_t *v)
    {
        if (!v)
            throw std::bad_alloc ();
        return value (no_incref{}, v);
    }

    json_t *get ()
    {
        return _v;
    }

    const json_t *get () const
    {
        return _v;
    }

    explicit operator bool () const
    {
        return _v != nullptr;
    }

    value &emplace_object ()
    {
        json_decref (_v);
        if (!(_v = json_object ()))
            throw std::bad_alloc ();
        return *this;
    }

    value &emplace_array ()
    {
        json_decref (_v);
        if (!(_v = json_array ()))
            throw std::bad_alloc ();
        return *this;
    }

    /*! Set key on an object value; v is shared, not stolen.
     */
    value &set (const char *key, value const &v)
    {
        if (json_object_set (_v, key, const_cast<json_t *> (v.get ())) < 0)
            throw std::bad_alloc ();
        return *this;
    }

    value &append (value const &v)
    {
        if (json_array_append (_v, const_cast<json_t *> (v.get ())) < 0)
            throw std::bad_alloc ();
        return *this;
    }

    std::string dump (size_t flags = JSON_COMPACT) const
    {
        char *s = json_dumps (_v, flags);
        if (!s)
            throw std::bad_alloc ();
        std::string out (s);
        free (s);
        return out;
    }
};

inline void to_json (value &jv, std::string_view const s)
{
    jv = value::take (json_stringn (s.data (), s.length ()));
}
inline void to_json (value &jv, std::string const &s)
{
    to_json (jv, std::string_view (s));
}
inline void to_json (value &jv, const char *s)
{
    to_json (jv, std::string_view (s));
}
inline void to_json (value &jv, bool b)
{
    jv = value::take (json_boolean (b));
}
template<typename T>
    requires std::integral<T> && (!std::same_as<T, bool>)
inline void to_json (value &jv, T const i)
{
    jv = value::take (json_integer (static_cast<json_int_t> (i)));
}
template<std::floating_point T>
inline void to_json (value &jv, T const d)
{
    jv = value::take (json_real (static_cast<double> (d)));
}
inline void to_json (value &jv, value const &v)
{
    jv = v;
}

template<typename T>
concept Maplike = requires (T const &m) {
    typename T::key_type;
    typename T::mapped_type;
    { m.begin ()->first } -> std::convertible_to<std::string>;
};
template<typename T>
concept Seqlike = requires (T const &s) {
    typename T::value_type;
    { s.size () } -> std::convertible_to<std::size_t>;
} && !Maplike<T> && !std::convertible_to<T, std::string_view>;

template<typename MapT>
    requires Maplike<MapT>
void to_json (value &jv, const MapT &m);
template<typename SeqT>
    requires Seqlike<SeqT>
void to_json (value &jv, const SeqT &s);

template<typename MapT>
    requires Maplike<MapT>
inline void to_json (value &jv, const MapT &m)
{
    jv.emplace_object ();
    for (auto &[k, v] : m) {
        value val;
        to_json (val, v);
        jv.set (std::string (k).c_str (), val);
    }
}
template<typename SeqT>
    requires Seqlike<SeqT>
inline void to_json (value &jv, const SeqT &s)
{
    jv.emplace_array ();
    for (auto &e : s) {
        value val;
        to_json (val, e);
        jv.append (val);
    }
}

/*! Parse a JSON document; the jansson error text and position are
 *  reported through std::invalid_argument.
 */
inline value loads (const std::string &s)
{
    json_error_t error;
    json_t *o = json_loadb (s.data (), s.size (), 0, &error);
    if (!o)
        throw std::invalid_argument (std::string (error.text) + " (line "
                                     + std::to_string (error.line) + ")");
    return value (no_incref{}, o);
}

inline value load_file (const std::string &path)
{
    json_error_t error;
    json_t *o = json_load_file (path.c_str (), 0, &error);
    if (!o)
        throw std::invalid_argument (path + ": " + error.text);
    return value (no_incref{}, o);
}

}  // namespace json

#endif  // JANSSON_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
