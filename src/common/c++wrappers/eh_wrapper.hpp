/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef EH_WRAPPER_HPP
#define EH_WRAPPER_HPP

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <exception>
#include <stdexcept>

#include "ams/common/errors.hpp"
#include "ams/libjobspec/parse_error.hpp"

namespace AMS {
namespace cplusplus_wrappers {

/*! Exception handling wrapper functor class.
 *  Wraps a functor that may throw and maps the exceptions of the AMS
 *  workflow library to errnos for callers on the C side of Flux:
 *
 *    std::bad_alloc                  ENOMEM
 *    config_error, parse_error,
 *    std::invalid_argument           EINVAL
 *    resource_error                  ENODATA
 *    store_error                     ENOENT
 *    io_error                        its errnum, EIO when zero
 *    anything else                   ENOSYS
 */
class eh_wrapper_t {
   public:
    /*! Invoke f with args forwarded unchanged.
     *
     * \param f        functor (function, function pointer or function object)
     * \param args     variadic arguments list that is transparently
     *                 forwarded to f.
     * \return         f's return value, or -1 converted to f's return type
     *                 when an exception was raised.
     */
    template<typename Functor, typename... Args>
    auto operator() (Functor f, Args &&...args) -> decltype (f (std::forward<Args> (args)...))
    {
        int rc = -1;
        exception_raised = false;
        memset (err_message, '\0', sizeof (err_message));
        try {
            return f (std::forward<Args> (args)...);
        } catch (std::bad_alloc &e) {
            set_error (ENOMEM, "ENOMEM", e.what ());
        } catch (workflow::config_error &e) {
            set_error (EINVAL, "EINVAL", e.what ());
        } catch (Jobspec::parse_error &e) {
            set_error (EINVAL, "EINVAL", e.what ());
        } catch (std::invalid_argument &e) {
            set_error (EINVAL, "EINVAL", e.what ());
        } catch (workflow::resource_error &e) {
            set_error (ENODATA, "ENODATA", e.what ());
        } catch (workflow::store_error &e) {
            set_error (ENOENT, "ENOENT", e.what ());
        } catch (workflow::io_error &e) {
            set_error (e.errnum ? e.errnum : EIO, "EIO", e.what ());
        } catch (std::exception &e) {
            set_error (ENOSYS, "ENOSYS", e.what ());
        } catch (...) {
            set_error (ENOSYS, "ENOSYS", "Caught unknown exception");
        }
        exception_raised = true;
        return return_<decltype (f (std::forward<Args> (args)...))> (rc);
    }

    /*! Has a C++ exception been raised from the last invocation of operator()?
     */
    bool bad () const
    {
        return exception_raised;
    }

    /*! Return the exception error message associated from the last invocation
     *  of operator().
     */
    const char *get_err_message () const
    {
        return exception_raised ? err_message : NULL;
    }

   private:
    template<typename T>
    T return_ (int i)
    {
        return T (i);
    }

    void set_error (int en, const char *tag, const char *what)
    {
        errno = en;
        snprintf (err_message, sizeof (err_message), "%s: %s", tag, what);
    }

    bool exception_raised = false;
    char err_message[4096];  // to avoid a bad_alloc exception with std::string
};

template<>
inline void eh_wrapper_t::return_<void> (int)
{
    return;
}

}  // namespace cplusplus_wrappers
}  // namespace AMS

#endif  // EH_WRAPPER_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
