/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <cerrno>
#include <cstring>
#include <new>
#include <string>
#include <stdexcept>
#include <catch2/catch_test_macros.hpp>

#include "src/common/c++wrappers/eh_wrapper.hpp"

#define ok(EXPR, DESCR) \
    {                   \
        INFO (DESCR);   \
        CHECK ((EXPR)); \
    }

using namespace AMS::cplusplus_wrappers;
using namespace AMS::workflow;
using namespace std::string_literals;

enum class fault_t {
    none,
    alloc,
    config,
    parse,
    argument,
    resource,
    store,
    io,
    io_zero,
    other,
    unknown
};

static int may_throw (fault_t f)
{
    switch (f) {
        case fault_t::none:
            break;
        case fault_t::alloc:
            throw std::bad_alloc ();
        case fault_t::config:
            throw config_error ("bad manifest");
        case fault_t::parse:
            throw AMS::Jobspec::parse_error ("bad jobspec");
        case fault_t::argument:
            throw std::invalid_argument ("bad json");
        case fault_t::resource:
            throw resource_error ("no resources");
        case fault_t::store:
            throw store_error ("no catalog");
        case fault_t::io:
            throw io_error ("cannot write", EACCES);
        case fault_t::io_zero:
            throw io_error ("cannot write", 0);
        case fault_t::other:
            throw std::runtime_error ("other");
        case fault_t::unknown:
            throw 42;
    }
    return 0;
}

static void may_throw_void (fault_t f)
{
    may_throw (f);
}

static int sum (double p1, float p2, long &p3)
{
    int rc = static_cast<int> (p1 + p2 + p3);
    p3 = 0;
    return rc;
}

TEST_CASE ("exceptions map to errnos", "[eh_wrapper_t]")
{
    struct {
        fault_t fault;
        int errnum;
        const char *tag;
    } cases[] = {
        {fault_t::alloc, ENOMEM, "ENOMEM"},
        {fault_t::config, EINVAL, "EINVAL"},
        {fault_t::parse, EINVAL, "EINVAL"},
        {fault_t::argument, EINVAL, "EINVAL"},
        {fault_t::resource, ENODATA, "ENODATA"},
        {fault_t::store, ENOENT, "ENOENT"},
        {fault_t::io, EACCES, "EIO"},
        {fault_t::io_zero, EIO, "EIO"},
        {fault_t::other, ENOSYS, "ENOSYS"},
        {fault_t::unknown, ENOSYS, "ENOSYS"},
    };
    eh_wrapper_t exception_safe_wrapper;

    for (auto &c : cases) {
        errno = 0;
        int rc = exception_safe_wrapper (may_throw, c.fault);
        INFO (c.tag);
        CHECK (rc == -1);
        CHECK (errno == c.errnum);
        CHECK (exception_safe_wrapper.bad ());
        REQUIRE (exception_safe_wrapper.get_err_message ());
        CHECK (std::strncmp (exception_safe_wrapper.get_err_message (), c.tag, std::strlen (c.tag))
               == 0);
    }
}

TEST_CASE ("no exception leaves state clean", "[eh_wrapper_t]")
{
    eh_wrapper_t exception_safe_wrapper;

    exception_safe_wrapper (may_throw, fault_t::store);
    ok (exception_safe_wrapper.bad (), "bad () after a store error");

    errno = 0;
    int rc = exception_safe_wrapper (may_throw, fault_t::none);
    ok (rc == 0 && errno == 0, "eh_wrapper_t passes the return value through");
    ok (!exception_safe_wrapper.bad (), "bad () is reset by the next call");
    ok (exception_safe_wrapper.get_err_message () == NULL, "no message without an exception");
}

TEST_CASE ("forward args", "[eh_wrapper_t]")
{
    eh_wrapper_t exception_safe_wrapper;
    double p1 = 1.0;
    float p2 = 2.0f;
    long p3 = 3;

    int rc = exception_safe_wrapper (sum, p1, p2, p3);
    ok (rc == 6 && p3 == 0, "eh_wrapper_t forwards args by reference");
}

TEST_CASE ("lambda and void returning", "[eh_wrapper_t]")
{
    eh_wrapper_t exception_safe_wrapper;
    const char *msg = NULL;

    errno = 0;
    int rc = exception_safe_wrapper ([] (int i) { return i + 1; }, 41);
    ok (rc == 42 && errno == 0, "eh_wrapper_t works with lambda function (no exception)");

    errno = 0;
    exception_safe_wrapper (may_throw_void, fault_t::config);
    ok (errno == EINVAL, "eh_wrapper_t works with void function (config_error)");
    msg = exception_safe_wrapper.get_err_message ();
    REQUIRE (msg != NULL);
    ok (std::string (msg) == "EINVAL: bad manifest", "message reports: "s + msg);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
