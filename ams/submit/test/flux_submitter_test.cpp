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
#include <catch2/catch_test_macros.hpp>

#include "ams/submit/flux_submitter.hpp"
#include "ams/store/test/temp_store.hpp"

using namespace AMS::workflow;
using namespace AMS::workflow::test;

TEST_CASE ("submitting without a handle fails with EINVAL", "[flux_submitter]")
{
    temp_dir_t tmp;
    fake_store_t store (tmp.path ());
    flux_submitter_t submitter;
    flux_jobid_t id = 0;

    job_desc_t d;
    d.name = "plain";
    d.executable = "true";
    d.resources = job_resources_t (1, 1, 1, false, 0);
    ams_job_t job (generic_job_t (d));

    errno = 0;
    CHECK (submitter.submit (job, store, nullptr, "/work", &id) == -1);
    CHECK (errno == EINVAL);

    errno = 0;
    CHECK (submitter.submit_jobspec ("{}", &id) == -1);
    CHECK (errno == EINVAL);
}

TEST_CASE ("connecting to a bad URI reports the error", "[flux_submitter]")
{
    flux_submitter_t submitter;

    CHECK (submitter.open ("nosuchconnector:///nowhere") == -1);
    CHECK (submitter.err_message ().find ("flux_open") == 0);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
