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

#include "ams/submit/flux_submitter.hpp"

namespace AMS {
namespace workflow {

flux_submitter_t::~flux_submitter_t ()
{
    flux_close (m_h);
}

int flux_submitter_t::open (const std::string &uri)
{
    flux_close (m_h);
    if (!(m_h = flux_open (uri.empty () ? NULL : uri.c_str (), 0))) {
        m_err_msg = "flux_open (" + uri + "): " + strerror (errno);
        return -1;
    }
    return 0;
}

int flux_submitter_t::submit (ams_job_t &job,
                              const data_store_base_t &store,
                              const rmq_config_t *rmq,
                              const std::string &cwd,
                              flux_jobid_t *id)
{
    std::string jobspec;
    cplusplus_wrappers::eh_wrapper_t exception_safe_wrapper;

    if (!m_h || !id) {
        errno = EINVAL;
        return -1;
    }
    exception_safe_wrapper (
        [&] () {
            job.precede_deploy (store, rmq);
            jobspec = job.to_submission_spec (cwd).to_jobspec ().dump_json ();
        });
    if (exception_safe_wrapper.bad ()) {
        int saved_errno = errno;
        m_err_msg = exception_safe_wrapper.get_err_message ();
        flux_log (m_h,
                  LOG_ERR,
                  "%s: %s: %s",
                  __FUNCTION__,
                  job.desc ().name.c_str (),
                  m_err_msg.c_str ());
        errno = saved_errno;
        return -1;
    }
    return submit_jobspec (jobspec, id);
}

int flux_submitter_t::submit_jobspec (const std::string &jobspec, flux_jobid_t *id)
{
    int rc = -1;
    flux_future_t *f = NULL;

    if (!m_h || !id) {
        errno = EINVAL;
        goto done;
    }
    if (!(f = flux_job_submit (m_h, jobspec.c_str (), FLUX_JOB_URGENCY_DEFAULT, 0))) {
        m_err_msg = std::string ("flux_job_submit: ") + strerror (errno);
        flux_log_error (m_h, "%s: flux_job_submit", __FUNCTION__);
        goto done;
    }
    if (flux_job_submit_get_id (f, id) < 0) {
        const char *msg = future_strerror (f, errno);
        m_err_msg = std::string ("flux_job_submit_get_id: ") + (msg ? msg : "");
        flux_log_error (m_h, "%s: flux_job_submit_get_id", __FUNCTION__);
        goto done;
    }
    rc = 0;
done:
    flux_future_destroy (f);
    return rc;
}

const std::string &flux_submitter_t::err_message () const
{
    return m_err_msg;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
