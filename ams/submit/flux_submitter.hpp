/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef FLUX_SUBMITTER_HPP
#define FLUX_SUBMITTER_HPP

extern "C" {
#include <flux/core.h>
}

#include <string>

#include "ams/jobs/ams_job.hpp"
#include "src/common/c++wrappers/eh_wrapper.hpp"

namespace AMS {
namespace workflow {

/*! Hands AMS jobs to a Flux instance.  Methods follow the Flux
 *  convention: 0 on success, -1 with errno set on failure; the reason
 *  is logged on the handle and kept in err_message ().
 */
class flux_submitter_t {
   public:
    flux_submitter_t () = default;
    flux_submitter_t (const flux_submitter_t &) = delete;
    flux_submitter_t &operator= (const flux_submitter_t &) = delete;
    ~flux_submitter_t ();

    /*! Connect to the instance at uri (the enclosing instance when
     *  uri is empty).
     */
    int open (const std::string &uri);

    /*! Run the job's pre-submission hook, lower it to a jobspec and
     *  submit it.
     *
     * \param job      job to submit
     * \param store    store the hook reads
     * \param rmq      broker configuration, may be nullptr
     * \param cwd      working directory of the job; the current
     *                 directory when empty
     * \param id       on success, the Flux job id
     */
    int submit (ams_job_t &job,
                const data_store_base_t &store,
                const rmq_config_t *rmq,
                const std::string &cwd,
                flux_jobid_t *id);

    /*! Submit an already encoded jobspec (JSON).
     */
    int submit_jobspec (const std::string &jobspec, flux_jobid_t *id);

    const std::string &err_message () const;

   private:
    flux_t *m_h = nullptr;
    std::string m_err_msg;
};

}  // namespace workflow
}  // namespace AMS

#endif  // FLUX_SUBMITTER_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
