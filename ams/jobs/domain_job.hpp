/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef DOMAIN_JOB_HPP
#define DOMAIN_JOB_HPP

#include <optional>
#include <string>
#include <vector>

#include "ams/jobs/job_desc.hpp"
#include "ams/rmq/rmq_config.hpp"
#include "ams/store/data_store.hpp"

namespace AMS {
namespace workflow {

/*! The physics application linked against the AMS library.  Right
 *  before submission the job writes the AMS-Objects file describing the
 *  database and the surrogate of every domain, and points AMS_OBJECTS
 *  at it.
 */
class domain_job_t {
   public:
    static constexpr const char *kind = "domain";

    /*! Throws config_error when domain_names holds a duplicate.
     */
    domain_job_t (job_desc_t desc,
                  std::vector<std::string> domain_names,
                  std::optional<std::string> stage_dir = std::nullopt);

    job_desc_t &desc ();
    const job_desc_t &desc () const;
    const std::vector<std::string> &domain_names () const;
    const std::optional<std::string> &stage_dir () const;

    /*! Build the AMS-Objects document.  The "db" section describes the
     *  broker when rmq is non-null, the filesystem stage otherwise.
     */
    json::value ams_objects (const data_store_base_t &store, const rmq_config_t *rmq) const;

    /*! Write a fresh AMS-Objects file under <store root>/tmp and export
     *  its path as AMS_OBJECTS.  Every call writes a new file.
     *  Throws store_error or io_error.
     */
    void precede_deploy (const data_store_base_t &store, const rmq_config_t *rmq);

    /*! Path of the last written AMS-Objects file; empty before the
     *  first precede_deploy ().
     */
    const std::string &ams_objects_path () const;

    void dict_fields (json::value &o) const;
    static domain_job_t from_dict (const json_t *o);

   private:
    job_desc_t m_desc;
    std::vector<std::string> m_domain_names;
    std::optional<std::string> m_stage_dir;
    std::string m_ams_objects_path;
};

}  // namespace workflow
}  // namespace AMS

#endif  // DOMAIN_JOB_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
