/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

/*
 * ams_job_t holds one job of the closed set of AMS job kinds.  Every
 * kind composes a job_desc_t and satisfies the job_variant concept;
 * the kinds that need to touch the environment right before submission
 * also provide precede_deploy ().  The wrapper dispatches with
 * std::visit.
 */

#ifndef AMS_JOB_HPP
#define AMS_JOB_HPP

#include <concepts>
#include <string>
#include <variant>
#include <vector>

#include "ams/jobs/job_desc.hpp"
#include "ams/jobs/domain_job.hpp"
#include "ams/jobs/ml_job.hpp"
#include "ams/jobs/stage_job.hpp"
#include "ams/jobs/orchestrator_job.hpp"
#include "ams/rmq/rmq_config.hpp"
#include "ams/store/data_store.hpp"

namespace AMS {
namespace workflow {

template<typename T>
concept job_variant = requires (T &t, const T &ct, json::value &o, const json_t *j) {
    { t.desc () } -> std::same_as<job_desc_t &>;
    { ct.desc () } -> std::same_as<const job_desc_t &>;
    ct.dict_fields (o);
    { T::from_dict (j) } -> std::same_as<T>;
    { T::kind } -> std::convertible_to<const char *>;
};

template<typename T>
concept deployable = requires (T &t, const data_store_base_t &store, const rmq_config_t *rmq) {
    t.precede_deploy (store, rmq);
};

/*! A job with no behavior beyond the shared description.
 */
class generic_job_t {
   public:
    static constexpr const char *kind = "ams_job";

    explicit generic_job_t (job_desc_t desc);

    job_desc_t &desc ();
    const job_desc_t &desc () const;

    void dict_fields (json::value &o) const;
    static generic_job_t from_dict (const json_t *o);

   private:
    job_desc_t m_desc;
};

class ams_job_t {
   public:
    using variant_t = std::variant<generic_job_t,
                                   domain_job_t,
                                   ml_train_job_t,
                                   ml_subselect_job_t,
                                   fs_stage_job_t,
                                   network_stage_job_t,
                                   fs_temp_stage_job_t,
                                   orchestrator_job_t>;

    template<job_variant T>
    ams_job_t (T job) : m_job (std::move (job))
    {
    }

    const char *kind () const;
    job_desc_t &desc ();
    const job_desc_t &desc () const;

    std::vector<std::string> generate_command () const;
    submission_spec_t to_submission_spec (const std::string &cwd = "") const;

    /*! Run the job's pre-submission hook; a no-op for kinds without one.
     *  Call exactly once per submission.
     */
    void precede_deploy (const data_store_base_t &store, const rmq_config_t *rmq = nullptr);

    /*! The shared description fields, the kind-specific fields and a
     *  "kind" tag.
     */
    json::value to_dict () const;

    /*! Rebuild a job from to_dict () output.  The kind's invariants are
     *  checked again.  Throws config_error on an unknown kind.
     */
    static ams_job_t from_dict (const json_t *o);

    std::string describe () const;

    template<job_variant T>
    T *get_if ()
    {
        return std::get_if<T> (&m_job);
    }

    template<job_variant T>
    const T *get_if () const
    {
        return std::get_if<T> (&m_job);
    }

   private:
    variant_t m_job;
};

}  // namespace workflow
}  // namespace AMS

#endif  // AMS_JOB_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
