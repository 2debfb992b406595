/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef STAGE_JOB_HPP
#define STAGE_JOB_HPP

#include <optional>
#include <string>
#include <vector>

#include "ams/jobs/job_desc.hpp"

namespace AMS {
namespace workflow {

class domain_job_t;

const std::string STAGE_EXECUTABLE = "AMSDBStage";

/*! Settings common to every AMSDBStage invocation.
 */
struct stage_params_t {
    std::string dest;
    std::string persistent_db_path;
    bool store = true;
    std::string db_type = "dhdf5";
    std::string policy = "process";
    std::optional<std::string> prune_module_path;
    std::optional<std::string> prune_class;

    /*! Throws config_error when prune_module_path does not exist or is
     *  given without prune_class.
     */
    void validate () const;

    void dict_fields (json::value &o) const;
    static stage_params_t from_dict (const json_t *o);
};

/*! State shared by the staging variants: the caller's own arguments are
 *  kept apart from the generated ones so a dictionary round trip can
 *  rebuild the command line.
 */
class stage_job_base_t {
   public:
    job_desc_t &desc ();
    const job_desc_t &desc () const;
    const stage_params_t &params () const;

   protected:
    stage_job_base_t (job_desc_t base, stage_params_t params);

    /*! Generate the command line: caller flags, then source_flags, then
     *  the common stage flags; caller arguments, then source_args, then
     *  --store or --no-store.
     */
    void assemble (const std::string &name,
                   const cli_kwargs_t &source_flags,
                   const std::vector<std::string> &source_args);
    void base_dict_fields (json::value &o) const;
    static job_desc_t base_from_dict (const json_t *o);

    job_desc_t m_desc;
    stage_params_t m_params;
    std::vector<std::string> m_user_args;
    cli_kwargs_t m_user_kwargs;
};

/*! Stage job reading the samples the application wrote to a filesystem
 *  directory.
 */
class fs_stage_job_t : public stage_job_base_t {
   public:
    static constexpr const char *kind = "fs_stage";

    fs_stage_job_t (job_desc_t base,
                    stage_params_t params,
                    std::string src,
                    std::string src_type = "shdf5",
                    std::string pattern = "*.h5");

    void dict_fields (json::value &o) const;
    static fs_stage_job_t from_dict (const json_t *o);

   private:
    std::string m_src;
    std::string m_src_type;
    std::string m_pattern;
};

/*! Stage job consuming samples the application publishes to RabbitMQ.
 */
class network_stage_job_t : public stage_job_base_t {
   public:
    static constexpr const char *kind = "network_stage";

    network_stage_job_t (job_desc_t base,
                         stage_params_t params,
                         std::string creds,
                         bool update_models = false);

    void dict_fields (json::value &o) const;
    static network_stage_job_t from_dict (const json_t *o);

   private:
    std::string m_creds;
    bool m_update_models;
};

/*! Stage job moving the filesystem candidates of a domain job into the
 *  persistent store.
 */
class fs_temp_stage_job_t : public stage_job_base_t {
   public:
    static constexpr const char *kind = "fs_temp_stage";

    fs_temp_stage_job_t (job_desc_t base,
                         std::string store_dir,
                         std::string src_dir,
                         std::string dest_dir,
                         std::optional<std::string> prune_module_path = std::nullopt,
                         std::optional<std::string> prune_class = std::nullopt);

    /*! One staging task per node of the domain job.
     *  Throws resource_error when the domain job has no resources.
     */
    static job_resources_t resources_from_domain_job (const domain_job_t &domain_job);

    void dict_fields (json::value &o) const;
    static fs_temp_stage_job_t from_dict (const json_t *o);

   private:
    std::string m_src;
};

}  // namespace workflow
}  // namespace AMS

#endif  // STAGE_JOB_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
