/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef JOBGEN_CONTEXT_HPP
#define JOBGEN_CONTEXT_HPP

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "ams/libjobspec/jobspec.hpp"
#include "ams/store/catalog_store.hpp"
#include "ams/rmq/rmq_config.hpp"
#include "ams/workflow/workflow_manifest.hpp"
#include "ams/submit/flux_submitter.hpp"
#include "src/common/c++wrappers/jansson.hpp"

namespace AMS {
namespace workflow {
namespace detail {

enum class emit_format_t { YAML, JSON, PRETTY };

bool string_to_emit_format (const std::string &str, emit_format_t &format);
const char *emit_format_to_ext (emit_format_t format);

/*! "<index>-<name>.<ext>" with every character of name outside
 *  [A-Za-z0-9._-] replaced by '_', so the file stays in the output
 *  directory.
 */
std::string output_filename (size_t index, const std::string &name, emit_format_t format);

/*! Text of js in format.  The YAML (or JSON) form is first read back
 *  through the jobspec parser; a jobspec that does not parse, or parses
 *  to a different number of resources or tasks, raises
 *  Jobspec::parse_error instead of being emitted.
 */
std::string render_jobspec (const Jobspec::Jobspec &js, emit_format_t format);

struct jobgen_params_t {
    std::string manifest;
    std::string store;
    std::string rmq_config;
    std::optional<std::string> stage_dir;
    std::string cwd;
    emit_format_t emit_format = emit_format_t::YAML;
    std::string output_dir;
    bool submit = false;
    std::string flux_uri;
    bool dry_run = false;

    /*! Read the options object built from the command line.
     *  Throws config_error on a missing or malformed option.
     */
    void parse (const json_t *options);
};

/*! Everything one ams-jobgen run needs: the store, the optional broker
 *  configuration and the jobs of the manifest.
 */
class jobgen_context_t {
   public:
    jobgen_context_t (const json_t *options, const env_map_t &base_env);

    const jobgen_params_t &params () const;
    workflow_manifest_t &manifest ();

    /*! Deploy and emit (or submit) every job.  Returns the number of
     *  jobs that failed.
     */
    int run (std::ostream &out, std::ostream &err);

   private:
    void emit (size_t index, ams_job_t &job, std::ostream &out);
    bool submit (ams_job_t &job, std::ostream &out, std::ostream &err);

    jobgen_params_t m_params;
    std::unique_ptr<catalog_store_t> m_store;
    std::optional<rmq_config_t> m_rmq;
    std::unique_ptr<workflow_manifest_t> m_manifest;
    std::unique_ptr<flux_submitter_t> m_submitter;
};

}  // namespace detail
}  // namespace workflow
}  // namespace AMS

#endif  // JOBGEN_CONTEXT_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
