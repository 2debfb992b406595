/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "ams/utilities/jobgen_context.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {
namespace detail {

namespace {
std::string opt_string (const json_t *options, const char *key)
{
    json_t *v = json_object_get (options, key);
    if (!v || json_is_null (v))
        return "";
    if (!json_is_string (v))
        throw config_error (std::string ("option ") + key + " must be a string");
    return json_string_value (v);
}
}  // namespace

bool string_to_emit_format (const std::string &str, emit_format_t &format)
{
    if (str == "yaml")
        format = emit_format_t::YAML;
    else if (str == "json")
        format = emit_format_t::JSON;
    else if (str == "pretty")
        format = emit_format_t::PRETTY;
    else
        return false;
    return true;
}

const char *emit_format_to_ext (emit_format_t format)
{
    switch (format) {
        case emit_format_t::JSON:
            return "json";
        case emit_format_t::PRETTY:
            return "txt";
        case emit_format_t::YAML:
        default:
            return "yaml";
    }
}

std::string output_filename (size_t index, const std::string &name, emit_format_t format)
{
    std::string safe = name;
    for (auto &c : safe) {
        if (!std::isalnum (static_cast<unsigned char> (c)) && c != '-' && c != '_' && c != '.')
            c = '_';
    }
    return std::to_string (index) + "-" + safe + "." + emit_format_to_ext (format);
}

std::string render_jobspec (const Jobspec::Jobspec &js, emit_format_t format)
{
    std::ostringstream os;
    std::string text;

    text = (format == emit_format_t::JSON) ? js.dump_json () : js.dump_yaml ();
    Jobspec::Jobspec check (text);
    if (check.resources.size () != js.resources.size ()
        || check.tasks.size () != js.tasks.size ())
        throw Jobspec::parse_error ("emitted jobspec does not read back to the same shape");

    switch (format) {
        case emit_format_t::JSON:
            os << text << std::endl;
            break;
        case emit_format_t::PRETTY:
            os << js;
            break;
        case emit_format_t::YAML:
            os << "---" << std::endl << text << std::endl;
            break;
    }
    return os.str ();
}

void jobgen_params_t::parse (const json_t *options)
{
    std::string format;

    manifest = opt_string (options, "manifest");
    store = opt_string (options, "store");
    if (manifest.empty ())
        throw config_error ("a workflow manifest is required (--manifest)");
    if (store.empty ())
        throw config_error ("a store root is required (--store)");
    rmq_config = opt_string (options, "rmq_config");
    if (json_object_get (options, "stage_dir"))
        stage_dir = opt_string (options, "stage_dir");
    cwd = opt_string (options, "cwd");
    format = opt_string (options, "emit_format");
    if (!format.empty () && !string_to_emit_format (format, emit_format))
        throw config_error ("unknown emit format " + format);
    output_dir = opt_string (options, "output_dir");
    submit = json_is_true (json_object_get (options, "submit"));
    flux_uri = opt_string (options, "flux_uri");
    dry_run = json_is_true (json_object_get (options, "dry_run"));
}

jobgen_context_t::jobgen_context_t (const json_t *options, const env_map_t &base_env)
{
    m_params.parse (options);
    m_store = std::make_unique<catalog_store_t> (m_params.store);
    if (!m_params.rmq_config.empty ())
        m_rmq = rmq_config_t::from_file (m_params.rmq_config);
    m_manifest = std::make_unique<workflow_manifest_t> (
        workflow_manifest_t::load (m_params.manifest,
                                   *m_store,
                                   base_env,
                                   m_rmq ? &*m_rmq : nullptr,
                                   m_params.stage_dir));
    if (m_params.submit && !m_params.dry_run) {
        m_submitter = std::make_unique<flux_submitter_t> ();
        if (m_submitter->open (m_params.flux_uri) < 0)
            throw io_error ("cannot connect to Flux", errno);
    }
}

const jobgen_params_t &jobgen_context_t::params () const
{
    return m_params;
}

workflow_manifest_t &jobgen_context_t::manifest ()
{
    return *m_manifest;
}

void jobgen_context_t::emit (size_t index, ams_job_t &job, std::ostream &out)
{
    Jobspec::Jobspec js = job.to_submission_spec (m_params.cwd).to_jobspec ();
    std::string text = render_jobspec (js, m_params.emit_format);
    std::ofstream file;
    std::ostream *o = &out;

    if (!m_params.output_dir.empty ()) {
        std::error_code ec;
        std::filesystem::path fn = m_params.output_dir;
        std::filesystem::create_directories (fn, ec);
        if (ec)
            throw io_error ("cannot create " + fn.string (), ec.value ());
        fn /= output_filename (index, job.desc ().name, m_params.emit_format);
        file.open (fn);
        if (!file.is_open ())
            throw io_error ("cannot open " + fn.string (), errno ? errno : EIO);
        o = &file;
        out << "INFO: " << job.kind () << " job " << job.desc ().name << " written to " << fn.string ()
            << std::endl;
    }
    *o << text;
    if (file.is_open ()) {
        file.close ();
        if (file.fail ())
            throw io_error ("cannot write jobspec of " + job.desc ().name, EIO);
    }
}

bool jobgen_context_t::submit (ams_job_t &job, std::ostream &out, std::ostream &err)
{
    flux_jobid_t id;

    if (m_submitter->submit (job, *m_store, m_rmq ? &*m_rmq : nullptr, m_params.cwd, &id) < 0) {
        err << "[ERROR] " << job.desc ().name << ": " << m_submitter->err_message () << std::endl;
        return false;
    }
    out << "INFO: submitted " << job.kind () << " job " << job.desc ().name << " as " << id
        << std::endl;
    return true;
}

int jobgen_context_t::run (std::ostream &out, std::ostream &err)
{
    int failed = 0;
    size_t index = 0;

    for (auto &job : m_manifest->jobs ()) {
        index++;
        if (m_params.dry_run) {
            out << "INFO: " << job.describe () << std::endl;
            continue;
        }
        if (m_submitter) {
            if (!submit (job, out, err))
                failed++;
            continue;
        }
        try {
            job.precede_deploy (*m_store, m_rmq ? &*m_rmq : nullptr);
            emit (index, job, out);
        } catch (std::runtime_error &e) {
            err << "[ERROR] " << job.desc ().name << ": " << e.what () << std::endl;
            failed++;
        } catch (std::invalid_argument &e) {
            err << "[ERROR] " << job.desc ().name << ": " << e.what () << std::endl;
            failed++;
        }
    }
    return failed;
}

}  // namespace detail
}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
