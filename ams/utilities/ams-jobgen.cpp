/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <cstdlib>
#include <cerrno>
#include <getopt.h>
#include <iostream>
#include <filesystem>
#include <memory>

#include "ams/utilities/jobgen_context.hpp"
#include "ams/common/errors.hpp"

namespace fs = std::filesystem;
using namespace AMS::workflow;

#define OPTIONS "m:s:r:S:c:F:o:ndh"
static const struct option longopts[] = {
    {"manifest", required_argument, 0, 'm'},
    {"store", required_argument, 0, 's'},
    {"rmq-config", required_argument, 0, 'r'},
    {"stage-dir", required_argument, 0, 'S'},
    {"cwd", required_argument, 0, 'c'},
    {"emit-format", required_argument, 0, 'F'},
    {"output-dir", required_argument, 0, 'o'},
    {"submit", optional_argument, 0, 'u'},
    {"dry-run", no_argument, 0, 'n'},
    {"help", no_argument, 0, 'h'},
    {0, 0, 0, 0},
};

static void usage (int code)
{
    std::cerr << R"(
usage: ams-jobgen [OPTIONS...]

Build the jobs of an AMS workflow (the domain application, the data
stager, the ML training and sub-selection jobs and the orchestrator)
from a workflow manifest and lower each of them into a Flux jobspec
(RFC 14).

Before a job is emitted its pre-submission hook runs against the data
store: the domain job writes its AMS-Objects file under <store>/tmp and
gets AMS_OBJECTS set in its environment.  Run it once per submission.

OPTIONS:
    -h, --help
            Display this usage information

    -m, --manifest=filepath
            Workflow manifest (YAML or JSON)

    -s, --store=dirpath
            Root directory of the AMS data store

    -r, --rmq-config=filepath
            RabbitMQ credentials file; the domain job then sends its
            data to the broker and an rmq stage job can be built

    -S, --stage-dir=dirpath
            Directory the domain application writes candidate samples to
            (default=the store candidate directory)

    -c, --cwd=dirpath
            Working directory of the jobs (default=current directory)

    -F, --emit-format=<yaml|json|pretty>
            Format of the emitted jobspecs (default=yaml)

    -o, --output-dir=dirpath
            Write one jobspec file per job into dirpath instead of
            standard output

    --submit[=URI]
            Submit the jobs to the Flux instance at URI (default=the
            enclosing instance) instead of emitting them

    -n, --dry-run
            Describe the jobs without running their pre-submission hooks

)";
    exit (code);
}

static void process_args (json_t *options, int argc, char *argv[])
{
    int ch = 0;
    detail::emit_format_t format;

    json_object_set_new (options, "emit_format", json_string ("yaml"));
    while ((ch = getopt_long (argc, argv, OPTIONS, longopts, NULL)) != -1) {
        switch (ch) {
            case 'h': /* --help */
                usage (0);
                break;
            case 'm': /* --manifest */
                json_object_set_new (options, "manifest", json_string (optarg));
                if (!fs::exists (optarg)) {
                    std::cerr << "[ERROR] file does not exist for --manifest: ";
                    std::cerr << optarg << std::endl;
                    usage (1);
                }
                break;
            case 's': /* --store */
                json_object_set_new (options, "store", json_string (optarg));
                if (!fs::is_directory (optarg)) {
                    std::cerr << "[ERROR] path passed to --store is not a directory: ";
                    std::cerr << optarg << std::endl;
                    usage (1);
                }
                break;
            case 'r': /* --rmq-config */
                json_object_set_new (options, "rmq_config", json_string (optarg));
                break;
            case 'S': /* --stage-dir */
                json_object_set_new (options, "stage_dir", json_string (optarg));
                break;
            case 'c': /* --cwd */
                json_object_set_new (options, "cwd", json_string (optarg));
                break;
            case 'F': /* --emit-format */
                if (!detail::string_to_emit_format (optarg, format)) {
                    std::cerr << "[ERROR] unknown format for --emit-format: ";
                    std::cerr << optarg << std::endl;
                    usage (1);
                }
                json_object_set_new (options, "emit_format", json_string (optarg));
                break;
            case 'o': /* --output-dir */
                json_object_set_new (options, "output_dir", json_string (optarg));
                break;
            case 'u': /* --submit */
                json_object_set_new (options, "submit", json_true ());
                if (optarg)
                    json_object_set_new (options, "flux_uri", json_string (optarg));
                break;
            case 'n': /* --dry-run */
                json_object_set_new (options, "dry_run", json_true ());
                break;
            default:
                usage (1);
                break;
        }
    }
    if (optind != argc)
        usage (1);
    if (!json_object_get (options, "manifest") || !json_object_get (options, "store")) {
        std::cerr << "[ERROR] --manifest and --store are required" << std::endl;
        usage (1);
    }
}

int main (int argc, char *argv[], char *envp[])
{
    json::value options = json::value::take (json_object ());
    std::unique_ptr<detail::jobgen_context_t> ctx = nullptr;
    int failed = 0;

    process_args (options.get (), argc, argv);

    try {
        ctx = std::make_unique<detail::jobgen_context_t> (options.get (), env_from_envp (envp));
    } catch (std::bad_alloc &e) {
        errno = ENOMEM;
        std::cerr << "Memory error\n";
        return EXIT_FAILURE;
    } catch (std::runtime_error &e) {
        std::cerr << "[ERROR] " << e.what () << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "INFO: " << ctx->manifest ().jobs ().size () << " jobs in "
              << ctx->params ().manifest << std::endl;
    if ((failed = ctx->run (std::cout, std::cerr)) > 0) {
        std::cerr << "[ERROR] " << failed << " jobs failed" << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
