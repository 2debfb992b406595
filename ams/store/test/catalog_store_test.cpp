/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <fstream>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>

#include "ams/store/catalog_store.hpp"
#include "ams/common/errors.hpp"
#include "ams/store/test/temp_store.hpp"

using namespace AMS::workflow;
using namespace AMS::workflow::test;

static void write_catalog (const temp_dir_t &tmp, const std::string &text)
{
    std::ofstream f (tmp.path () / CATALOG_FILENAME);
    f << text;
}

static const char *catalog = R"(
candidates: incoming
domains:
  hydro:
    models:
      - {file: m1.pt, version: 1, uq_type: faiss, threshold: 0.5}
      - {file: m3.pt, version: 3, uq_type: deltauq, threshold: 0.1}
      - {file: m2.pt, version: 2}
)";

TEST_CASE ("latest returns the newest record", "[catalog_store]")
{
    temp_dir_t tmp;
    write_catalog (tmp, catalog);
    catalog_store_t store (tmp.path ());

    std::vector<model_record_t> r = store.search ("hydro", "models", "latest");
    REQUIRE (r.size () == 1);
    CHECK (r[0].file == "m3.pt");
    CHECK (r[0].version == 3);
    CHECK (r[0].uq_type == "deltauq");
    CHECK (r[0].threshold == 0.1);
}

TEST_CASE ("all returns every record newest first", "[catalog_store]")
{
    temp_dir_t tmp;
    write_catalog (tmp, catalog);
    catalog_store_t store (tmp.path ());

    std::vector<model_record_t> r = store.search ("hydro", "models", "all");
    REQUIRE (r.size () == 3);
    CHECK (r[0].version == 3);
    CHECK (r[1].version == 2);
    CHECK (r[1].uq_type.empty ());
    CHECK (r[2].version == 1);
}

TEST_CASE ("numeric selectors pick one version", "[catalog_store]")
{
    temp_dir_t tmp;
    write_catalog (tmp, catalog);
    catalog_store_t store (tmp.path ());

    std::vector<model_record_t> r = store.search ("hydro", "models", "2");
    REQUIRE (r.size () == 1);
    CHECK (r[0].file == "m2.pt");
    CHECK (store.search ("hydro", "models", "7").empty ());
    CHECK_THROWS_AS (store.search ("hydro", "models", "newest"), store_error);
    CHECK_THROWS_AS (store.search ("hydro", "models", ""), store_error);
}

TEST_CASE ("unregistered domains and entries are empty", "[catalog_store]")
{
    temp_dir_t tmp;
    write_catalog (tmp, catalog);
    catalog_store_t store (tmp.path ());

    CHECK (store.search ("eos", "models", "latest").empty ());
    CHECK (store.search ("hydro", "datasets", "all").empty ());
}

TEST_CASE ("a store without a catalog is empty", "[catalog_store]")
{
    temp_dir_t tmp;
    catalog_store_t store (tmp.path ());

    CHECK (store.root_path () == tmp.path ());
    CHECK (store.candidate_path () == tmp.path () / "candidates");
    CHECK (store.search ("hydro", "models", "latest").empty ());
}

TEST_CASE ("candidate directory comes from the catalog", "[catalog_store]")
{
    temp_dir_t tmp;
    write_catalog (tmp, catalog);
    catalog_store_t store (tmp.path ());

    CHECK (store.candidate_path () == tmp.path () / "incoming");
}

TEST_CASE ("malformed catalogs raise store_error", "[catalog_store]")
{
    temp_dir_t tmp;
    catalog_store_t store (tmp.path ());

    write_catalog (tmp, "- just\n- a list\n");
    CHECK_THROWS_AS (store.search ("hydro", "models", "latest"), store_error);

    write_catalog (tmp, "domains: {hydro: {models: [{file: m.pt}]}}\n");
    CHECK_THROWS_AS (store.search ("hydro", "models", "latest"), store_error);

    write_catalog (tmp, "domains: {hydro: {models: {file: m.pt, version: 1}}}\n");
    CHECK_THROWS_AS (store.search ("hydro", "models", "latest"), store_error);

    write_catalog (tmp, "domains: {hydro: [unclosed\n");
    CHECK_THROWS_AS (store.search ("hydro", "models", "latest"), store_error);

    write_catalog (tmp, "domains: {hydro: {models: [{file: m.pt, version: 1}]}}\n");
    CHECK (store.search ("hydro", "models", "1").size () == 1);
    CHECK_THROWS_AS (store.search ("hydro", "models", "99999999999999999999"), store_error);
}

TEST_CASE ("mkdir and unique file names", "[data_store]")
{
    temp_dir_t tmp;
    catalog_store_t store (tmp.path ());

    std::filesystem::path dir = store.mkdir ("tmp/nested");
    CHECK (std::filesystem::is_directory (dir));
    CHECK (store.mkdir ("tmp/nested") == dir);

    std::string a = data_store_base_t::unique_filename ();
    std::string b = data_store_base_t::unique_filename ();
    CHECK (a != b);
    CHECK (a.size () == 36);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
