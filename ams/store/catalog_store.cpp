/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <boost/algorithm/string.hpp>

#include "ams/store/catalog_store.hpp"
#include "ams/common/errors.hpp"

namespace fs = std::filesystem;

namespace AMS {
namespace workflow {

////////////////////////////////////////////////////////////////////////////////
// Private Catalog Store API
////////////////////////////////////////////////////////////////////////////////

YAML::Node catalog_store_t::load_catalog () const
{
    fs::path fn = m_root / CATALOG_FILENAME;
    std::error_code ec;
    if (!fs::exists (fn, ec))
        return YAML::Node (YAML::NodeType::Map);
    try {
        YAML::Node top = YAML::LoadFile (fn.string ());
        if (top.IsNull ())
            return YAML::Node (YAML::NodeType::Map);
        if (!top.IsMap ())
            throw store_error (fn.string () + ": catalog is not a mapping");
        return top;
    } catch (YAML::Exception &e) {
        throw store_error (fn.string () + ": " + e.what ());
    }
}

namespace {
model_record_t parse_record (const YAML::Node &n)
{
    model_record_t rec;
    if (!n.IsMap ())
        throw store_error ("catalog record is not a mapping");
    if (!n["file"] || !n["version"])
        throw store_error ("catalog record requires \"file\" and \"version\"");
    rec.file = n["file"].as<std::string> ();
    rec.version = n["version"].as<int64_t> ();
    if (n["uq_type"])
        rec.uq_type = n["uq_type"].as<std::string> ();
    if (n["threshold"])
        rec.threshold = n["threshold"].as<double> ();
    return rec;
}
}  // namespace

////////////////////////////////////////////////////////////////////////////////
// Public Catalog Store API
////////////////////////////////////////////////////////////////////////////////

catalog_store_t::catalog_store_t (const fs::path &root) : m_root (root)
{
}

const fs::path &catalog_store_t::root_path () const
{
    return m_root;
}

fs::path catalog_store_t::candidate_path () const
{
    YAML::Node top = load_catalog ();
    try {
        if (top["candidates"])
            return m_root / top["candidates"].as<std::string> ();
    } catch (YAML::Exception &e) {
        throw store_error (std::string ("bad \"candidates\" entry: ") + e.what ());
    }
    return m_root / "candidates";
}

std::vector<model_record_t> catalog_store_t::search (const std::string &domain_name,
                                                     const std::string &entry,
                                                     const std::string &version) const
{
    std::vector<model_record_t> records;
    YAML::Node top = load_catalog ();

    try {
        YAML::Node domains = top["domains"];
        if (!domains || !domains[domain_name] || !domains[domain_name][entry])
            return records;
        YAML::Node entries = domains[domain_name][entry];
        if (!entries.IsSequence ())
            throw store_error ("catalog entry " + domain_name + "/" + entry
                               + " is not a sequence");
        for (auto &&n : entries)
            records.push_back (parse_record (n));
    } catch (YAML::Exception &e) {
        throw store_error ("malformed catalog for " + domain_name + ": " + e.what ());
    }

    std::stable_sort (records.begin (),
                      records.end (),
                      [] (const model_record_t &a, const model_record_t &b) {
                          return a.version > b.version;
                      });

    if (version == "all")
        return records;
    if (version == "latest") {
        if (records.size () > 1)
            records.resize (1);
        return records;
    }
    if (version.empty () || !boost::algorithm::all (version, boost::algorithm::is_digit ()))
        throw store_error ("unknown version selector: " + version);

    int64_t v;
    try {
        v = std::stoll (version);
    } catch (std::out_of_range &) {
        throw store_error ("version selector out of range: " + version);
    }
    std::vector<model_record_t> matched;
    std::copy_if (records.begin (),
                  records.end (),
                  std::back_inserter (matched),
                  [v] (const model_record_t &r) { return r.version == v; });
    return matched;
}

}  // namespace workflow
}  // namespace AMS

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
