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
 * Test support: a scratch directory removed on destruction and an
 * in-memory data store rooted in it.
 */

#ifndef TEMP_STORE_HPP
#define TEMP_STORE_HPP

#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "ams/store/data_store.hpp"
#include "ams/common/errors.hpp"

namespace AMS {
namespace workflow {
namespace test {

class temp_dir_t {
   public:
    temp_dir_t ()
    {
        std::string tmpl = (std::filesystem::temp_directory_path () / "ams-test-XXXXXX").string ();
        if (!mkdtemp (tmpl.data ()))
            throw std::runtime_error ("mkdtemp failed");
        m_path = tmpl;
    }
    ~temp_dir_t ()
    {
        std::error_code ec;
        std::filesystem::remove_all (m_path, ec);
    }
    temp_dir_t (const temp_dir_t &) = delete;
    temp_dir_t &operator= (const temp_dir_t &) = delete;

    const std::filesystem::path &path () const
    {
        return m_path;
    }

   private:
    std::filesystem::path m_path;
};

class fake_store_t : public data_store_base_t {
   public:
    explicit fake_store_t (const std::filesystem::path &root) : m_root (root)
    {
    }

    const std::filesystem::path &root_path () const override
    {
        return m_root;
    }

    std::filesystem::path candidate_path () const override
    {
        return m_root / "candidates";
    }

    std::vector<model_record_t> search (const std::string &domain_name,
                                        const std::string &entry,
                                        const std::string &version) const override
    {
        std::vector<model_record_t> out;
        if (fail)
            throw store_error ("store offline");
        auto it = m_models.find (domain_name);
        if (entry != "models" || it == m_models.end ())
            return out;
        out = it->second;
        if (version == "latest" && out.size () > 1)
            out.resize (1);
        return out;
    }

    // newest first
    void add_model (const std::string &domain_name, const model_record_t &rec)
    {
        auto &v = m_models[domain_name];
        v.insert (v.begin (), rec);
    }

    bool fail = false;

   private:
    std::filesystem::path m_root;
    std::map<std::string, std::vector<model_record_t>> m_models;
};

}  // namespace test
}  // namespace workflow
}  // namespace AMS

#endif  // TEMP_STORE_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
