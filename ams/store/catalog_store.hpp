/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CATALOG_STORE_HPP
#define CATALOG_STORE_HPP

#include <yaml-cpp/yaml.h>
#include "ams/store/data_store.hpp"

namespace AMS {
namespace workflow {

const std::string CATALOG_FILENAME = "ams_store.yaml";

/*! Read-only data store whose registry lives in <root>/ams_store.yaml:
 *
 *   candidates: candidates
 *   domains:
 *     <domain>:
 *       models:
 *         - { version: 2, file: m.pt, uq_type: faiss, threshold: 0.5 }
 *
 *  The catalog is re-read on every search () so that a job deployed
 *  later sees models registered in the meantime.  A missing catalog
 *  is an empty store.
 */
class catalog_store_t : public data_store_base_t {
   public:
    explicit catalog_store_t (const std::filesystem::path &root);
    ~catalog_store_t () override = default;

    const std::filesystem::path &root_path () const override;
    std::filesystem::path candidate_path () const override;
    std::vector<model_record_t> search (const std::string &domain_name,
                                        const std::string &entry,
                                        const std::string &version) const override;

   private:
    YAML::Node load_catalog () const;

    std::filesystem::path m_root;
};

}  // namespace workflow
}  // namespace AMS

#endif  // CATALOG_STORE_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
