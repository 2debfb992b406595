/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef DATA_STORE_HPP
#define DATA_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace AMS {
namespace workflow {

/*! One registered entry (a trained model, a dataset) of a domain.
 */
struct model_record_t {
    std::string uq_type;
    std::string file;
    double threshold = 0.0;
    int64_t version = -1;
};

/*! Base data store class.  Jobs borrow a store for the duration of one
 *  call; they never own it.
 */
class data_store_base_t {
   public:
    virtual ~data_store_base_t ();

    /*! Root directory of the store.
     */
    virtual const std::filesystem::path &root_path () const = 0;

    /*! Directory where the application drops candidate (not yet
     *  staged) samples.
     */
    virtual std::filesystem::path candidate_path () const = 0;

    /*! Look up entries registered under a domain.
     *
     * \param domain_name  physical domain name
     * \param entry        entry kind (e.g., "models")
     * \param version      "latest", "all" or a decimal version number
     * \return             matching records, newest first; empty when
     *                     nothing is registered.
     *                     Throws store_error if the store cannot be read.
     */
    virtual std::vector<model_record_t> search (const std::string &domain_name,
                                                const std::string &entry,
                                                const std::string &version) const = 0;

    /*! Create root_path ()/subpath if it is absent.
     *
     * \return       the created (or existing) directory.
     *               Throws io_error on failure.
     */
    std::filesystem::path mkdir (const std::string &subpath) const;

    /*! Return a file name (no extension) that no other call returns.
     */
    static std::string unique_filename ();
};

}  // namespace workflow
}  // namespace AMS

#endif  // DATA_STORE_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
