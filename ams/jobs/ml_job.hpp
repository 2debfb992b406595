/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef ML_JOB_HPP
#define ML_JOB_HPP

#include <map>
#include <string>
#include <utility>

#include "ams/jobs/job_desc.hpp"
#include "ams/jobs/dict_util.hpp"
#include "ams/store/data_store.hpp"

namespace AMS {
namespace workflow {

using formatting_t = std::map<std::string, std::string>;

/*! Placeholder keys store paths can be substituted under.
 */
const std::string AMS_STORE_PATH = "AMS_STORE_PATH";

formatting_t generate_formatting (const data_store_base_t &store);

/*! Replace every {KEY} in tmpl with its value in ctx; "{{" and "}}"
 *  produce literal braces.  Throws config_error on a key that is not
 *  in ctx or on an unbalanced brace.
 */
std::string format_template (const std::string &tmpl, const formatting_t &ctx);

struct ml_train_tag_t {
    static constexpr const char *kind = "train";
};

struct ml_subselect_tag_t {
    static constexpr const char *kind = "subselect";
};

/*! A training or sub-selection job provided by the ML side of the
 *  workflow.  Store paths are substituted into the command arguments
 *  when the job is constructed.
 */
template<typename tag_t>
class ml_job_t {
   public:
    static constexpr const char *kind = tag_t::kind;

    ml_job_t (job_desc_t desc, std::string domain, const data_store_base_t &store)
        : m_desc (std::move (desc)), m_domain (std::move (domain))
    {
        formatting_t ctx = generate_formatting (store);
        cli_kwargs_t kwargs;

        for (auto &arg : m_desc.cli_args)
            arg = format_template (arg, ctx);
        for (auto &[flag, value] : m_desc.cli_kwargs)
            kwargs.set (flag, format_template (value, ctx));
        m_desc.cli_kwargs = std::move (kwargs);
    }

    job_desc_t &desc ()
    {
        return m_desc;
    }
    const job_desc_t &desc () const
    {
        return m_desc;
    }
    const std::string &domain () const
    {
        return m_domain;
    }

    void dict_fields (json::value &o) const
    {
        dict::put (o, "domain", m_domain);
    }

    // the arguments were formatted when the dictionary was produced
    static ml_job_t from_dict (const json_t *o)
    {
        return ml_job_t (job_desc_t::from_dict (o), dict::get_string (o, "domain"));
    }

   private:
    ml_job_t (job_desc_t desc, std::string domain)
        : m_desc (std::move (desc)), m_domain (std::move (domain))
    {
    }

    job_desc_t m_desc;
    std::string m_domain;
};

using ml_train_job_t = ml_job_t<ml_train_tag_t>;
using ml_subselect_job_t = ml_job_t<ml_subselect_tag_t>;

}  // namespace workflow
}  // namespace AMS

#endif  // ML_JOB_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
