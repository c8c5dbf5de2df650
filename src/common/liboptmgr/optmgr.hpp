/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/
#ifndef OPTMGR_HPP
#define OPTMGR_HPP

#include <map>
#include <string>
#include <sstream>
#include <vector>
#include <cerrno>
#include <yaml-cpp/yaml.h>

namespace Lease {
namespace opts_manager {

/*! Option composer: the options of an allocation engine come from
 *  compiled-in defaults, a YAML configuration and the embedding policy's
 *  own key=value settings, in increasing precedence. The composer folds
 *  option sets of type T together in that order.
 *
 *  T must provide operator+=() (compose with a set of higher precedence),
 *  canonicalize() (fill in what no source set) and jsonify().
 */
template<class T>
class optmgr_composer_t {
   public:
    /*!
     * Compose with an option set of higher precedence.
     *
     * \param o        option-set object of T type
     * \return         the composed option set
     */
    T &operator+= (const T &o)
    {
        return m_opt += o;
    }

    /*!
     * Canonicalize once all sources have been composed.
     */
    T &canonicalize ()
    {
        return m_opt.canonicalize ();
    }

    const T &get_opt () const
    {
        return m_opt;
    }

    /*!
     * \param json_out  output JSON string
     * \return          0 on success; -1 on error.
     */
    int jsonify (std::string &json_out) const
    {
        return m_opt.jsonify (json_out);
    }

   private:
    T m_opt;
};

/*! Raw key/value pairs of a single option source, parsed into an option
 *  set of type T. T must provide parse(k, v, info) and operator() which
 *  orders keys for parsing.
 */
template<class T>
struct optmgr_kv_t {
    const T &get_opt () const
    {
        return m_opt;
    }

    /*! Put
     *
     * \param k        Key string
     * \param v        Value string
     *
     * \return         0 on success; -1 on error.
     *                 errno: EEXIST (duplicate key), ENOMEM.
     */
    int put (const std::string &k, const std::string &v)
    {
        int rc = 0;
        try {
            auto ret = m_kv.insert (std::pair<std::string, std::string> (k, v));
            if (!ret.second) {
                errno = EEXIST;
                rc = -1;
            }
        } catch (std::bad_alloc &) {
            errno = ENOMEM;
            rc = -1;
        }
        return rc;
    }

    /*! Put
     *
     * \param kv       Key=Value string
     *
     * \return         0 on success; -1 on error.
     */
    int put (const std::string &kv)
    {
        size_t found = std::string::npos;
        if ((found = kv.find_first_of ("=")) == std::string::npos) {
            errno = EPROTO;
            return -1;
        }
        return put (kv.substr (0, found), kv.substr (found + 1));
    }

    /*! Put every entry of a YAML mapping of scalars.
     *
     * \param map      YAML mapping node
     * \param info     error string naming the offending entry.
     *
     * \return         0 on success; -1 on error.
     *                 errno: EINVAL (not a mapping of scalars), EEXIST.
     */
    int put (const YAML::Node &map, std::string &info)
    {
        if (!map.IsMap ()) {
            info += "options must be a mapping. ";
            errno = EINVAL;
            return -1;
        }
        for (const auto &entry : map) {
            if (!entry.first.IsScalar () || !entry.second.IsScalar ()) {
                info += "option values must be scalars. ";
                errno = EINVAL;
                return -1;
            }
            if (put (entry.first.as<std::string> (), entry.second.as<std::string> ()) < 0) {
                info += "duplicate option (" + entry.first.as<std::string> () + "). ";
                return -1;
            }
        }
        return 0;
    }

    /*! Get
     *
     * \return         0 on success; -1 with errno set to ENOENT.
     */
    int get (const std::string &k, std::string &v) const
    {
        auto it = m_kv.find (k);
        if (it == m_kv.end ()) {
            errno = ENOENT;
            return -1;
        }
        v = it->second;
        return 0;
    }

    /*! Parse every key/value pair into the option set, in the order T
     *  defines.
     *
     * \param info     parse warning or error string.
     * \return         0 on success; -1 on the first error.
     */
    int parse (std::string &info)
    {
        int rc = 0;
        for (const auto &kv : m_kv) {
            if ((rc = m_opt.parse (kv.first, kv.second, info)) < 0) {
                return rc;
            }
        }
        return rc;
    }

   private:
    T m_opt;
    std::map<std::string, std::string, T> m_kv;
};

/*! Parsing utilities.
 */
struct optmgr_parse_t {
    /*! Split str at the first occurrence of token.
     *
     * \return         0 on success; -1 on error.
     *                 errno: EINVAL and EPROTO
     */
    int parse_single (const std::string &str,
                      const std::string &token,
                      std::string &k,
                      std::string &v)
    {
        size_t found;
        if (str == "" || token == "") {
            errno = EINVAL;
            return -1;
        }
        if ((found = str.find_first_of (token)) == std::string::npos) {
            errno = EPROTO;
            return -1;
        }
        k = str.substr (0, found);
        v = str.substr (found + 1);
        return 0;
    }

    /*! Parse a string of options delimited by odelim, each a key and a
     *  value delimited by kdelim (e.g., "cycle-millis=500 reserved-subnets=2").
     *  Empty entries produced by repeated delimiters are skipped.
     *
     * \return         0 on success; -1 on error.
     *                 errno: ENOMEM, EEXIST, EINVAL and EPROTO.
     */
    int parse_multi_options (const std::string &m_opts,
                             const char odelim,
                             const char kdelim,
                             std::map<std::string, std::string> &opt_mp)
    {
        try {
            std::stringstream ss (m_opts);
            std::string entry;
            while (getline (ss, entry, odelim)) {
                std::string n = "";
                std::string v = "";
                if (entry.empty ())
                    continue;
                if (parse_single (entry, std::string (1, kdelim), n, v) < 0)
                    return -1;
                if (!opt_mp.insert (std::pair<std::string, std::string> (n, v)).second) {
                    errno = EEXIST;
                    return -1;
                }
            }
        } catch (std::bad_alloc &) {
            errno = ENOMEM;
            return -1;
        }
        return 0;
    }
};

}  // namespace opts_manager
}  // namespace Lease

#endif  // OPTMGR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
