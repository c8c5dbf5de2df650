/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef LEASE_OPTS_HPP
#define LEASE_OPTS_HPP

extern "C" {
#include <jansson.h>
}

#include <map>
#include <string>
#include <cstdint>
#include "src/common/liboptmgr/optmgr.hpp"

namespace Lease {
namespace opts_manager {

const std::string LEASE_OPTS_UNSET_STR = "0xdeadbeef";
const int64_t LEASE_OPTS_UNSET_INT = -1;

enum class vlan_exhaustion_t { STRICT, SOFT };

/*! Option set of the allocation engine and its calendars.
 */
class lease_opts_t : public optmgr_parse_t {
   public:
    enum class lease_opts_key_t : int {
        CYCLE_MILLIS = 1,         // cycle-millis
        BEGINNING_OF_TIME = 10,   // beginning-of-time
        VNIC_MODEL = 20,          // vnic-model
        IPV4_SUBNET_PREFIX = 30,  // ipv4-subnet-prefix
        IPV6_SUBNET_PREFIX = 40,  // ipv6-subnet-prefix
        RESERVED_SUBNETS = 50,    // reserved-subnets
        VLAN_EXHAUSTION = 60,     // vlan-exhaustion
        UNKNOWN = 5000
    };

    // These constructors can throw std::bad_alloc exception
    lease_opts_t ();
    lease_opts_t (const lease_opts_t &o) = default;
    lease_opts_t &operator= (const lease_opts_t &o) = default;
    lease_opts_t (lease_opts_t &&o) = default;
    lease_opts_t &operator= (lease_opts_t &&o) = default;

    int64_t get_cycle_millis () const;
    int64_t get_beginning_of_time () const;
    const std::string &get_vnic_model () const;
    int get_ipv4_subnet_prefix () const;
    int get_ipv6_subnet_prefix () const;
    int get_reserved_subnets () const;
    vlan_exhaustion_t get_vlan_exhaustion () const;

    bool set_cycle_millis (int64_t ms);
    bool set_beginning_of_time (int64_t ms);
    void set_vnic_model (const std::string &model);
    bool set_ipv4_subnet_prefix (int prefix);
    bool set_ipv6_subnet_prefix (int prefix);
    bool set_reserved_subnets (int n);
    bool set_vlan_exhaustion (const std::string &mode);

    bool is_cycle_millis_set () const;
    bool is_beginning_of_time_set () const;
    bool is_vnic_model_set () const;
    bool is_ipv4_subnet_prefix_set () const;
    bool is_ipv6_subnet_prefix_set () const;
    bool is_reserved_subnets_set () const;
    bool is_vlan_exhaustion_set () const;

    /*! Canonicalize the option set -- apply the system defaults to every
     *  option no source has set.
     */
    lease_opts_t &canonicalize ();

    /*! For each option set in o, override the same option in this object.
     *
     *  \param o         an option set object with a higher precedence.
     *  \return          the composed lease_opts_t object.
     */
    lease_opts_t &operator+= (const lease_opts_t &o);

    /*! Comparator that orders option keys for parsing.
     */
    bool operator() (const std::string &k1, const std::string &k2) const;

    /*! Parse the value string (v) according to the key string (k).
     *
     *  \param k         key string
     *  \param v         value string
     *  \param info      parsing info and warning string to return.
     *  \return          0 on success; -1 with errno set to EINVAL on an
     *                   unknown key or an invalid value.
     */
    int parse (const std::string &k, const std::string &v, std::string &info);

    /*! Parse "key=value key=value ..." settings.
     */
    int parse_kv_string (const std::string &opts, std::string &info);

    /*! Load options from a YAML mapping given as a document string or
     *  read from a file.
     *
     *  \return          0 on success; -1 with errno set to EINVAL on a
     *                   malformed document, ENOENT on an unreadable file,
     *                   or as set by parse ().
     */
    int load_yaml (const std::string &document, std::string &info);
    int load_yaml_file (const std::string &path, std::string &info);

    /*! Return the set option parameters as a JSON string
     *
     *  \param json_out  output JSON string
     *  \return          0 on success; -1 on error.
     */
    int jsonify (std::string &json_out) const;

   private:
    bool is_number (const std::string &num_str) const;
    int load_yaml_node (const YAML::Node &root, std::string &info);
    json_t *jsonify_props () const;

    int64_t m_cycle_millis = LEASE_OPTS_UNSET_INT;
    int64_t m_beginning_of_time = LEASE_OPTS_UNSET_INT;
    std::string m_vnic_model = LEASE_OPTS_UNSET_STR;
    int m_ipv4_subnet_prefix = LEASE_OPTS_UNSET_INT;
    int m_ipv6_subnet_prefix = LEASE_OPTS_UNSET_INT;
    int m_reserved_subnets = LEASE_OPTS_UNSET_INT;
    std::string m_vlan_exhaustion = LEASE_OPTS_UNSET_STR;

    // mapping each option to an integer
    std::map<std::string, int> m_tab;
};

}  // namespace opts_manager
}  // namespace Lease

#endif  // LEASE_OPTS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
