/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

extern "C" {
#if HAVE_CONFIG_H
#include "config.h"
#endif
}

#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include "resource/config/lease_opts.hpp"
#include "resource/config/system_defaults.hpp"

using namespace Lease;
using namespace Lease::resource_model;
using namespace Lease::opts_manager;

////////////////////////////////////////////////////////////////////////////////
// Private API for Lease Option Class
////////////////////////////////////////////////////////////////////////////////

bool lease_opts_t::is_number (const std::string &num_str) const
{
    if (num_str.empty ())
        return false;
    auto i = std::find_if (num_str.begin (), num_str.end (), [] (unsigned char c) {
        return !std::isdigit (c);
    });
    return i == num_str.end ();
}

int lease_opts_t::load_yaml_node (const YAML::Node &root, std::string &info)
{
    optmgr_kv_t<lease_opts_t> kv;
    if (kv.put (root, info) < 0)
        return -1;
    if (kv.parse (info) < 0)
        return -1;
    *this += kv.get_opt ();
    return 0;
}

json_t *lease_opts_t::jsonify_props () const
{
    return json_pack ("{ s:I s:I s:s s:i s:i s:i s:s }",
                      "cycle-millis",
                      (json_int_t)get_cycle_millis (),
                      "beginning-of-time",
                      (json_int_t)get_beginning_of_time (),
                      "vnic-model",
                      get_vnic_model ().c_str (),
                      "ipv4-subnet-prefix",
                      get_ipv4_subnet_prefix (),
                      "ipv6-subnet-prefix",
                      get_ipv6_subnet_prefix (),
                      "reserved-subnets",
                      get_reserved_subnets (),
                      "vlan-exhaustion",
                      (get_vlan_exhaustion () == vlan_exhaustion_t::SOFT) ? "soft" : "strict");
}

////////////////////////////////////////////////////////////////////////////////
// Public API for Lease Option Class
////////////////////////////////////////////////////////////////////////////////

lease_opts_t::lease_opts_t ()
{
    bool inserted = true;
    const std::pair<const char *, lease_opts_key_t> keys[] = {
        {"cycle-millis", lease_opts_key_t::CYCLE_MILLIS},
        {"beginning-of-time", lease_opts_key_t::BEGINNING_OF_TIME},
        {"vnic-model", lease_opts_key_t::VNIC_MODEL},
        {"ipv4-subnet-prefix", lease_opts_key_t::IPV4_SUBNET_PREFIX},
        {"ipv6-subnet-prefix", lease_opts_key_t::IPV6_SUBNET_PREFIX},
        {"reserved-subnets", lease_opts_key_t::RESERVED_SUBNETS},
        {"vlan-exhaustion", lease_opts_key_t::VLAN_EXHAUSTION},
    };
    for (const auto &k : keys) {
        auto ret = m_tab.insert (std::pair<std::string, int> (k.first, static_cast<int> (k.second)));
        inserted &= ret.second;
    }
    if (!inserted)
        throw std::bad_alloc ();
}

int64_t lease_opts_t::get_cycle_millis () const
{
    return is_cycle_millis_set () ? m_cycle_millis : detail::SYSTEM_DEFAULT_CYCLE_MILLIS;
}

int64_t lease_opts_t::get_beginning_of_time () const
{
    return is_beginning_of_time_set () ? m_beginning_of_time
                                       : detail::SYSTEM_DEFAULT_BEGINNING_OF_TIME;
}

const std::string &lease_opts_t::get_vnic_model () const
{
    static const std::string dflt = detail::SYSTEM_DEFAULT_VNIC_MODEL;
    return is_vnic_model_set () ? m_vnic_model : dflt;
}

int lease_opts_t::get_ipv4_subnet_prefix () const
{
    return is_ipv4_subnet_prefix_set () ? m_ipv4_subnet_prefix
                                        : detail::SYSTEM_DEFAULT_IPV4_SUBNET_PREFIX;
}

int lease_opts_t::get_ipv6_subnet_prefix () const
{
    return is_ipv6_subnet_prefix_set () ? m_ipv6_subnet_prefix
                                        : detail::SYSTEM_DEFAULT_IPV6_SUBNET_PREFIX;
}

int lease_opts_t::get_reserved_subnets () const
{
    return is_reserved_subnets_set () ? m_reserved_subnets
                                      : detail::SYSTEM_DEFAULT_RESERVED_SUBNETS;
}

vlan_exhaustion_t lease_opts_t::get_vlan_exhaustion () const
{
    const std::string &mode =
        is_vlan_exhaustion_set () ? m_vlan_exhaustion : detail::SYSTEM_DEFAULT_VLAN_EXHAUSTION;
    return (mode == "soft") ? vlan_exhaustion_t::SOFT : vlan_exhaustion_t::STRICT;
}

bool lease_opts_t::set_cycle_millis (int64_t ms)
{
    if (ms < 1)
        return false;
    m_cycle_millis = ms;
    return true;
}

bool lease_opts_t::set_beginning_of_time (int64_t ms)
{
    if (ms < 0)
        return false;
    m_beginning_of_time = ms;
    return true;
}

void lease_opts_t::set_vnic_model (const std::string &model)
{
    m_vnic_model = model;
}

bool lease_opts_t::set_ipv4_subnet_prefix (int prefix)
{
    if (prefix < 1 || prefix > 30)
        return false;
    m_ipv4_subnet_prefix = prefix;
    return true;
}

bool lease_opts_t::set_ipv6_subnet_prefix (int prefix)
{
    if (prefix < 1 || prefix > 126)
        return false;
    m_ipv6_subnet_prefix = prefix;
    return true;
}

bool lease_opts_t::set_reserved_subnets (int n)
{
    if (n < 0)
        return false;
    m_reserved_subnets = n;
    return true;
}

bool lease_opts_t::set_vlan_exhaustion (const std::string &mode)
{
    if (mode != "strict" && mode != "soft")
        return false;
    m_vlan_exhaustion = mode;
    return true;
}

bool lease_opts_t::is_cycle_millis_set () const
{
    return m_cycle_millis != LEASE_OPTS_UNSET_INT;
}

bool lease_opts_t::is_beginning_of_time_set () const
{
    return m_beginning_of_time != LEASE_OPTS_UNSET_INT;
}

bool lease_opts_t::is_vnic_model_set () const
{
    return m_vnic_model != LEASE_OPTS_UNSET_STR;
}

bool lease_opts_t::is_ipv4_subnet_prefix_set () const
{
    return m_ipv4_subnet_prefix != LEASE_OPTS_UNSET_INT;
}

bool lease_opts_t::is_ipv6_subnet_prefix_set () const
{
    return m_ipv6_subnet_prefix != LEASE_OPTS_UNSET_INT;
}

bool lease_opts_t::is_reserved_subnets_set () const
{
    return m_reserved_subnets != LEASE_OPTS_UNSET_INT;
}

bool lease_opts_t::is_vlan_exhaustion_set () const
{
    return m_vlan_exhaustion != LEASE_OPTS_UNSET_STR;
}

lease_opts_t &lease_opts_t::canonicalize ()
{
    if (!is_cycle_millis_set ())
        m_cycle_millis = detail::SYSTEM_DEFAULT_CYCLE_MILLIS;
    if (!is_beginning_of_time_set ())
        m_beginning_of_time = detail::SYSTEM_DEFAULT_BEGINNING_OF_TIME;
    if (!is_vnic_model_set ())
        m_vnic_model = detail::SYSTEM_DEFAULT_VNIC_MODEL;
    if (!is_ipv4_subnet_prefix_set ())
        m_ipv4_subnet_prefix = detail::SYSTEM_DEFAULT_IPV4_SUBNET_PREFIX;
    if (!is_ipv6_subnet_prefix_set ())
        m_ipv6_subnet_prefix = detail::SYSTEM_DEFAULT_IPV6_SUBNET_PREFIX;
    if (!is_reserved_subnets_set ())
        m_reserved_subnets = detail::SYSTEM_DEFAULT_RESERVED_SUBNETS;
    if (!is_vlan_exhaustion_set ())
        m_vlan_exhaustion = detail::SYSTEM_DEFAULT_VLAN_EXHAUSTION;
    return *this;
}

lease_opts_t &lease_opts_t::operator+= (const lease_opts_t &src)
{
    if (src.is_cycle_millis_set ())
        m_cycle_millis = src.m_cycle_millis;
    if (src.is_beginning_of_time_set ())
        m_beginning_of_time = src.m_beginning_of_time;
    if (src.is_vnic_model_set ())
        m_vnic_model = src.m_vnic_model;
    if (src.is_ipv4_subnet_prefix_set ())
        m_ipv4_subnet_prefix = src.m_ipv4_subnet_prefix;
    if (src.is_ipv6_subnet_prefix_set ())
        m_ipv6_subnet_prefix = src.m_ipv6_subnet_prefix;
    if (src.is_reserved_subnets_set ())
        m_reserved_subnets = src.m_reserved_subnets;
    if (src.is_vlan_exhaustion_set ())
        m_vlan_exhaustion = src.m_vlan_exhaustion;
    return *this;
}

bool lease_opts_t::operator() (const std::string &k1, const std::string &k2) const
{
    if (m_tab.find (k1) == m_tab.end () || m_tab.find (k2) == m_tab.end ())
        return k1 < k2;
    return m_tab.at (k1) < m_tab.at (k2);
}

int lease_opts_t::jsonify (std::string &json_out) const
{
    int rc = -1;
    int save_errno;
    json_t *o{nullptr};
    char *json_str{nullptr};

    if (!(o = jsonify_props ())) {
        errno = ENOMEM;
        goto ret;
    }
    if (!(json_str = json_dumps (o, JSON_INDENT (0) | JSON_SORT_KEYS))) {
        errno = ENOMEM;
        goto ret;
    }
    json_out = json_str;
    rc = 0;

ret:
    save_errno = errno;
    if (o)
        json_decref (o);
    free (json_str);
    errno = save_errno;
    return rc;
}

int lease_opts_t::parse (const std::string &k, const std::string &v, std::string &info)
{
    int64_t n = 0;
    bool ok = true;
    int key = static_cast<int> (lease_opts_key_t::UNKNOWN);

    if (m_tab.find (k) != m_tab.end ())
        key = m_tab[k];

    switch (key) {
        case static_cast<int> (lease_opts_key_t::VNIC_MODEL):
            set_vnic_model (v);
            return 0;

        case static_cast<int> (lease_opts_key_t::VLAN_EXHAUSTION):
            if (!set_vlan_exhaustion (v)) {
                info += "Unknown vlan-exhaustion mode (" + v + ")! ";
                errno = EINVAL;
                return -1;
            }
            return 0;

        case static_cast<int> (lease_opts_key_t::UNKNOWN):
            info += "Unknown option (" + k + ").";
            errno = EINVAL;
            return -1;

        default:
            break;
    }

    // Every remaining option takes a non-negative integer
    if (!is_number (v)) {
        info += "Option " + k + " needs a non-negative integer (" + v + ")! ";
        errno = EINVAL;
        return -1;
    }
    try {
        n = std::stoll (v);
    } catch (std::out_of_range &) {
        info += "Option " + k + " out of range (" + v + ")! ";
        errno = EINVAL;
        return -1;
    }

    switch (key) {
        case static_cast<int> (lease_opts_key_t::CYCLE_MILLIS):
            ok = set_cycle_millis (n);
            break;
        case static_cast<int> (lease_opts_key_t::BEGINNING_OF_TIME):
            ok = set_beginning_of_time (n);
            break;
        case static_cast<int> (lease_opts_key_t::IPV4_SUBNET_PREFIX):
            ok = n <= 32 && set_ipv4_subnet_prefix (static_cast<int> (n));
            break;
        case static_cast<int> (lease_opts_key_t::IPV6_SUBNET_PREFIX):
            ok = n <= 128 && set_ipv6_subnet_prefix (static_cast<int> (n));
            break;
        case static_cast<int> (lease_opts_key_t::RESERVED_SUBNETS):
            ok = n <= 65536 && set_reserved_subnets (static_cast<int> (n));
            break;
        default:
            ok = false;
            break;
    }
    if (!ok) {
        info += "Invalid value for " + k + " (" + v + ")! ";
        errno = EINVAL;
        return -1;
    }
    return 0;
}

int lease_opts_t::parse_kv_string (const std::string &opts, std::string &info)
{
    std::map<std::string, std::string> opt_mp;
    if (parse_multi_options (opts, ' ', '=', opt_mp) < 0) {
        info += "Malformed option string (" + opts + ")! ";
        return -1;
    }
    for (const auto &kv : opt_mp) {
        if (parse (kv.first, kv.second, info) < 0)
            return -1;
    }
    return 0;
}

int lease_opts_t::load_yaml (const std::string &document, std::string &info)
{
    try {
        return load_yaml_node (YAML::Load (document), info);
    } catch (YAML::Exception &e) {
        info += std::string ("Malformed YAML options: ") + e.what () + " ";
        errno = EINVAL;
        return -1;
    }
}

int lease_opts_t::load_yaml_file (const std::string &path, std::string &info)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile (path);
    } catch (YAML::BadFile &) {
        info += "Cannot read option file (" + path + ")! ";
        errno = ENOENT;
        return -1;
    } catch (YAML::Exception &e) {
        info += std::string ("Malformed YAML options: ") + e.what () + " ";
        errno = EINVAL;
        return -1;
    }
    return load_yaml_node (root, info);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
