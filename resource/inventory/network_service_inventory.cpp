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
#include <config.h>
#endif
}

#include <set>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>
#include "resource/config/system_defaults.hpp"
#include "resource/inventory/network_service_inventory.hpp"

namespace Lease {
namespace resource_model {

namespace {

int parse_vlan (const std::string &s, int &vlan)
{
    char *end = nullptr;
    if (s.empty ())
        return -1;
    errno = 0;
    long v = strtol (s.c_str (), &end, 10);
    if (errno != 0 || *end != '\0' || v < detail::SYSTEM_MIN_VLAN
        || v > detail::SYSTEM_MAX_VLAN)
        return -1;
    vlan = static_cast<int> (v);
    return 0;
}

std::string join_ranges (const std::vector<std::string> &ranges)
{
    std::string out;
    for (const auto &r : ranges)
        out += (out.empty () ? "" : ",") + r;
    return out;
}

// Bit i of an address, counting from the most significant bit.
template<size_t N>
int get_bit (const std::array<unsigned char, N> &b, int i)
{
    return (b[i / 8] >> (7 - i % 8)) & 1;
}

template<size_t N>
void set_bit (std::array<unsigned char, N> &b, int i, int v)
{
    unsigned char mask = static_cast<unsigned char> (1 << (7 - i % 8));
    if (v)
        b[i / 8] |= mask;
    else
        b[i / 8] &= static_cast<unsigned char> (~mask);
}

//! Sub-block index held in bits [from, to) of an address.
template<size_t N>
uint64_t get_index (const std::array<unsigned char, N> &b, int from, int to)
{
    uint64_t v = 0;
    for (int i = from; i < to; ++i)
        v = (v << 1) | static_cast<uint64_t> (get_bit (b, i));
    return v;
}

template<size_t N>
void set_index (std::array<unsigned char, N> &b, int from, int to, uint64_t v)
{
    for (int i = to - 1; i >= from; --i) {
        set_bit (b, i, static_cast<int> (v & 1));
        v >>= 1;
    }
}

template<size_t N>
void add_offset (std::array<unsigned char, N> &b, uint64_t k)
{
    for (int i = static_cast<int> (N) - 1; i >= 0 && k; --i) {
        uint64_t sum = b[i] + (k & 0xff);
        b[i] = static_cast<unsigned char> (sum & 0xff);
        k = (k >> 8) + (sum >> 8);
    }
}

struct ipv4_family {
    using network_type = boost::asio::ip::network_v4;
    using address_type = boost::asio::ip::address_v4;
    static constexpr int bits = 32;
    static constexpr bool broadcast = true;
    static const char *name ()
    {
        return "IPv4";
    }
    static network_type make (const std::string &s, boost::system::error_code &ec)
    {
        return boost::asio::ip::make_network_v4 (s, ec);
    }
    static int prefix (const opts_manager::lease_opts_t &o)
    {
        return o.get_ipv4_subnet_prefix ();
    }
    static const std::string &subnet (const labels_t &l)
    {
        return l.ipv4_subnet;
    }
    static std::string &subnet (labels_t &l)
    {
        return l.ipv4_subnet;
    }
    static std::vector<std::string> &hosts (labels_t &l)
    {
        return l.ipv4;
    }
};

struct ipv6_family {
    using network_type = boost::asio::ip::network_v6;
    using address_type = boost::asio::ip::address_v6;
    static constexpr int bits = 128;
    static constexpr bool broadcast = false;
    static const char *name ()
    {
        return "IPv6";
    }
    static network_type make (const std::string &s, boost::system::error_code &ec)
    {
        return boost::asio::ip::make_network_v6 (s, ec);
    }
    static int prefix (const opts_manager::lease_opts_t &o)
    {
        return o.get_ipv6_subnet_prefix ();
    }
    static const std::string &subnet (const labels_t &l)
    {
        return l.ipv6_subnet;
    }
    static std::string &subnet (labels_t &l)
    {
        return l.ipv6_subnet;
    }
    static std::vector<std::string> &hosts (labels_t &l)
    {
        return l.ipv6;
    }
};

}  // namespace

int parse_vlan_ranges (const std::vector<std::string> &ranges, vlan_set_t &set)
{
    for (const auto &r : ranges) {
        int lo = 0;
        int hi = 0;
        size_t dash = r.find ('-');
        if (dash == std::string::npos) {
            if (parse_vlan (r, lo) < 0)
                goto error;
            hi = lo;
        } else if (parse_vlan (r.substr (0, dash), lo) < 0
                   || parse_vlan (r.substr (dash + 1), hi) < 0 || lo > hi) {
            goto error;
        }
        set += boost::icl::discrete_interval<int>::closed (lo, hi);
    }
    return 0;

error:
    errno = EPROTO;
    return -1;
}

////////////////////////////////////////////////////////////////////////////////
// Private Methods
////////////////////////////////////////////////////////////////////////////////

int network_service_inventory_t::check_vlan_in_range (int vlan,
                                                      const std::vector<std::string> &ranges,
                                                      const std::string &where)
{
    vlan_set_t allowed;
    if (parse_vlan_ranges (ranges, allowed) < 0)
        return fail (EPROTO, "malformed VLAN range " + join_ranges (ranges) + " on " + where);
    if (!boost::icl::contains (allowed, vlan))
        return fail (EPROTO,
                     "VLAN " + std::to_string (vlan) + " is outside the allowed range "
                         + join_ranges (ranges) + " of " + where);
    return 0;
}

void network_service_inventory_t::vlans_in_use (
    const std::string &port_id,
    const std::vector<reservation_ref_t> &existing,
    std::vector<std::pair<std::string, int>> &used) const
{
    for (const auto &held : held_services (std::string (), existing)) {
        for (const auto &kv : held.second->interfaces) {
            const interface_sliver_t &ifs = kv.second;
            if (!ifs.node_map || ifs.node_map->second != port_id)
                continue;
            const std::string &tag =
                labels_t::first (ifs.label_allocations ? ifs.label_allocations->vlan
                                                       : ifs.labels.vlan);
            int vlan = 0;
            if (parse_vlan (tag, vlan) < 0)
                continue;
            log (LOG_DEBUG,
                 "VLAN %d on %s held by %s",
                 vlan,
                 port_id.c_str (),
                 held.first.c_str ());
            used.emplace_back (held.first, vlan);
        }
    }
}

const network_service_sliver_t *network_service_inventory_t::find_service (
    const node_sliver_t &owner_switch,
    service_type_t type) const
{
    for (const auto &kv : owner_switch.network_services) {
        if (kv.second.type == type)
            return &kv.second;
    }
    return nullptr;
}

template<typename Family>
int network_service_inventory_t::assign_subnet (const std::string &rid,
                                                network_service_sliver_t &requested_ns,
                                                const labels_t &pool,
                                                const std::vector<reservation_ref_t> &existing)
{
    using network_type = typename Family::network_type;
    using address_type = typename Family::address_type;
    boost::system::error_code ec;

    const std::string &delegated = Family::subnet (pool);
    if (delegated.empty ())
        return fail (EINVAL,
                     std::string ("no ") + Family::name () + " subnet delegated for "
                         + requested_ns.name);
    network_type net = Family::make (delegated, ec);
    if (ec)
        return fail (EPROTO, "malformed delegated subnet " + delegated);

    const int netlen = net.prefix_length ();
    const int p = Family::prefix (m_opts);
    if (p < netlen)
        return fail (EPROTO,
                     "subnet prefix /" + std::to_string (p) + " is wider than " + delegated);
    const int width = p - netlen;
    if (width > 64)
        return fail (EINVAL,
                     delegated + " holds too many /" + std::to_string (p) + " sub-blocks");
    const uint64_t last = width == 64 ? UINT64_MAX : (uint64_t (1) << width) - 1;
    const uint64_t reserved = static_cast<uint64_t> (m_opts.get_reserved_subnets ());

    std::set<uint64_t> taken;
    for (const auto &held : held_services (rid, existing)) {
        const network_service_sliver_t *ns = held.second;
        if (ns->type != requested_ns.type || !ns->gateway)
            continue;
        const std::string &s = Family::subnet (*ns->gateway);
        if (s.empty ())
            continue;
        network_type sub = Family::make (s, ec);
        if (ec || sub.prefix_length () != p || !sub.is_subnet_of (net)
            || sub.network () != sub.address ())
            return fail (EPROTO,
                         "subnet " + s + " of reservation " + held.first + " is not a /"
                             + std::to_string (p) + " sub-block of " + delegated);
        uint64_t idx = get_index (sub.address ().to_bytes (), netlen, p);
        if (idx < reserved)
            return fail (EPROTO,
                         "subnet " + s + " of reservation " + held.first + " is reserved");
        log (LOG_DEBUG, "excluding %s held by %s", s.c_str (), held.first.c_str ());
        taken.insert (idx);
    }

    uint64_t idx = reserved;
    for (uint64_t t : taken) {
        if (t < idx)
            continue;
        if (t != idx)
            break;
        ++idx;
    }
    if (reserved > last || idx > last)
        return fail (ENOSPC, "no free sub-block left in " + delegated);

    auto bytes = net.network ().to_bytes ();
    set_index (bytes, netlen, p, idx);
    network_type subnet (address_type (bytes), static_cast<unsigned short> (p));

    const int host_bits = Family::bits - p;
    const uint64_t needed = 1 + requested_ns.interfaces.size ();
    if (host_bits < 64) {
        uint64_t usable = (uint64_t (1) << host_bits) - (Family::broadcast ? 2 : 1);
        if (needed > usable)
            return fail (ENOSPC,
                         "subnet " + subnet.to_string () + " has no room for "
                             + std::to_string (needed) + " addresses");
    }
    auto host = [&subnet] (uint64_t k) {
        auto b = subnet.network ().to_bytes ();
        add_offset (b, k);
        return address_type (b).to_string ();
    };

    labels_t gw;
    Family::subnet (gw) = subnet.to_string ();
    Family::hosts (gw) = {host (1)};
    requested_ns.gateway = gw;
    labels_t alloc = requested_ns.label_allocations ? *requested_ns.label_allocations : labels_t ();
    alloc.merge (gw);
    requested_ns.label_allocations = alloc;

    uint64_t k = 2;
    for (auto &kv : requested_ns.interfaces) {
        interface_sliver_t &ifs = kv.second;
        std::string ip = host (k++);
        Family::hosts (ifs.labels) = {ip};
        labels_t la = ifs.label_allocations ? *ifs.label_allocations : labels_t ();
        Family::hosts (la) = {ip};
        ifs.label_allocations = la;
    }

    log (LOG_INFO,
         "%s: %s gets %s (gateway %s)",
         rid.c_str (),
         requested_ns.name.c_str (),
         subnet.to_string ().c_str (),
         Family::hosts (gw).front ().c_str ());
    return 0;
}

////////////////////////////////////////////////////////////////////////////////
// Public API of the Network Service Allocator
////////////////////////////////////////////////////////////////////////////////

network_service_inventory_t::network_service_inventory_t (flux_t *h,
                                                          const opts_manager::lease_opts_t &opts)
    : inventory_t (h, opts)
{
}

int network_service_inventory_t::allocate_interface (
    const network_service_sliver_t &requested_ns,
    interface_sliver_t &requested_ifs,
    const node_sliver_t &owner_switch,
    const network_service_sliver_t *mpls_ns,
    const interface_sliver_t &candidate_ifs,
    const std::vector<reservation_ref_t> &existing)
{
    interface_sliver_t ifs = requested_ifs;
    std::vector<std::pair<std::string, int>> used;

    if (requested_ns.layer == ns_layer_t::L2) {
        const std::string tag = labels_t::first (ifs.labels.vlan);
        int vlan = 0;
        if (tag.empty ())
            return 0;
        if (parse_vlan (tag, vlan) < 0)
            return fail (EINVAL, "invalid VLAN " + tag + " requested on " + ifs.name);

        if (candidate_ifs.type != FACILITY_PORT_TYPE && mpls_ns) {
            const delegation_t<labels_t> *d = mpls_ns->label_delegations.select ();
            if (d && !d->pool.vlan_range.empty ()
                && check_vlan_in_range (vlan, d->pool.vlan_range, mpls_ns->name) < 0)
                return -1;
        }
        const delegation_t<labels_t> *pd = candidate_ifs.label_delegations.select ();
        if (pd && !pd->pool.vlan_range.empty ()
            && check_vlan_in_range (vlan, pd->pool.vlan_range, candidate_ifs.name) < 0)
            return -1;

        vlans_in_use (candidate_ifs.node_id, existing, used);
        for (const auto &u : used) {
            if (u.second == vlan)
                return fail (EPROTO,
                             "VLAN " + tag + " is already in use on " + candidate_ifs.name
                                 + " by reservation " + u.first);
        }
        labels_t la = ifs.label_allocations ? *ifs.label_allocations : labels_t ();
        la.vlan = {tag};
        ifs.label_allocations = la;
    } else {
        const network_service_sliver_t *ns = find_service (owner_switch, requested_ns.type);
        if (!ns)
            return fail (EPROTO,
                         "switch " + owner_switch.name + " has no "
                             + service_type_to_string (requested_ns.type) + " service");
        const delegation_t<labels_t> *d = ns->label_delegations.select ();
        if (!d || d->pool.vlan_range.empty ()) {
            log (LOG_DEBUG, "%s delegates no VLAN range", ns->name.c_str ());
            return 0;
        }
        vlan_set_t avail;
        if (parse_vlan_ranges (d->pool.vlan_range, avail) < 0)
            return fail (EPROTO,
                         "malformed VLAN range " + join_ranges (d->pool.vlan_range) + " on "
                             + ns->name);
        vlans_in_use (candidate_ifs.node_id, existing, used);
        for (const auto &u : used)
            avail -= u.second;
        if (avail.empty ()) {
            if (m_opts.get_vlan_exhaustion () == opts_manager::vlan_exhaustion_t::SOFT) {
                log (LOG_INFO,
                     "VLAN range %s of %s exhausted on %s; %s left untagged",
                     join_ranges (d->pool.vlan_range).c_str (),
                     ns->name.c_str (),
                     candidate_ifs.name.c_str (),
                     ifs.name.c_str ());
                return 0;
            }
            return fail (ENOSPC,
                         "VLAN range " + join_ranges (d->pool.vlan_range) + " of " + ns->name
                             + " is exhausted on " + candidate_ifs.name);
        }
        const std::string tag = std::to_string (boost::icl::first (*avail.begin ()));
        ifs.labels.vlan = {tag};
        labels_t la;
        la.vlan = {tag};
        ifs.label_allocations = la;
    }
    requested_ifs = std::move (ifs);
    return 0;
}

int network_service_inventory_t::allocate (const std::string &rid,
                                           network_service_sliver_t &requested_ns,
                                           const node_sliver_t &owner_switch,
                                           const std::vector<reservation_ref_t> &existing)
{
    if (requested_ns.type != service_type_t::FABNETV4
        && requested_ns.type != service_type_t::FABNETV6)
        return 0;

    const network_service_sliver_t *ns = find_service (owner_switch, requested_ns.type);
    if (!ns)
        return fail (EPROTO,
                     "switch " + owner_switch.name + " has no "
                         + service_type_to_string (requested_ns.type) + " service");
    const delegation_t<labels_t> *d = ns->label_delegations.select ();
    if (!d)
        return fail (EINVAL, "service " + ns->name + " has no label delegation");

    int rc = 0;
    network_service_sliver_t sliver = requested_ns;
    if (sliver.type == service_type_t::FABNETV4)
        rc = assign_subnet<ipv4_family> (rid, sliver, d->pool, existing);
    else
        rc = assign_subnet<ipv6_family> (rid, sliver, d->pool, existing);
    if (rc < 0)
        return rc;
    requested_ns = std::move (sliver);
    return 0;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
