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

#include "resource/schema/labels.hpp"

namespace Lease {
namespace resource_model {

namespace {

void merge_list (std::vector<std::string> &dst, const std::vector<std::string> &src)
{
    if (!src.empty ())
        dst = src;
}

void merge_scalar (std::string &dst, const std::string &src)
{
    if (!src.empty ())
        dst = src;
}

void print_list (std::ostream &out,
                 const char *name,
                 const std::vector<std::string> &v,
                 bool &first)
{
    if (v.empty ())
        return;
    out << (first ? "" : ", ") << name << ":";
    if (v.size () == 1) {
        out << v.front ();
    } else {
        out << "[";
        for (size_t i = 0; i < v.size (); ++i)
            out << (i ? "," : "") << v[i];
        out << "]";
    }
    first = false;
}

void print_scalar (std::ostream &out, const char *name, const std::string &v, bool &first)
{
    if (v.empty ())
        return;
    out << (first ? "" : ", ") << name << ":" << v;
    first = false;
}

}  // namespace

bool labels_t::empty () const
{
    return bdf.empty () && mac.empty () && numa.empty () && vlan.empty () && local_name.empty ()
           && ipv4.empty () && ipv6.empty () && vlan_range.empty () && ipv4_subnet.empty ()
           && ipv6_subnet.empty () && device_name.empty () && instance_parent.empty ()
           && region.empty ();
}

labels_t &labels_t::merge (const labels_t &o)
{
    merge_list (bdf, o.bdf);
    merge_list (mac, o.mac);
    merge_list (numa, o.numa);
    merge_list (vlan, o.vlan);
    merge_list (local_name, o.local_name);
    merge_list (ipv4, o.ipv4);
    merge_list (ipv6, o.ipv6);
    merge_list (vlan_range, o.vlan_range);
    merge_scalar (ipv4_subnet, o.ipv4_subnet);
    merge_scalar (ipv6_subnet, o.ipv6_subnet);
    merge_scalar (device_name, o.device_name);
    merge_scalar (instance_parent, o.instance_parent);
    merge_scalar (region, o.region);
    return *this;
}

bool labels_t::operator== (const labels_t &o) const
{
    return bdf == o.bdf && mac == o.mac && numa == o.numa && vlan == o.vlan
           && local_name == o.local_name && ipv4 == o.ipv4 && ipv6 == o.ipv6
           && vlan_range == o.vlan_range && ipv4_subnet == o.ipv4_subnet
           && ipv6_subnet == o.ipv6_subnet && device_name == o.device_name
           && instance_parent == o.instance_parent && region == o.region;
}

bool labels_t::operator!= (const labels_t &o) const
{
    return !operator== (o);
}

const std::string &labels_t::first (const std::vector<std::string> &field)
{
    static const std::string none = "";
    return field.empty () ? none : field.front ();
}

std::ostream &operator<< (std::ostream &out, const labels_t &l)
{
    bool first = true;
    out << "{";
    print_list (out, "bdf", l.bdf, first);
    print_list (out, "mac", l.mac, first);
    print_list (out, "numa", l.numa, first);
    print_list (out, "vlan", l.vlan, first);
    print_list (out, "local_name", l.local_name, first);
    print_list (out, "ipv4", l.ipv4, first);
    print_list (out, "ipv6", l.ipv6, first);
    print_list (out, "vlan_range", l.vlan_range, first);
    print_scalar (out, "ipv4_subnet", l.ipv4_subnet, first);
    print_scalar (out, "ipv6_subnet", l.ipv6_subnet, first);
    print_scalar (out, "device_name", l.device_name, first);
    print_scalar (out, "instance_parent", l.instance_parent, first);
    print_scalar (out, "region", l.region, first);
    out << "}";
    return out;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
