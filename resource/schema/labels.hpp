/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef LABELS_HPP
#define LABELS_HPP

#include <string>
#include <vector>
#include <ostream>

namespace Lease {
namespace resource_model {

/*! Label set attached to a request, an allocation or a delegated pool.
 *  List fields carry one entry per device in a delegated pool (e.g., one
 *  bdf/mac/vlan triple per SR-IOV virtual function of a shared NIC) and
 *  a single entry in a request or an allocation.
 */
struct labels_t {
    std::vector<std::string> bdf;
    std::vector<std::string> mac;
    std::vector<std::string> numa;
    std::vector<std::string> vlan;
    std::vector<std::string> local_name;
    std::vector<std::string> ipv4;
    std::vector<std::string> ipv6;
    std::vector<std::string> vlan_range; /* inclusive "lo-hi" entries */

    std::string ipv4_subnet;
    std::string ipv6_subnet;
    std::string device_name;
    std::string instance_parent;
    std::string region;

    bool empty () const;

    //! Overwrite every field that is set in o.
    labels_t &merge (const labels_t &o);

    bool operator== (const labels_t &o) const;
    bool operator!= (const labels_t &o) const;

    //! First entry of a list field or the empty string.
    static const std::string &first (const std::vector<std::string> &field);
};

std::ostream &operator<< (std::ostream &out, const labels_t &l);

}  // namespace resource_model
}  // namespace Lease

#endif  // LABELS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
