/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef NETWORK_SERVICE_INVENTORY_HPP
#define NETWORK_SERVICE_INVENTORY_HPP

#include <string>
#include <vector>
#include <boost/icl/interval_set.hpp>
#include "resource/inventory/inventory.hpp"

namespace Lease {
namespace resource_model {

//! Set of VLAN tags; ranges are inclusive.
using vlan_set_t = boost::icl::interval_set<int>;

/*! Parse the "lo-hi" or "N" entries of a vlan_range label into set.
 *
 *  \return  0 on success; -1 with errno set to EPROTO on a malformed
 *           entry.
 */
int parse_vlan_ranges (const std::vector<std::string> &ranges, vlan_set_t &set);

/*! Network service allocator: VLAN tags for the interfaces of a network
 *  service and IP subnets for FABNetv4/FABNetv6 services.
 */
class network_service_inventory_t : public inventory_t {
   public:
    network_service_inventory_t (flux_t *h, const opts_manager::lease_opts_t &opts);

    /*! Allocate the VLAN of one interface of requested_ns.
     *
     *  L2 services: a requested VLAN is checked against the MPLS service
     *  delegation (unless candidate_ifs is a facility port), against the
     *  delegation of candidate_ifs and against the VLANs other
     *  reservations use on candidate_ifs. Other layers get the first free
     *  VLAN of the owner switch's service of the same type.
     *
     *  \param requested_ns   service requested_ifs belongs to.
     *  \param requested_ifs  interface to annotate.
     *  \param owner_switch   substrate switch serving the interface.
     *  \param mpls_ns        substrate MPLS service, may be nullptr.
     *  \param candidate_ifs  substrate port serving the interface.
     *  \param existing       reservations served by owner_switch.
     *  \return               0 on success; -1 on error.
     *                        errno: EINVAL, ENOSPC, EPROTO.
     */
    int allocate_interface (const network_service_sliver_t &requested_ns,
                            interface_sliver_t &requested_ifs,
                            const node_sliver_t &owner_switch,
                            const network_service_sliver_t *mpls_ns,
                            const interface_sliver_t &candidate_ifs,
                            const std::vector<reservation_ref_t> &existing);

    /*! Allocate a subnet, a gateway and one host address per interface
     *  to a FABNetv4 or FABNetv6 service. Other service types are left
     *  untouched.
     *
     *  \return  0 on success; -1 on error.
     *           errno: EINVAL, ENOSPC, EPROTO.
     */
    int allocate (const std::string &rid,
                  network_service_sliver_t &requested_ns,
                  const node_sliver_t &owner_switch,
                  const std::vector<reservation_ref_t> &existing);

   private:
    int check_vlan_in_range (int vlan,
                             const std::vector<std::string> &ranges,
                             const std::string &where);
    void vlans_in_use (const std::string &port_id,
                       const std::vector<reservation_ref_t> &existing,
                       std::vector<std::pair<std::string, int>> &used) const;
    const network_service_sliver_t *find_service (const node_sliver_t &owner_switch,
                                                  service_type_t type) const;
    template<typename Family>
    int assign_subnet (const std::string &rid,
                       network_service_sliver_t &requested_ns,
                       const labels_t &pool,
                       const std::vector<reservation_ref_t> &existing);
};

}  // namespace resource_model
}  // namespace Lease

#endif  // NETWORK_SERVICE_INVENTORY_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
