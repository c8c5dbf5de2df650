/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef NETWORK_NODE_INVENTORY_HPP
#define NETWORK_NODE_INVENTORY_HPP

#include <map>
#include <string>
#include <vector>
#include "resource/inventory/inventory.hpp"

namespace Lease {
namespace resource_model {

/*! What is left of one candidate component once the devices held by
 *  other reservations are taken out. For a shared NIC the label pool
 *  holds one bdf/mac/vlan entry per free virtual function.
 */
struct component_pool_t {
    std::string name;
    std::string node_id;
    component_type_t type = component_type_t::GPU;
    std::string model;
    std::string delegation_id;
    labels_t labels;
    capacities_t capacities;
    const component_sliver_t *candidate = nullptr;
};

/*! Substrate node allocator: checks a requested VM or switch against a
 *  candidate node's delegated capacity and binds the components it asks
 *  for.
 */
class network_node_inventory_t : public inventory_t {
   public:
    network_node_inventory_t (flux_t *h, const opts_manager::lease_opts_t &opts);

    /*! Allocate requested on candidate.
     *
     *  \param rid       id of the reservation being allocated; it is
     *                   never charged against itself.
     *  \param requested requested node sliver. Annotated with node map,
     *                   capacity and label allocations on success;
     *                   untouched on failure.
     *  \param graph_id  id of the delegation graph candidate comes from.
     *  \param candidate substrate node with its delegations.
     *  \param existing  reservations with resources on candidate.
     *  \param existing_components
     *                   substrate component id to PCI addresses used by
     *                   network services on candidate.
     *  \param op        create, modify or extend.
     *  \param delegation_id
     *                   capacity delegation the allocation draws from.
     *  \return          0 on success; -1 on error.
     *                   errno: EINVAL, ENOSPC, EPROTO.
     */
    int allocate (const std::string &rid,
                  node_sliver_t &requested,
                  const std::string &graph_id,
                  const node_sliver_t &candidate,
                  const std::vector<reservation_ref_t> &existing,
                  const std::map<std::string, std::vector<std::string>> &existing_components,
                  reservation_operation_t op,
                  std::string &delegation_id);

    /*! Component pools of candidate available to rid, keyed by component
     *  name.
     */
    std::map<std::string, component_pool_t> available_components (
        const std::string &rid,
        const node_sliver_t &candidate,
        const std::vector<reservation_ref_t> &existing,
        const std::map<std::string, std::vector<std::string>> &existing_components) const;

   private:
    int check_node_types (const node_sliver_t &requested, const node_sliver_t &candidate);
    int check_capacities (const std::string &rid,
                          const node_sliver_t &requested,
                          const node_sliver_t &candidate,
                          const std::vector<reservation_ref_t> &existing,
                          std::string &delegation_id);
    int allocate_components (const std::string &graph_id,
                             node_sliver_t &requested,
                             reservation_operation_t op,
                             std::map<std::string, component_pool_t> &pools);
    int revalidate_component (const component_sliver_t &requested,
                              std::map<std::string, component_pool_t> &pools,
                              bool strict);
    int bind_whole (const std::string &graph_id,
                    component_sliver_t &requested,
                    const component_pool_t &pool);
    int bind_smartnic_ports (const std::string &graph_id,
                             component_sliver_t &requested,
                             const component_pool_t &pool);
    int bind_shared_nic (const std::string &graph_id,
                         component_sliver_t &requested,
                         component_pool_t &pool);
    component_pool_t *find_pool (const component_sliver_t &requested,
                                 std::map<std::string, component_pool_t> &pools);
};

}  // namespace resource_model
}  // namespace Lease

#endif  // NETWORK_NODE_INVENTORY_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
