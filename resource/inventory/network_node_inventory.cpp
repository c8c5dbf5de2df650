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

#include <cerrno>
#include <sstream>
#include <algorithm>
#include "resource/inventory/network_node_inventory.hpp"

namespace Lease {
namespace resource_model {

namespace {

/*! Take the virtual function at index i out of a shared NIC label pool.
 *  Only the list fields running parallel to bdf are trimmed.
 */
void erase_index (labels_t &pool, size_t i)
{
    const size_t n = pool.bdf.size ();
    std::vector<std::string> *fields[] = {&pool.mac,
                                          &pool.vlan,
                                          &pool.numa,
                                          &pool.local_name,
                                          &pool.ipv4,
                                          &pool.ipv6};
    for (auto *f : fields) {
        if (f->size () == n && i < n)
            f->erase (f->begin () + i);
    }
    if (i < n)
        pool.bdf.erase (pool.bdf.begin () + i);
}

bool remove_bdf (component_pool_t &pool, const std::string &bdf)
{
    auto it = std::find (pool.labels.bdf.begin (), pool.labels.bdf.end (), bdf);
    if (it == pool.labels.bdf.end ())
        return false;
    erase_index (pool.labels, it - pool.labels.bdf.begin ());
    if (pool.capacities.has (CAP_UNIT))
        pool.capacities.set (CAP_UNIT, pool.capacities.get (CAP_UNIT) - 1);
    return true;
}

const std::string *component_name (const std::map<std::string, std::string> &by_id,
                                    const std::string &node_id)
{
    auto it = by_id.find (node_id);
    return it == by_id.end () ? nullptr : &it->second;
}

const labels_t &label_pool (const interface_sliver_t &ifs)
{
    const delegation_t<labels_t> *d = ifs.label_delegations.select ();
    return d ? d->pool : ifs.labels;
}

const std::vector<std::string> &allocated_bdfs (const component_sliver_t &c)
{
    return c.label_allocations ? c.label_allocations->bdf : c.labels.bdf;
}

}  // namespace

////////////////////////////////////////////////////////////////////////////////
// Private Methods
////////////////////////////////////////////////////////////////////////////////

int network_node_inventory_t::check_node_types (const node_sliver_t &requested,
                                                const node_sliver_t &candidate)
{
    switch (requested.type) {
        case node_type_t::VM:
            if (candidate.type == node_type_t::SERVER || candidate.type == node_type_t::VM)
                return 0;
            break;
        case node_type_t::SWITCH:
            if (candidate.type == node_type_t::SWITCH)
                return 0;
            break;
        default:
            return fail (EINVAL,
                         std::string ("unsupported node type ")
                             + node_type_to_string (requested.type) + " for "
                             + requested.name);
    }
    return fail (EINVAL,
                 std::string ("cannot place a ") + node_type_to_string (requested.type)
                     + " on " + node_type_to_string (candidate.type) + " " + candidate.name);
}

int network_node_inventory_t::check_capacities (const std::string &rid,
                                                const node_sliver_t &requested,
                                                const node_sliver_t &candidate,
                                                const std::vector<reservation_ref_t> &existing,
                                                std::string &delegation_id)
{
    const delegation_t<capacities_t> *d = candidate.capacity_delegations.select ();
    if (!d)
        return fail (EINVAL, "candidate " + candidate.name + " has no capacity delegation");

    capacities_t available = d->pool;
    for (const node_sliver_t *n : held_nodes (rid, existing, true)) {
        if (n->node_map && n->node_map->second != candidate.node_id)
            continue;
        available -= n->capacity_allocations ? *n->capacity_allocations : n->capacities;
    }

    std::vector<std::string> shortfall = (available - requested.capacities).negative_fields ();
    if (!shortfall.empty ()) {
        std::ostringstream out;
        out << "insufficient resources on " << candidate.name << ": requested "
            << requested.capacities << " available " << available << " short of";
        for (const auto &f : shortfall)
            out << " " << f;
        return fail (ENOSPC, out.str ());
    }
    delegation_id = d->delegation_id;
    return 0;
}

component_pool_t *network_node_inventory_t::find_pool (
    const component_sliver_t &requested,
    std::map<std::string, component_pool_t> &pools)
{
    for (auto &kv : pools) {
        component_pool_t &pool = kv.second;
        if (pool.type != requested.type)
            continue;
        if (!requested.model.empty () && requested.model != pool.model)
            continue;
        if (pool.type == component_type_t::SHAREDNIC) {
            if (pool.labels.bdf.empty ())
                continue;
            if (pool.capacities.has (CAP_UNIT) && pool.capacities.get (CAP_UNIT) <= 0)
                continue;
        }
        return &pool;
    }
    return nullptr;
}

int network_node_inventory_t::bind_whole (const std::string &graph_id,
                                          component_sliver_t &requested,
                                          const component_pool_t &pool)
{
    requested.capacity_allocations = pool.capacities;
    requested.label_allocations = pool.labels;
    requested.node_map = node_map_t (graph_id, pool.node_id);
    if (requested.model.empty ())
        requested.model = pool.model;
    return 0;
}

int network_node_inventory_t::bind_smartnic_ports (const std::string &graph_id,
                                                   component_sliver_t &requested,
                                                   const component_pool_t &pool)
{
    if (requested.network_services.empty ())
        return 0;
    const component_sliver_t *cand = pool.candidate;
    if (!cand || cand->network_services.empty ())
        return fail (EPROTO, "SmartNIC " + pool.name + " exposes no network service");

    network_service_sliver_t &req_ns = requested.network_services.begin ()->second;
    const network_service_sliver_t &cand_ns = cand->network_services.begin ()->second;
    if (req_ns.interfaces.size () > cand_ns.interfaces.size ()) {
        std::ostringstream out;
        out << "SmartNIC " << pool.name << " exposes " << cand_ns.interfaces.size ()
            << " ports, " << req_ns.interfaces.size () << " requested";
        return fail (EPROTO, out.str ());
    }

    auto cand_it = cand_ns.interfaces.begin ();
    for (auto &kv : req_ns.interfaces) {
        interface_sliver_t &req_ifs = kv.second;
        const interface_sliver_t &cand_ifs = (cand_it++)->second;
        const labels_t &port = label_pool (cand_ifs);

        labels_t lab;
        lab.bdf = port.bdf;
        lab.mac = port.mac;
        lab.local_name = port.local_name;
        if (req_ns.layer == ns_layer_t::L2) {
            lab.vlan = req_ifs.labels.vlan;
            lab.ipv4 = req_ifs.labels.ipv4;
            lab.ipv6 = req_ifs.labels.ipv6;
        }
        req_ifs.labels.merge (lab);
        req_ifs.label_allocations = lab;
        req_ifs.node_map = node_map_t (graph_id, cand_ifs.node_id);
    }
    req_ns.node_map = node_map_t (graph_id, cand_ns.node_id);
    return 0;
}

int network_node_inventory_t::bind_shared_nic (const std::string &graph_id,
                                               component_sliver_t &requested,
                                               component_pool_t &pool)
{
    const component_sliver_t *cand = pool.candidate;
    if (!cand || cand->network_services.size () != 1
        || cand->network_services.begin ()->second.interfaces.size () != 1)
        return fail (EPROTO,
                     "shared NIC " + pool.name
                         + " must expose exactly one network service with one interface");
    if (requested.network_services.empty ()
        || requested.network_services.begin ()->second.interfaces.empty ())
        return fail (EPROTO,
                     "requested shared NIC " + requested.name + " carries no interface");

    const network_service_sliver_t &cand_ns = cand->network_services.begin ()->second;
    const interface_sliver_t &cand_ifs = cand_ns.interfaces.begin ()->second;
    network_service_sliver_t &req_ns = requested.network_services.begin ()->second;
    interface_sliver_t &req_ifs = req_ns.interfaces.begin ()->second;

    const labels_t &vf = pool.labels;
    const size_t n = vf.bdf.size ();
    size_t idx = 0;
    const std::string &wanted = labels_t::first (req_ifs.labels.vlan);
    if (!wanted.empty () && vf.vlan.size () == n) {
        auto it = std::find (vf.vlan.begin (), vf.vlan.end (), wanted);
        if (it != vf.vlan.end ())
            idx = it - vf.vlan.begin ();
    }

    std::string bdf = vf.bdf[idx];
    std::string mac = vf.mac.size () == n ? vf.mac[idx] : labels_t::first (vf.mac);
    std::string vlan = vf.vlan.size () == n ? vf.vlan[idx] : "";
    std::string numa = vf.numa.size () == n ? vf.numa[idx] : labels_t::first (vf.numa);

    labels_t dev;
    dev.bdf = {bdf};
    if (!mac.empty ())
        dev.mac = {mac};
    if (!numa.empty ())
        dev.numa = {numa};
    if (!vlan.empty ())
        dev.vlan = {vlan};
    requested.label_allocations = dev;
    requested.capacity_allocations = capacities_t{{CAP_UNIT, 1}};
    requested.node_map = node_map_t (graph_id, pool.node_id);
    if (requested.model.empty ())
        requested.model = pool.model;

    labels_t port;
    port.bdf = dev.bdf;
    port.mac = dev.mac;
    port.local_name = label_pool (cand_ifs).local_name;
    if (!vlan.empty () && pool.model != m_opts.get_vnic_model ())
        port.vlan = {vlan};
    if (req_ns.layer == ns_layer_t::L2) {
        port.ipv4 = req_ifs.labels.ipv4;
        port.ipv6 = req_ifs.labels.ipv6;
    }
    req_ifs.labels.merge (port);
    req_ifs.label_allocations = port;
    req_ifs.node_map = node_map_t (graph_id, cand_ifs.node_id);
    req_ns.node_map = node_map_t (graph_id, cand_ns.node_id);

    log (LOG_DEBUG,
         "bound %s to %s of %s",
         requested.name.c_str (),
         bdf.c_str (),
         pool.name.c_str ());
    remove_bdf (pool, bdf);
    return 0;
}

int network_node_inventory_t::revalidate_component (
    const component_sliver_t &requested,
    std::map<std::string, component_pool_t> &pools,
    bool strict)
{
    const std::string &node_id = requested.node_map->second;
    auto it = std::find_if (pools.begin (), pools.end (), [&node_id] (const auto &kv) {
        return kv.second.node_id == node_id;
    });
    if (requested.type == component_type_t::SHAREDNIC) {
        const std::string &bdf = labels_t::first (allocated_bdfs (requested));
        if (it != pools.end () && remove_bdf (it->second, bdf))
            return 0;
        if (!strict)
            return 0;
        return fail (ENOSPC,
                     "PCI device " + bdf + " of component " + requested.name + " is in use");
    }
    if (it != pools.end ()) {
        pools.erase (it);
        return 0;
    }
    if (!strict)
        return 0;
    return fail (ENOSPC, "component " + requested.name + " (" + node_id + ") is in use");
}

int network_node_inventory_t::allocate_components (const std::string &graph_id,
                                                   node_sliver_t &requested,
                                                   reservation_operation_t op,
                                                   std::map<std::string, component_pool_t> &pools)
{
    // Components already bound keep their devices; take those out first
    // so that newly requested components cannot land on them.
    for (auto &kv : requested.components) {
        component_sliver_t &c = kv.second;
        if (!c.node_map || c.type == component_type_t::STORAGE)
            continue;
        if (revalidate_component (c, pools, op == reservation_operation_t::EXTEND) < 0)
            return -1;
    }

    for (auto &kv : requested.components) {
        component_sliver_t &c = kv.second;
        if (c.node_map)
            continue;
        if (c.type == component_type_t::STORAGE) {
            c.capacity_allocations = capacities_t{{CAP_UNIT, 1}};
            c.label_allocations = c.labels;
            continue;
        }
        component_pool_t *pool = find_pool (c, pools);
        if (!pool) {
            std::string what = component_type_to_string (c.type);
            if (!c.model.empty ())
                what += " " + c.model;
            return fail (ENOSPC, "no " + what + " available for " + c.name);
        }
        const std::string taken = pool->name;
        switch (c.type) {
            case component_type_t::SHAREDNIC:
                if (bind_shared_nic (graph_id, c, *pool) < 0)
                    return -1;
                break;
            case component_type_t::SMARTNIC:
                if (bind_whole (graph_id, c, *pool) < 0
                    || bind_smartnic_ports (graph_id, c, *pool) < 0)
                    return -1;
                pools.erase (taken);
                break;
            default:
                if (bind_whole (graph_id, c, *pool) < 0)
                    return -1;
                pools.erase (taken);
                break;
        }
    }
    return 0;
}

////////////////////////////////////////////////////////////////////////////////
// Public API of the Node Allocator
////////////////////////////////////////////////////////////////////////////////

network_node_inventory_t::network_node_inventory_t (flux_t *h,
                                                    const opts_manager::lease_opts_t &opts)
    : inventory_t (h, opts)
{
}

std::map<std::string, component_pool_t> network_node_inventory_t::available_components (
    const std::string &rid,
    const node_sliver_t &candidate,
    const std::vector<reservation_ref_t> &existing,
    const std::map<std::string, std::vector<std::string>> &existing_components) const
{
    std::map<std::string, component_pool_t> pools;
    std::map<std::string, std::string> by_id;

    for (const auto &kv : candidate.components) {
        const component_sliver_t &c = kv.second;
        component_pool_t pool;
        pool.name = c.name;
        pool.node_id = c.node_id;
        pool.type = c.type;
        pool.model = c.model;
        pool.candidate = &c;
        if (const delegation_t<labels_t> *ld = c.label_delegations.select ()) {
            pool.labels = ld->pool;
            pool.delegation_id = ld->delegation_id;
        } else {
            pool.labels = c.labels;
        }
        if (const delegation_t<capacities_t> *cd = c.capacity_delegations.select ()) {
            pool.capacities = cd->pool;
            if (pool.delegation_id.empty ())
                pool.delegation_id = cd->delegation_id;
        } else {
            pool.capacities = c.capacities;
        }
        by_id[c.node_id] = c.name;
        pools[c.name] = pool;
    }

    for (const node_sliver_t *n : held_nodes (rid, existing, true)) {
        if (n->node_map && n->node_map->second != candidate.node_id)
            continue;
        for (const auto &kv : n->components) {
            const component_sliver_t &c = kv.second;
            if (!c.node_map)
                continue;
            const std::string *name = component_name (by_id, c.node_map->second);
            if (!name || pools.find (*name) == pools.end ())
                continue;
            if (c.type == component_type_t::SHAREDNIC) {
                for (const auto &bdf : allocated_bdfs (c))
                    remove_bdf (pools[*name], bdf);
            } else {
                pools.erase (*name);
            }
        }
    }

    for (const auto &kv : existing_components) {
        const std::string *name = component_name (by_id, kv.first);
        if (!name || pools.find (*name) == pools.end ())
            continue;
        component_pool_t &pool = pools[*name];
        if (pool.type == component_type_t::SHAREDNIC) {
            for (const auto &bdf : kv.second)
                remove_bdf (pool, bdf);
        } else {
            pools.erase (*name);
        }
    }
    return pools;
}

int network_node_inventory_t::allocate (
    const std::string &rid,
    node_sliver_t &requested,
    const std::string &graph_id,
    const node_sliver_t &candidate,
    const std::vector<reservation_ref_t> &existing,
    const std::map<std::string, std::vector<std::string>> &existing_components,
    reservation_operation_t op,
    std::string &delegation_id)
{
    node_sliver_t sliver = requested;
    std::string did;

    if (check_node_types (sliver, candidate) < 0)
        return -1;
    if (check_capacities (rid, sliver, candidate, existing, did) < 0)
        return -1;

    if (sliver.type != node_type_t::SWITCH && !sliver.components.empty ()) {
        std::map<std::string, component_pool_t> pools =
            available_components (rid, candidate, existing, existing_components);
        if (allocate_components (graph_id, sliver, op, pools) < 0)
            return -1;
    }

    sliver.node_map = node_map_t (graph_id, candidate.node_id);
    sliver.capacity_allocations = sliver.capacities;
    if (op == reservation_operation_t::CREATE) {
        labels_t lab = sliver.labels;
        if (sliver.type == node_type_t::SWITCH)
            lab.local_name = {candidate.name};
        else
            lab.instance_parent = candidate.name;
        sliver.label_allocations = lab;
    }
    if (sliver.type == node_type_t::SWITCH)
        sliver.management_ip = candidate.management_ip;

    log (LOG_INFO,
         "%s: %s %s on %s (delegation %s)",
         rid.c_str (),
         reservation_operation_to_string (op),
         sliver.name.c_str (),
         candidate.name.c_str (),
         did.c_str ());
    requested = std::move (sliver);
    delegation_id = did;
    return 0;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
