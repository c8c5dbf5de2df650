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
#include <map>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>

#include "resource/inventory/network_node_inventory.hpp"
#include "resource/schema/test/reservation_fixture.hpp"

#define ok(EXPR, DESCR) \
    {                   \
        INFO (DESCR);   \
        CHECK ((EXPR)); \
    }

using namespace Lease::resource_model;
using namespace Lease::resource_model::test;
using Lease::opts_manager::lease_opts_t;

namespace {

const std::map<std::string, std::vector<std::string>> no_components;

node_sliver_t server (const capacities_t &pool)
{
    node_sliver_t n;
    n.name = "renc-w1";
    n.node_id = "HX1";
    n.type = node_type_t::SERVER;
    n.site = "RENC";
    n.capacity_delegations.add ("D1", pool);
    return n;
}

node_sliver_t vm (const std::string &name, const capacities_t &caps)
{
    node_sliver_t n;
    n.name = name;
    n.type = node_type_t::VM;
    n.capacities = caps;
    return n;
}

component_sliver_t gpu (const std::string &name)
{
    component_sliver_t c;
    c.name = name;
    c.node_id = name + "-id";
    c.type = component_type_t::GPU;
    c.model = "Tesla T4";
    c.capacity_delegations.add ("D1", capacities_t{{CAP_UNIT, 1}});
    labels_t l;
    l.bdf = {name == "gpu0" ? "0000:25:00.0" : "0000:81:00.0"};
    c.label_delegations.add ("D1", l);
    return c;
}

component_sliver_t shared_nic (const std::string &model)
{
    component_sliver_t c;
    c.name = "nic1";
    c.node_id = "nic1-id";
    c.type = component_type_t::SHAREDNIC;
    c.model = model;
    labels_t vf;
    vf.bdf = {"0000:e2:00.1", "0000:e2:00.2", "0000:e2:00.3"};
    vf.mac = {"0A:00:00:00:00:01", "0A:00:00:00:00:02", "0A:00:00:00:00:03"};
    vf.vlan = {"1001", "1002", "1003"};
    c.label_delegations.add ("D1", vf);
    c.capacity_delegations.add ("D1", capacities_t{{CAP_UNIT, 3}});

    interface_sliver_t port;
    port.name = "nic1-p1";
    port.node_id = "nic1-p1-id";
    port.labels.local_name = {"p1"};
    network_service_sliver_t ns;
    ns.name = "nic1-l2ovs";
    ns.node_id = "nic1-l2ovs-id";
    ns.type = service_type_t::OVS;
    ns.interfaces[port.name] = port;
    c.network_services[ns.name] = ns;
    return c;
}

component_sliver_t nic_request (const std::string &name,
                                component_type_t type,
                                size_t ports,
                                const std::string &vlan)
{
    component_sliver_t c;
    c.name = name;
    c.type = type;
    network_service_sliver_t ns;
    ns.name = name + "-ns";
    ns.layer = ns_layer_t::L2;
    for (size_t i = 0; i < ports; ++i) {
        interface_sliver_t ifs;
        ifs.name = name + "-p" + std::to_string (i + 1);
        if (!vlan.empty ())
            ifs.labels.vlan = {vlan};
        ns.interfaces[ifs.name] = ifs;
    }
    if (ports)
        c.network_services[ns.name] = ns;
    return c;
}

// A reservation already holding the given node sliver on renc-w1.
reservation_ref_t holder (const std::string &rid, node_sliver_t held)
{
    held.node_map = node_map_t ("graph", "HX1");
    return make_active (rid, held);
}

}  // namespace

TEST_CASE ("capacity check against existing reservations", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    node_sliver_t candidate = server (capacities_t{{CAP_CPU, 4}});
    std::vector<reservation_ref_t> existing = {
        holder ("r0", vm ("held", capacities_t{{CAP_CPU, 1}}))};
    std::string did;

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CPU, 3}});
    REQUIRE (inv.allocate ("r1",
                           req,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    ok (did == "D1", "delegation id of the capacity pool");
    ok ((req.capacity_allocations == capacities_t{{CAP_CPU, 3}}), "capacity allocations");
    ok (req.node_map && req.node_map->first == "graph" && req.node_map->second == "HX1",
        "node map");
    ok (req.label_allocations && req.label_allocations->instance_parent == "renc-w1",
        "instance parent stamped");

    node_sliver_t big = vm ("vm2", capacities_t{{CAP_CPU, 4}});
    errno = 0;
    did = "";
    ok (inv.allocate ("r2",
                      big,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
            < 0,
        "one cpu too many");
    ok (errno == ENOSPC, "insufficient resources");
    ok (inv.err_message ().find ("cpu") != std::string::npos, "message names cpu");
    ok (!big.node_map && !big.capacity_allocations && did.empty (), "request left untouched");
}

TEST_CASE ("reservation is not charged against itself", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    node_sliver_t candidate = server (capacities_t{{CAP_CORE, 8}});
    std::vector<reservation_ref_t> existing = {
        holder ("r1", vm ("vm1", capacities_t{{CAP_CORE, 8}})),
        nullptr};
    std::string did;

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 8}});
    ok (inv.allocate ("r1",
                      req,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::MODIFY,
                      did)
            == 0,
        "own holding skipped");
    ok (!req.label_allocations, "labels are only stamped on create");

    auto extending = make_reservation ("r3");
    extending->state = reservation_state_t::ACTIVE;
    extending->pending = reservation_pending_state_t::EXTENDING_TICKET;
    node_sliver_t held = vm ("vm3", capacities_t{{CAP_CORE, 2}});
    held.node_map = node_map_t ("graph", "HX1");
    extending->resources = held;
    held.capacities = capacities_t{{CAP_CORE, 6}};
    extending->requested = held;
    existing = {extending};

    node_sliver_t req2 = vm ("vm4", capacities_t{{CAP_CORE, 3}});
    errno = 0;
    ok (inv.allocate ("r4",
                      req2,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == ENOSPC,
        "extending reservation charged its requested capacity");
}

TEST_CASE ("node type compatibility", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    std::vector<reservation_ref_t> existing;
    std::string did;

    node_sliver_t sw;
    sw.name = "renc-data-sw";
    sw.node_id = "SW1";
    sw.type = node_type_t::SWITCH;
    sw.management_ip = "192.168.11.3";
    sw.capacity_delegations.add ("D2", capacities_t{{CAP_BW, 100}});

    node_sliver_t p4;
    p4.name = "p4";
    p4.type = node_type_t::SWITCH;
    p4.capacities = capacities_t{{CAP_BW, 10}};
    node_sliver_t on_server = p4;
    errno = 0;
    ok (inv.allocate ("r1",
                      on_server,
                      "graph",
                      server (capacities_t{{CAP_BW, 100}}),
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EINVAL,
        "switch request on a server");

    REQUIRE (inv.allocate ("r1",
                           p4,
                           "graph",
                           sw,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    ok (did == "D2", "switch delegation");
    ok (p4.management_ip == "192.168.11.3", "management ip copied");
    ok (p4.label_allocations && labels_t::first (p4.label_allocations->local_name) == sw.name,
        "local name stamped");

    node_sliver_t vm1 = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    errno = 0;
    ok (inv.allocate ("r2",
                      vm1,
                      "graph",
                      sw,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EINVAL,
        "VM request on a switch");

    node_sliver_t bare = server (capacities_t{{CAP_CORE, 1}});
    bare.capacity_delegations = delegations_t<capacities_t> ();
    errno = 0;
    ok (inv.allocate ("r3",
                      vm1,
                      "graph",
                      bare,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EINVAL,
        "candidate without capacity delegation");
}

TEST_CASE ("dedicated components", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    node_sliver_t candidate = server (capacities_t{{CAP_CORE, 32}});
    candidate.components["gpu0"] = gpu ("gpu0");
    candidate.components["gpu1"] = gpu ("gpu1");

    node_sliver_t held = vm ("vm0", capacities_t{{CAP_CORE, 1}});
    component_sliver_t held_gpu;
    held_gpu.name = "held-gpu";
    held_gpu.type = component_type_t::GPU;
    held_gpu.node_map = node_map_t ("graph", "gpu0-id");
    held.components["held-gpu"] = held_gpu;
    std::vector<reservation_ref_t> existing = {holder ("r0", held)};
    std::string did;

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    component_sliver_t want;
    want.name = "g";
    want.type = component_type_t::GPU;
    want.model = "Tesla T4";
    req.components["g"] = want;

    REQUIRE (inv.allocate ("r1",
                           req,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    const component_sliver_t &got = req.components["g"];
    ok (got.node_map && got.node_map->second == "gpu1-id", "free GPU bound");
    ok (got.label_allocations && labels_t::first (got.label_allocations->bdf) == "0000:81:00.0",
        "GPU labels copied");
    ok (got.capacity_allocations && got.capacity_allocations->get (CAP_UNIT) == 1, "one unit");

    node_sliver_t two = vm ("vm2", capacities_t{{CAP_CORE, 1}});
    two.components["a"] = want;
    two.components["b"] = want;
    two.components["a"].name = "a";
    two.components["b"].name = "b";
    errno = 0;
    ok (inv.allocate ("r2",
                      two,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == ENOSPC,
        "only one GPU left");
    ok (!two.components["a"].node_map, "failed request untouched");

    node_sliver_t other = vm ("vm3", capacities_t{{CAP_CORE, 1}});
    other.components["g"] = want;
    other.components["g"].model = "A30";
    errno = 0;
    ok (inv.allocate ("r3",
                      other,
                      "graph",
                      candidate,
                      std::vector<reservation_ref_t> (),
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == ENOSPC,
        "model must match");

    node_sliver_t storage = vm ("vm4", capacities_t{{CAP_CORE, 1}});
    component_sliver_t vol;
    vol.name = "vol";
    vol.type = component_type_t::STORAGE;
    storage.components["vol"] = vol;
    REQUIRE (inv.allocate ("r4",
                           storage,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    ok (storage.components["vol"].capacity_allocations->get (CAP_UNIT) == 1, "storage unit");
}

TEST_CASE ("modify and extend of bound components", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    node_sliver_t candidate = server (capacities_t{{CAP_CORE, 32}});
    candidate.components["gpu0"] = gpu ("gpu0");
    std::string did;

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    component_sliver_t bound;
    bound.name = "g";
    bound.type = component_type_t::GPU;
    bound.node_map = node_map_t ("graph", "gpu0-id");
    req.components["g"] = bound;

    node_sliver_t thief = vm ("vm0", capacities_t{{CAP_CORE, 1}});
    thief.components["g"] = bound;
    std::vector<reservation_ref_t> existing = {holder ("r0", thief)};

    node_sliver_t modify = req;
    ok (inv.allocate ("r1",
                      modify,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::MODIFY,
                      did)
            == 0,
        "modify leaves bound components alone");

    node_sliver_t extend = req;
    errno = 0;
    ok (inv.allocate ("r1",
                      extend,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::EXTEND,
                      did)
                < 0
            && errno == ENOSPC,
        "extend fails when the GPU is used by another reservation");

    extend = req;
    ok (inv.allocate ("r1",
                      extend,
                      "graph",
                      candidate,
                      std::vector<reservation_ref_t> (),
                      no_components,
                      reservation_operation_t::EXTEND,
                      did)
            == 0,
        "extend succeeds when the GPU is still free");
}

TEST_CASE ("shared NIC virtual functions", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    node_sliver_t candidate = server (capacities_t{{CAP_CORE, 32}});
    candidate.components["nic1"] = shared_nic ("ConnectX-6");
    std::vector<reservation_ref_t> existing;
    std::string did;

    auto pools = inv.available_components ("r1", candidate, existing, no_components);
    REQUIRE (pools.count ("nic1") == 1);
    ok (pools["nic1"].labels.bdf.size () == 3, "three free functions");
    ok (pools["nic1"].delegation_id == "D1", "pool delegation id");

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    req.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 1, "1002");
    REQUIRE (inv.allocate ("r1",
                           req,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    const component_sliver_t &n = req.components["n"];
    ok (labels_t::first (n.label_allocations->bdf) == "0000:e2:00.2", "function of vlan 1002");
    const interface_sliver_t &ifs = n.network_services.begin ()->second.interfaces.begin ()->second;
    ok (ifs.label_allocations && labels_t::first (ifs.label_allocations->mac) == "0A:00:00:00:00:02",
        "mac propagated");
    ok (labels_t::first (ifs.label_allocations->vlan) == "1002", "vlan propagated");
    ok (labels_t::first (ifs.label_allocations->local_name) == "p1", "port name propagated");
    ok (ifs.node_map && ifs.node_map->second == "nic1-p1-id", "interface mapped to the port");

    existing.push_back (holder ("r1", req));
    pools = inv.available_components ("r2", candidate, existing, no_components);
    ok (pools["nic1"].labels.bdf.size () == 2, "one fewer free function");
    ok (pools["nic1"].capacities.get (CAP_UNIT) == 2, "one fewer unit");

    node_sliver_t req2 = vm ("vm2", capacities_t{{CAP_CORE, 1}});
    req2.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 1, "1002");
    REQUIRE (inv.allocate ("r2",
                           req2,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    ok (labels_t::first (req2.components["n"].label_allocations->bdf) != "0000:e2:00.2",
        "held function never handed out twice");

    std::map<std::string, std::vector<std::string>> in_use = {
        {"nic1-id", {"0000:e2:00.1", "0000:e2:00.3"}}};
    existing.push_back (holder ("r2", req2));
    pools = inv.available_components ("r3", candidate, existing, in_use);
    ok (pools["nic1"].labels.bdf.empty (), "functions used by network services excluded");

    node_sliver_t req3 = vm ("vm3", capacities_t{{CAP_CORE, 1}});
    req3.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 1, "");
    errno = 0;
    ok (inv.allocate ("r3",
                      req3,
                      "graph",
                      candidate,
                      existing,
                      in_use,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == ENOSPC,
        "no function left");
}

TEST_CASE ("shared NIC structure", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    std::vector<reservation_ref_t> existing;
    std::string did;

    node_sliver_t vnic = server (capacities_t{{CAP_CORE, 32}});
    vnic.components["nic1"] = shared_nic (opts.get_vnic_model ());
    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    req.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 1, "");
    REQUIRE (inv.allocate ("r1",
                           req,
                           "graph",
                           vnic,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    const interface_sliver_t &ifs =
        req.components["n"].network_services.begin ()->second.interfaces.begin ()->second;
    ok (ifs.label_allocations->vlan.empty (), "no vlan on OpenStack vNICs");
    ok (labels_t::first (req.components["n"].label_allocations->bdf) == "0000:e2:00.1",
        "first free function");

    node_sliver_t no_ns = vm ("vm2", capacities_t{{CAP_CORE, 1}});
    no_ns.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 0, "");
    errno = 0;
    ok (inv.allocate ("r2",
                      no_ns,
                      "graph",
                      vnic,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EPROTO,
        "requested shared NIC without interface");

    node_sliver_t broken = server (capacities_t{{CAP_CORE, 32}});
    component_sliver_t nic = shared_nic ("ConnectX-6");
    nic.network_services.clear ();
    broken.components["nic1"] = nic;
    node_sliver_t req3 = vm ("vm3", capacities_t{{CAP_CORE, 1}});
    req3.components["n"] = nic_request ("n", component_type_t::SHAREDNIC, 1, "");
    errno = 0;
    ok (inv.allocate ("r3",
                      req3,
                      "graph",
                      broken,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EPROTO,
        "candidate shared NIC without network service");
}

TEST_CASE ("SmartNIC ports", "[network_node_inventory_t]")
{
    lease_opts_t opts;
    network_node_inventory_t inv (nullptr, opts);
    std::vector<reservation_ref_t> existing;
    std::string did;

    component_sliver_t smart;
    smart.name = "nic2";
    smart.node_id = "nic2-id";
    smart.type = component_type_t::SMARTNIC;
    smart.model = "ConnectX-5";
    smart.capacity_delegations.add ("D1", capacities_t{{CAP_UNIT, 1}});
    network_service_sliver_t ns;
    ns.name = "nic2-l2ovs";
    ns.node_id = "nic2-l2ovs-id";
    for (int i = 1; i <= 2; ++i) {
        interface_sliver_t port;
        port.name = "nic2-p" + std::to_string (i);
        port.node_id = port.name + "-id";
        labels_t l;
        l.local_name = {"p" + std::to_string (i)};
        l.mac = {"0C:00:00:00:00:0" + std::to_string (i)};
        port.label_delegations.add ("D1", l);
        ns.interfaces[port.name] = port;
    }
    smart.network_services[ns.name] = ns;
    node_sliver_t candidate = server (capacities_t{{CAP_CORE, 32}});
    candidate.components["nic2"] = smart;

    node_sliver_t req = vm ("vm1", capacities_t{{CAP_CORE, 1}});
    req.components["s"] = nic_request ("s", component_type_t::SMARTNIC, 2, "300");
    REQUIRE (inv.allocate ("r1",
                           req,
                           "graph",
                           candidate,
                           existing,
                           no_components,
                           reservation_operation_t::CREATE,
                           did)
             == 0);
    const network_service_sliver_t &got = req.components["s"].network_services.begin ()->second;
    const interface_sliver_t &p1 = got.interfaces.at ("s-p1");
    const interface_sliver_t &p2 = got.interfaces.at ("s-p2");
    ok (p1.node_map->second == "nic2-p1-id" && p2.node_map->second == "nic2-p2-id",
        "ports paired in name order");
    ok (labels_t::first (p2.label_allocations->mac) == "0C:00:00:00:00:02", "port mac");
    ok (labels_t::first (p1.label_allocations->vlan) == "300", "L2 vlan propagated");
    ok (req.components["s"].node_map->second == "nic2-id", "whole SmartNIC bound");

    node_sliver_t three = vm ("vm2", capacities_t{{CAP_CORE, 1}});
    three.components["s"] = nic_request ("s", component_type_t::SMARTNIC, 3, "");
    errno = 0;
    ok (inv.allocate ("r2",
                      three,
                      "graph",
                      candidate,
                      existing,
                      no_components,
                      reservation_operation_t::CREATE,
                      did)
                < 0
            && errno == EPROTO,
        "more ports requested than exposed");
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
