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
#include <set>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>

#include "resource/inventory/network_service_inventory.hpp"
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

network_service_sliver_t delegated_service (const std::string &name,
                                            service_type_t type,
                                            const labels_t &pool)
{
    network_service_sliver_t ns;
    ns.name = name;
    ns.node_id = name + "-id";
    ns.type = type;
    ns.label_delegations.add ("D1", pool);
    return ns;
}

node_sliver_t data_switch (const std::string &v4_subnet)
{
    node_sliver_t sw;
    sw.name = "renc-data-sw";
    sw.node_id = "SW1";
    sw.type = node_type_t::SWITCH;

    labels_t mpls;
    mpls.vlan_range = {"100-200"};
    labels_t v4;
    v4.ipv4_subnet = v4_subnet;
    v4.vlan_range = {"2100-2102"};
    labels_t v6;
    v6.ipv6_subnet = "2602:fcfb:1d::/48";
    v6.vlan_range = {"2200-2299"};
    sw.network_services["mpls"] = delegated_service ("mpls", service_type_t::MPLS, mpls);
    sw.network_services["v4"] = delegated_service ("v4", service_type_t::FABNETV4, v4);
    sw.network_services["v6"] = delegated_service ("v6", service_type_t::FABNETV6, v6);
    return sw;
}

interface_sliver_t port (const std::string &type = "DedicatedPort")
{
    interface_sliver_t p;
    p.name = "HundredGigE0/0/0/5";
    p.node_id = "port5-id";
    p.type = type;
    labels_t l;
    l.vlan_range = {"100-150"};
    p.label_delegations.add ("D1", l);
    return p;
}

network_service_sliver_t request (service_type_t type,
                                  ns_layer_t layer,
                                  const std::vector<std::string> &ifs_names)
{
    network_service_sliver_t ns;
    ns.name = "svc";
    ns.type = type;
    ns.layer = layer;
    for (const auto &n : ifs_names) {
        interface_sliver_t ifs;
        ifs.name = n;
        ns.interfaces[n] = ifs;
    }
    return ns;
}

// An active reservation with one interface on port5 tagged with vlan.
reservation_ref_t vlan_holder (const std::string &rid, const std::string &vlan)
{
    network_service_sliver_t ns = request (service_type_t::L2BRIDGE, ns_layer_t::L2, {"i"});
    interface_sliver_t &ifs = ns.interfaces["i"];
    labels_t la;
    la.vlan = {vlan};
    ifs.label_allocations = la;
    ifs.node_map = node_map_t ("graph", "port5-id");
    return make_active (rid, ns);
}

reservation_ref_t subnet_holder (const std::string &rid, const std::string &subnet)
{
    network_service_sliver_t ns = request (service_type_t::FABNETV4, ns_layer_t::L3, {});
    labels_t gw;
    gw.ipv4_subnet = subnet;
    ns.gateway = gw;
    return make_active (rid, ns);
}

interface_sliver_t tagged (const std::string &vlan)
{
    interface_sliver_t ifs;
    ifs.name = "i";
    ifs.labels.vlan = {vlan};
    return ifs;
}

}  // namespace

TEST_CASE ("L2 VLAN validation", "[network_service_inventory_t]")
{
    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    node_sliver_t sw = data_switch ("10.133.0.0/16");
    const network_service_sliver_t *mpls = &sw.network_services["mpls"];
    network_service_sliver_t ns = request (service_type_t::L2BRIDGE, ns_layer_t::L2, {});
    std::vector<reservation_ref_t> existing;

    interface_sliver_t ifs = tagged ("120");
    REQUIRE (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) == 0);
    ok (ifs.label_allocations && labels_t::first (ifs.label_allocations->vlan) == "120",
        "vlan allocated");

    ifs = tagged ("150");
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) == 0,
        "upper end of the range is inclusive");

    ifs = tagged ("180");
    errno = 0;
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) < 0 && errno == EPROTO,
        "outside the port range");
    ok (inv.err_message ().find ("180") != std::string::npos, "message names the vlan");
    ok (inv.err_message ().find ("100-150") != std::string::npos, "message names the range");

    ifs = tagged ("250");
    errno = 0;
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) < 0 && errno == EPROTO,
        "outside the MPLS range");
    ok (!ifs.label_allocations, "failed request untouched");

    interface_sliver_t facility = port (FACILITY_PORT_TYPE);
    facility.label_delegations = delegations_t<labels_t> ();
    ifs = tagged ("250");
    ok (inv.allocate_interface (ns, ifs, sw, mpls, facility, existing) == 0,
        "facility ports skip the MPLS range");

    interface_sliver_t open_port = port ();
    open_port.label_delegations = delegations_t<labels_t> ();
    ifs = tagged ("4000");
    ok (inv.allocate_interface (ns, ifs, sw, nullptr, open_port, existing) == 0,
        "any vlan without delegations");

    ifs = tagged ("abc");
    errno = 0;
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) < 0 && errno == EINVAL,
        "malformed vlan");

    interface_sliver_t untagged;
    untagged.name = "i";
    ok (inv.allocate_interface (ns, untagged, sw, mpls, port (), existing) == 0
            && !untagged.label_allocations,
        "untagged interface passes through");
}

TEST_CASE ("L2 VLAN exclusivity", "[network_service_inventory_t]")
{
    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    node_sliver_t sw = data_switch ("10.133.0.0/16");
    const network_service_sliver_t *mpls = &sw.network_services["mpls"];
    network_service_sliver_t ns = request (service_type_t::L2BRIDGE, ns_layer_t::L2, {});
    std::vector<reservation_ref_t> existing = {vlan_holder ("r0", "120")};

    interface_sliver_t ifs = tagged ("120");
    errno = 0;
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) < 0 && errno == EPROTO,
        "vlan in use on the same port");
    ok (inv.err_message ().find ("r0") != std::string::npos, "message names the holder");

    ifs = tagged ("121");
    ok (inv.allocate_interface (ns, ifs, sw, mpls, port (), existing) == 0,
        "another vlan in range");

    interface_sliver_t other = port ();
    other.node_id = "port6-id";
    ifs = tagged ("120");
    ok (inv.allocate_interface (ns, ifs, sw, mpls, other, existing) == 0,
        "same vlan on another port");
}

TEST_CASE ("L3 VLAN assignment", "[network_service_inventory_t]")
{
    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    node_sliver_t sw = data_switch ("10.133.0.0/16");
    network_service_sliver_t ns = request (service_type_t::FABNETV4, ns_layer_t::L3, {});
    std::vector<reservation_ref_t> existing;

    interface_sliver_t ifs;
    ifs.name = "i";
    REQUIRE (inv.allocate_interface (ns, ifs, sw, nullptr, port (), existing) == 0);
    ok (labels_t::first (ifs.labels.vlan) == "2100", "first vlan of the range");
    ok (labels_t::first (ifs.label_allocations->vlan) == "2100", "allocation stamped");

    existing = {vlan_holder ("r0", "2100"), vlan_holder ("r1", "2102")};
    ifs = interface_sliver_t ();
    REQUIRE (inv.allocate_interface (ns, ifs, sw, nullptr, port (), existing) == 0);
    ok (labels_t::first (ifs.labels.vlan) == "2101", "vlans in use skipped");

    existing.push_back (vlan_holder ("r2", "2101"));
    ifs = interface_sliver_t ();
    errno = 0;
    ok (inv.allocate_interface (ns, ifs, sw, nullptr, port (), existing) < 0 && errno == ENOSPC,
        "exhausted range fails by default");

    lease_opts_t soft;
    REQUIRE (soft.set_vlan_exhaustion ("soft"));
    network_service_inventory_t lenient (nullptr, soft);
    ifs = interface_sliver_t ();
    ok (lenient.allocate_interface (ns, ifs, sw, nullptr, port (), existing) == 0
            && ifs.labels.vlan.empty (),
        "soft exhaustion leaves the interface untagged");

    network_service_sliver_t ext = request (service_type_t::FABNETV6EXT, ns_layer_t::L3, {});
    ifs = interface_sliver_t ();
    errno = 0;
    ok (inv.allocate_interface (ext, ifs, sw, nullptr, port (), existing) < 0 && errno == EPROTO,
        "switch without a service of the requested type");
}

TEST_CASE ("IPv4 subnet assignment", "[network_service_inventory_t]")
{
    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    node_sliver_t sw = data_switch ("10.133.0.0/16");
    std::vector<reservation_ref_t> existing;

    network_service_sliver_t ns =
        request (service_type_t::FABNETV4, ns_layer_t::L3, {"ifs-b", "ifs-a"});
    REQUIRE (inv.allocate ("r1", ns, sw, existing) == 0);
    REQUIRE (ns.gateway);
    ok (ns.gateway->ipv4_subnet == "10.133.1.0/24", "first sub-block after the reserved one");
    ok (labels_t::first (ns.gateway->ipv4) == "10.133.1.1", "gateway is the first host");
    ok (ns.label_allocations && ns.label_allocations->ipv4_subnet == "10.133.1.0/24",
        "gateway merged into allocations");
    ok (labels_t::first (ns.interfaces["ifs-a"].labels.ipv4) == "10.133.1.2", "ifs-a");
    ok (labels_t::first (ns.interfaces["ifs-b"].label_allocations->ipv4) == "10.133.1.3",
        "ifs-b");

    std::set<std::string> seen;
    for (int i = 0; i < 5; ++i) {
        network_service_sliver_t next = request (service_type_t::FABNETV4, ns_layer_t::L3, {"x"});
        std::string rid = "n" + std::to_string (i);
        REQUIRE (inv.allocate (rid, next, sw, existing) == 0);
        seen.insert (next.gateway->ipv4_subnet);
        existing.push_back (make_active (rid, next));
    }
    ok (seen.size () == 5, "disjoint sub-blocks");
    ok (seen.count ("10.133.0.0/24") == 0, "reserved sub-block never handed out");

    network_service_sliver_t l2 = request (service_type_t::L2BRIDGE, ns_layer_t::L2, {"x"});
    ok (inv.allocate ("r9", l2, sw, existing) == 0 && !l2.gateway, "L2 services pass through");
}

TEST_CASE ("IPv4 subnet options and errors", "[network_service_inventory_t]")
{
    network_service_sliver_t ns = request (service_type_t::FABNETV4, ns_layer_t::L3, {"x"});

    lease_opts_t reserved;
    REQUIRE (reserved.set_reserved_subnets (3));
    network_service_inventory_t inv3 (nullptr, reserved);
    network_service_sliver_t a = ns;
    REQUIRE (inv3.allocate ("r1", a, data_switch ("10.133.0.0/16"), {}) == 0);
    ok (a.gateway->ipv4_subnet == "10.133.3.0/24", "three reserved sub-blocks");

    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    std::vector<reservation_ref_t> existing = {subnet_holder ("r0", "10.133.5.0/25")};
    network_service_sliver_t b = ns;
    errno = 0;
    ok (inv.allocate ("r1", b, data_switch ("10.133.0.0/16"), existing) < 0 && errno == EPROTO,
        "held subnet of another size");
    existing = {subnet_holder ("r0", "10.200.0.0/24")};
    errno = 0;
    ok (inv.allocate ("r1", b, data_switch ("10.133.0.0/16"), existing) < 0 && errno == EPROTO,
        "held subnet outside the delegation");
    ok (!b.gateway, "failed request untouched");

    node_sliver_t small = data_switch ("10.133.0.0/23");
    existing = {subnet_holder ("r0", "10.133.1.0/24")};
    errno = 0;
    ok (inv.allocate ("r1", b, small, existing) < 0 && errno == ENOSPC, "no sub-block left");

    lease_opts_t tiny;
    REQUIRE (tiny.set_ipv4_subnet_prefix (30));
    network_service_inventory_t inv30 (nullptr, tiny);
    network_service_sliver_t c = request (service_type_t::FABNETV4, ns_layer_t::L3, {"a", "b"});
    errno = 0;
    ok (inv30.allocate ("r1", c, data_switch ("10.133.0.0/16"), {}) < 0 && errno == ENOSPC,
        "a /30 holds a gateway and one interface");
    c.interfaces.erase ("b");
    ok (inv30.allocate ("r1", c, data_switch ("10.133.0.0/16"), {}) == 0
            && c.gateway->ipv4_subnet == "10.133.0.4/30",
        "one interface fits");

    node_sliver_t undelegated = data_switch ("");
    network_service_sliver_t d = ns;
    errno = 0;
    ok (inv.allocate ("r1", d, undelegated, {}) < 0 && errno == EINVAL, "no delegated subnet");
}

TEST_CASE ("IPv6 subnet assignment", "[network_service_inventory_t]")
{
    lease_opts_t opts;
    network_service_inventory_t inv (nullptr, opts);
    node_sliver_t sw = data_switch ("10.133.0.0/16");
    network_service_sliver_t ns = request (service_type_t::FABNETV6, ns_layer_t::L3, {"x"});

    REQUIRE (inv.allocate ("r1", ns, sw, {}) == 0);
    ok (ns.gateway->ipv6_subnet == "2602:fcfb:1d:1::/64", "first /64 after the reserved one");
    ok (labels_t::first (ns.gateway->ipv6) == "2602:fcfb:1d:1::1", "gateway");
    ok (labels_t::first (ns.interfaces["x"].labels.ipv6) == "2602:fcfb:1d:1::2", "interface");
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
