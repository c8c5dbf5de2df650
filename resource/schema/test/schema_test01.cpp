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
#include <string>
#include <catch2/catch_test_macros.hpp>

#include "resource/schema/capacities.hpp"
#include "resource/schema/labels.hpp"
#include "resource/schema/sliver.hpp"
#include "resource/schema/test/reservation_fixture.hpp"

#define ok(EXPR, DESCR) \
    {                   \
        INFO (DESCR);   \
        CHECK ((EXPR)); \
    }

using namespace Lease::resource_model;
using namespace Lease::resource_model::test;

TEST_CASE ("capacity arithmetic", "[capacities_t]")
{
    capacities_t pool{{CAP_CORE, 32}, {CAP_RAM, 384}, {CAP_DISK, 500}};
    capacities_t req{{CAP_CORE, 4}, {CAP_RAM, 16}};

    capacities_t left = pool - req;
    ok (left.get (CAP_CORE) == 28, "core subtracted");
    ok (left.get (CAP_RAM) == 368, "ram subtracted");
    ok (left.get (CAP_DISK) == 500, "disk untouched");
    ok (left.negative_fields ().empty (), "no shortfall");
    ok (left + req == pool, "adding back restores the pool");

    capacities_t big{{CAP_CORE, 40}, {CAP_BW, 1}};
    std::vector<std::string> neg = (pool - big).negative_fields ();
    REQUIRE (neg.size () == 2);
    ok (neg[0] == CAP_BW && neg[1] == CAP_CORE, "negative fields are named in key order");

    ok ((capacities_t{{CAP_MTU, 0}} == capacities_t ()), "zero and absent compare equal");
    ok (!pool.has (CAP_UNIT), "unset field is absent");
    ok (pool.get (CAP_UNIT) == 0, "unset field reads as zero");
}

TEST_CASE ("capacity printing", "[capacities_t]")
{
    std::ostringstream out;
    out << capacities_t{{CAP_CPU, 1}, {CAP_CORE, 2}};
    ok (out.str () == "{core:2, cpu:1}", "printed in key order");
}

TEST_CASE ("label merge", "[labels_t]")
{
    labels_t a;
    a.bdf = {"0000:e2:00.1"};
    a.vlan = {"100"};
    labels_t b;
    b.vlan = {"200"};
    b.instance_parent = "renc-w1";

    a.merge (b);
    ok (a.bdf.size () == 1 && a.bdf[0] == "0000:e2:00.1", "unset fields kept");
    ok (labels_t::first (a.vlan) == "200", "set fields overwritten");
    ok (a.instance_parent == "renc-w1", "scalar fields merged");
    ok (labels_t::first (std::vector<std::string> ()).empty (), "first of empty list");
    ok (labels_t ().empty (), "default labels are empty");
    ok (!a.empty (), "merged labels are not empty");
}

TEST_CASE ("enum names", "[sliver_t]")
{
    node_type_t nt;
    component_type_t ct;
    service_type_t st;
    ns_layer_t l;

    ok (string_to_node_type ("Switch", nt) == 0 && nt == node_type_t::SWITCH, "node type");
    ok (string_to_component_type ("SharedNIC", ct) == 0 && ct == component_type_t::SHAREDNIC,
        "component type");
    ok (string_to_service_type ("FABNetv6", st) == 0 && st == service_type_t::FABNETV6,
        "service type");
    ok (string_to_ns_layer ("L3", l) == 0 && l == ns_layer_t::L3, "layer");
    errno = 0;
    ok (string_to_node_type ("Toaster", nt) < 0 && errno == EINVAL, "unknown name is EINVAL");
    ok (std::string (component_type_to_string (component_type_t::NVME)) == "NVME",
        "component type to string");

    component_sliver_t c;
    c.type = component_type_t::FPGA;
    ok (c.is_dedicated (), "FPGA is dedicated");
    c.type = component_type_t::SHAREDNIC;
    ok (!c.is_dedicated (), "shared NIC is not dedicated");
}

TEST_CASE ("allocated sliver of a reservation", "[reservation_t]")
{
    node_sliver_t held;
    held.name = "held";
    node_sliver_t approved;
    approved.name = "approved";
    node_sliver_t requested;
    requested.name = "requested";

    auto r = make_reservation ("r1");
    r->resources = held;
    r->approved = approved;
    r->requested = requested;
    ok (allocated_sliver (*r, true) == nullptr, "nascent reservation holds nothing");

    r->pending = reservation_pending_state_t::TICKETING;
    ok (sliver_name (*allocated_sliver (*r, false)) == "approved", "ticketing uses approved");

    r->state = reservation_state_t::ACTIVE;
    ok (sliver_name (*allocated_sliver (*r, false)) == "held", "active uses resources");

    r->pending = reservation_pending_state_t::EXTENDING_TICKET;
    ok (sliver_name (*allocated_sliver (*r, false)) == "held", "extension ignored");
    ok (sliver_name (*allocated_sliver (*r, true)) == "requested", "extension included");
    ok (r->is_active () && !r->is_ticketed () && r->is_extending_ticket (), "predicates");
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
