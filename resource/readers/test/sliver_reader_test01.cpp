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
#include <jansson.h>
}

#include <sstream>
#include <string>
#include <catch2/catch_test_macros.hpp>

#include "resource/readers/sliver_reader_yaml.hpp"
#include "resource/writers/sliver_writers.hpp"

#define ok(EXPR, DESCR) \
    {                   \
        INFO (DESCR);   \
        CHECK ((EXPR)); \
    }

using namespace Lease::resource_model;

static const char *server_yaml = R"(
node:
  name: renc-w1
  node_id: HX6VQ53
  type: Server
  site: RENC
  capacity_delegations:
    primary: {core: 32, ram: 384, disk: 3000}
  components:
    - name: gpu0
      node_id: gpu0-id
      type: GPU
      model: Tesla T4
      capacity_delegations:
        primary: {unit: 1}
      label_delegations:
        primary: {bdf: "0000:25:00.0"}
    - name: nic1
      node_id: nic1-id
      type: SharedNIC
      model: ConnectX-6
      label_delegations:
        primary:
          bdf: ["0000:e2:00.1", "0000:e2:00.2"]
          vlan: ["1001", "1002"]
      network_services:
        - name: nic1-l2ovs
          type: OVS
          interfaces:
            - name: nic1-p1
              node_id: nic1-p1-id
              labels: {local_name: p1}
)";

static const char *service_yaml = R"(
network_service:
  name: svc
  type: FABNetv4
  interfaces:
    - name: ifs-a
      labels: {vlan: 2100}
      node_map: [graph, port5-id]
)";

TEST_CASE ("read a substrate node", "[sliver_reader_yaml]")
{
    sliver_t s = read_sliver_yaml (server_yaml);
    REQUIRE (std::holds_alternative<node_sliver_t> (s));
    const node_sliver_t &n = std::get<node_sliver_t> (s);

    ok (n.name == "renc-w1" && n.node_id == "HX6VQ53", "names");
    ok (n.type == node_type_t::SERVER && n.site == "RENC", "type and site");
    REQUIRE (n.capacity_delegations.select ());
    ok (n.capacity_delegations.select ()->delegation_id == "primary", "delegation id");
    ok (n.capacity_delegations.select ()->pool.get (CAP_RAM) == 384, "delegated ram");
    ok (n.components.size () == 2, "two components");

    const component_sliver_t &nic = n.components.at ("nic1");
    ok (nic.type == component_type_t::SHAREDNIC && nic.model == "ConnectX-6", "shared NIC");
    ok (nic.label_delegations.select ()->pool.bdf.size () == 2, "two functions");
    const network_service_sliver_t &ovs = nic.network_services.at ("nic1-l2ovs");
    ok (ovs.type == service_type_t::OVS && ovs.layer == ns_layer_t::L2, "L2 service");
    ok (labels_t::first (ovs.interfaces.at ("nic1-p1").labels.local_name) == "p1", "port");
}

TEST_CASE ("read a network service", "[sliver_reader_yaml]")
{
    sliver_t s = read_sliver_yaml (service_yaml);
    REQUIRE (std::holds_alternative<network_service_sliver_t> (s));
    const network_service_sliver_t &ns = std::get<network_service_sliver_t> (s);

    ok (ns.type == service_type_t::FABNETV4, "type");
    ok (ns.layer == ns_layer_t::L3, "FABNetv4 defaults to L3");
    const interface_sliver_t &ifs = ns.interfaces.at ("ifs-a");
    ok (labels_t::first (ifs.labels.vlan) == "2100", "scalar label read as a list");
    ok (ifs.node_map && ifs.node_map->second == "port5-id", "node map");
}

TEST_CASE ("malformed descriptors", "[sliver_reader_yaml]")
{
    CHECK_THROWS_AS (read_sliver_yaml ("node: {name: a, type: Toaster}"), parse_error);
    CHECK_THROWS_AS (read_sliver_yaml ("node: {type: VM}"), parse_error);
    CHECK_THROWS_AS (read_sliver_yaml ("other: {}"), parse_error);
    CHECK_THROWS_AS (read_sliver_yaml ("node: {name: a, type: VM, capacities: {core: lots}}"),
                     parse_error);
    CHECK_THROWS_AS (read_sliver_yaml ("node: {name: a, type: VM, labels: {colour: red}}"),
                     parse_error);
    CHECK_THROWS_AS (read_sliver_yaml ("node: [unterminated"), parse_error);

    try {
        read_sliver_yaml ("node:\n  name: a\n  type: VM\n  components:\n    - name: c\n"
                          "      type: Widget\n");
        FAIL ("unknown component type accepted");
    } catch (parse_error &e) {
        ok (e.line == 6, "error reported at the offending line");
        ok (std::string (e.what ()).find ("Widget") != std::string::npos, "names the type");
    }
}

TEST_CASE ("emit an annotated node", "[sliver_writers_t]")
{
    sliver_t s = read_sliver_yaml (server_yaml);
    node_sliver_t &n = std::get<node_sliver_t> (s);
    n.capacity_allocations = capacities_t{{CAP_CORE, 2}};
    n.node_map = node_map_t ("graph", "HX6VQ53");

    sliver_writers_t writer;
    std::stringstream out;
    REQUIRE (writer.emit (s, out) == 0);

    json_t *o = json_loads (out.str ().c_str (), 0, nullptr);
    REQUIRE (o);
    const char *kind = nullptr;
    const char *name = nullptr;
    json_int_t core = 0;
    json_t *components = nullptr;
    json_t *node_map = nullptr;
    ok (json_unpack (o,
                     "{s:s s:s s:{s:I} s:o s:o}",
                     "kind",
                     &kind,
                     "name",
                     &name,
                     "capacity_allocations",
                     "core",
                     &core,
                     "components",
                     &components,
                     "node_map",
                     &node_map)
            == 0,
        "emitted keys");
    ok (std::string (kind) == "node" && std::string (name) == "renc-w1", "kind and name");
    ok (core == 2, "capacity allocation");
    ok (json_array_size (components) == 2, "components emitted");
    ok (std::string (json_string_value (json_array_get (node_map, 1))) == "HX6VQ53", "node map");
    ok (!json_object_get (o, "label_allocations"), "unset allocations left out");
    json_decref (o);
}

TEST_CASE ("emit a network service", "[sliver_writers_t]")
{
    sliver_t s = read_sliver_yaml (service_yaml);
    network_service_sliver_t &ns = std::get<network_service_sliver_t> (s);
    labels_t gw;
    gw.ipv4_subnet = "10.133.1.0/24";
    gw.ipv4 = {"10.133.1.1"};
    ns.gateway = gw;

    sliver_writers_t writer;
    json_t *o = nullptr;
    REQUIRE (writer.emit_json (s, &o) == 0);
    const char *kind = nullptr;
    const char *layer = nullptr;
    const char *subnet = nullptr;
    ok (json_unpack (o,
                     "{s:s s:s s:{s:s}}",
                     "kind",
                     &kind,
                     "layer",
                     &layer,
                     "gateway",
                     "ipv4_subnet",
                     &subnet)
            == 0,
        "emitted keys");
    ok (std::string (kind) == "network_service" && std::string (layer) == "L3", "kind and layer");
    ok (std::string (subnet) == "10.133.1.0/24", "gateway subnet");
    ok (json_array_size (json_object_get (o, "interfaces")) == 1, "interfaces emitted");
    json_decref (o);
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
