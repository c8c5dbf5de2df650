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

#include "resource/readers/sliver_reader_yaml.hpp"

namespace Lease {
namespace resource_model {

parse_error::parse_error (const char *msg)
    : runtime_error (msg), position (-1), line (-1), column (-1)
{
}

parse_error::parse_error (const YAML::Mark &mark, const std::string &msg)
    : runtime_error (msg), position (mark.pos), line (mark.line + 1), column (mark.column)
{
}

parse_error::parse_error (const YAML::Node &node, const std::string &msg)
    : parse_error (node.Mark (), msg)
{
}

namespace {

using list_field_t = std::vector<std::string> labels_t::*;
using scalar_field_t = std::string labels_t::*;

const std::pair<const char *, list_field_t> list_fields[] = {
    {"bdf", &labels_t::bdf},
    {"mac", &labels_t::mac},
    {"numa", &labels_t::numa},
    {"vlan", &labels_t::vlan},
    {"local_name", &labels_t::local_name},
    {"ipv4", &labels_t::ipv4},
    {"ipv6", &labels_t::ipv6},
    {"vlan_range", &labels_t::vlan_range},
};

const std::pair<const char *, scalar_field_t> scalar_fields[] = {
    {"ipv4_subnet", &labels_t::ipv4_subnet},
    {"ipv6_subnet", &labels_t::ipv6_subnet},
    {"device_name", &labels_t::device_name},
    {"instance_parent", &labels_t::instance_parent},
    {"region", &labels_t::region},
};

std::string get_scalar (const YAML::Node &parent, const char *key, bool required)
{
    const YAML::Node n = parent[key];
    if (!n) {
        if (required)
            throw parse_error (parent, std::string ("Key \"") + key + "\" missing");
        return "";
    }
    if (!n.IsScalar ())
        throw parse_error (n, std::string ("Value of \"") + key + "\" must be a scalar");
    return n.as<std::string> ();
}

std::vector<std::string> get_list (const YAML::Node &n, const std::string &key)
{
    std::vector<std::string> out;
    if (n.IsScalar ()) {
        out.push_back (n.as<std::string> ());
        return out;
    }
    if (!n.IsSequence ())
        throw parse_error (n, "Value of \"" + key + "\" must be a scalar or a sequence");
    for (const auto &e : n) {
        if (!e.IsScalar ())
            throw parse_error (e, "Entries of \"" + key + "\" must be scalars");
        out.push_back (e.as<std::string> ());
    }
    return out;
}

node_map_t get_node_map (const YAML::Node &n)
{
    if (!n.IsSequence () || n.size () != 2 || !n[0].IsScalar () || !n[1].IsScalar ())
        throw parse_error (n, "Value of \"node_map\" must be [graph id, node id]");
    return node_map_t (n[0].as<std::string> (), n[1].as<std::string> ());
}

template<typename T, typename F>
void read_delegations (const YAML::Node &n, delegations_t<T> &out, F read_pool)
{
    if (!n.IsMap ())
        throw parse_error (n, "delegations must map a delegation id to its pool");
    for (const auto &d : n) {
        if (!d.first.IsScalar ())
            throw parse_error (d.first, "delegation id must be a scalar");
        out.add (d.first.as<std::string> (), read_pool (d.second));
    }
}

template<typename T, typename F>
void read_named (const YAML::Node &n, const std::string &what, std::map<std::string, T> &out, F read_one)
{
    if (!n.IsSequence ())
        throw parse_error (n, "Value of \"" + what + "\" must be a sequence");
    for (const auto &e : n) {
        T t = read_one (e);
        std::string name = t.name;
        if (!out.emplace (name, std::move (t)).second)
            throw parse_error (e, "duplicate name " + name + " in \"" + what + "\"");
    }
}

void check_map (const YAML::Node &n, const char *what)
{
    if (!n.IsMap ())
        throw parse_error (n, std::string (what) + " is not a mapping");
}

}  // namespace

capacities_t read_capacities (const YAML::Node &node)
{
    capacities_t c;
    check_map (node, "capacities");
    for (const auto &kv : node) {
        if (!kv.first.IsScalar () || !kv.second.IsScalar ())
            throw parse_error (kv.first, "capacity entries must be scalars");
        try {
            c.set (kv.first.as<std::string> (), kv.second.as<int64_t> ());
        } catch (YAML::BadConversion &) {
            throw parse_error (kv.second,
                               "capacity " + kv.first.as<std::string> () + " must be an integer");
        }
    }
    return c;
}

labels_t read_labels (const YAML::Node &node)
{
    labels_t l;
    check_map (node, "labels");
    for (const auto &kv : node) {
        const std::string key = kv.first.as<std::string> ();
        bool known = false;
        for (const auto &f : list_fields) {
            if (key == f.first) {
                l.*(f.second) = get_list (kv.second, key);
                known = true;
            }
        }
        for (const auto &f : scalar_fields) {
            if (key == f.first) {
                if (!kv.second.IsScalar ())
                    throw parse_error (kv.second, "Value of \"" + key + "\" must be a scalar");
                l.*(f.second) = kv.second.as<std::string> ();
                known = true;
            }
        }
        if (!known)
            throw parse_error (kv.first, "Unknown label " + key);
    }
    return l;
}

interface_sliver_t read_interface_sliver (const YAML::Node &node)
{
    interface_sliver_t ifs;
    check_map (node, "interface");
    ifs.name = get_scalar (node, "name", true);
    ifs.node_id = get_scalar (node, "node_id", false);
    ifs.type = get_scalar (node, "type", false);
    if (node["labels"])
        ifs.labels = read_labels (node["labels"]);
    if (node["label_allocations"])
        ifs.label_allocations = read_labels (node["label_allocations"]);
    if (node["capacities"])
        ifs.capacities = read_capacities (node["capacities"]);
    if (node["capacity_allocations"])
        ifs.capacity_allocations = read_capacities (node["capacity_allocations"]);
    if (node["label_delegations"])
        read_delegations (node["label_delegations"], ifs.label_delegations, read_labels);
    if (node["capacity_delegations"])
        read_delegations (node["capacity_delegations"], ifs.capacity_delegations, read_capacities);
    if (node["node_map"])
        ifs.node_map = get_node_map (node["node_map"]);
    return ifs;
}

network_service_sliver_t read_network_service_sliver (const YAML::Node &node)
{
    network_service_sliver_t ns;
    check_map (node, "network service");
    ns.name = get_scalar (node, "name", true);
    ns.node_id = get_scalar (node, "node_id", false);

    std::string type = get_scalar (node, "type", true);
    if (string_to_service_type (type, ns.type) < 0)
        throw parse_error (node["type"], "Unknown network service type " + type);
    if (node["layer"]) {
        std::string layer = get_scalar (node, "layer", true);
        if (string_to_ns_layer (layer, ns.layer) < 0)
            throw parse_error (node["layer"], "Unknown network service layer " + layer);
    } else if (ns.type == service_type_t::FABNETV4 || ns.type == service_type_t::FABNETV6
               || ns.type == service_type_t::FABNETV4EXT
               || ns.type == service_type_t::FABNETV6EXT) {
        ns.layer = ns_layer_t::L3;
    }

    if (node["labels"])
        ns.labels = read_labels (node["labels"]);
    if (node["label_allocations"])
        ns.label_allocations = read_labels (node["label_allocations"]);
    if (node["label_delegations"])
        read_delegations (node["label_delegations"], ns.label_delegations, read_labels);
    if (node["capacity_delegations"])
        read_delegations (node["capacity_delegations"], ns.capacity_delegations, read_capacities);
    if (node["gateway"])
        ns.gateway = read_labels (node["gateway"]);
    if (node["interfaces"])
        read_named (node["interfaces"], "interfaces", ns.interfaces, read_interface_sliver);
    if (node["node_map"])
        ns.node_map = get_node_map (node["node_map"]);
    return ns;
}

component_sliver_t read_component_sliver (const YAML::Node &node)
{
    component_sliver_t c;
    check_map (node, "component");
    c.name = get_scalar (node, "name", true);
    c.node_id = get_scalar (node, "node_id", false);
    c.model = get_scalar (node, "model", false);

    std::string type = get_scalar (node, "type", true);
    if (string_to_component_type (type, c.type) < 0)
        throw parse_error (node["type"], "Unknown component type " + type);

    if (node["capacities"])
        c.capacities = read_capacities (node["capacities"]);
    if (node["capacity_allocations"])
        c.capacity_allocations = read_capacities (node["capacity_allocations"]);
    if (node["labels"])
        c.labels = read_labels (node["labels"]);
    if (node["label_allocations"])
        c.label_allocations = read_labels (node["label_allocations"]);
    if (node["capacity_delegations"])
        read_delegations (node["capacity_delegations"], c.capacity_delegations, read_capacities);
    if (node["label_delegations"])
        read_delegations (node["label_delegations"], c.label_delegations, read_labels);
    if (node["network_services"])
        read_named (node["network_services"],
                    "network_services",
                    c.network_services,
                    read_network_service_sliver);
    if (node["node_map"])
        c.node_map = get_node_map (node["node_map"]);
    return c;
}

node_sliver_t read_node_sliver (const YAML::Node &node)
{
    node_sliver_t n;
    check_map (node, "node");
    n.name = get_scalar (node, "name", true);
    n.node_id = get_scalar (node, "node_id", false);
    n.site = get_scalar (node, "site", false);
    n.management_ip = get_scalar (node, "management_ip", false);

    std::string type = get_scalar (node, "type", true);
    if (string_to_node_type (type, n.type) < 0)
        throw parse_error (node["type"], "Unknown node type " + type);

    if (node["capacities"])
        n.capacities = read_capacities (node["capacities"]);
    if (node["capacity_allocations"])
        n.capacity_allocations = read_capacities (node["capacity_allocations"]);
    if (node["labels"])
        n.labels = read_labels (node["labels"]);
    if (node["label_allocations"])
        n.label_allocations = read_labels (node["label_allocations"]);
    if (node["capacity_delegations"])
        read_delegations (node["capacity_delegations"], n.capacity_delegations, read_capacities);
    if (node["label_delegations"])
        read_delegations (node["label_delegations"], n.label_delegations, read_labels);
    if (node["components"])
        read_named (node["components"], "components", n.components, read_component_sliver);
    if (node["network_services"])
        read_named (node["network_services"],
                    "network_services",
                    n.network_services,
                    read_network_service_sliver);
    if (node["node_map"])
        n.node_map = get_node_map (node["node_map"]);
    return n;
}

sliver_t read_sliver_yaml (const std::string &document)
{
    YAML::Node root;
    try {
        root = YAML::Load (document);
    } catch (YAML::ParserException &e) {
        throw parse_error (e.mark, e.msg);
    }
    if (!root.IsMap ())
        throw parse_error (root, "sliver document is not a mapping");
    if (root["node"])
        return read_node_sliver (root["node"]);
    if (root["network_service"])
        return read_network_service_sliver (root["network_service"]);
    throw parse_error (root, "Key \"node\" or \"network_service\" missing");
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
