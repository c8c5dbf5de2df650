/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef SLIVER_HPP
#define SLIVER_HPP

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <optional>

#include "resource/schema/capacities.hpp"
#include "resource/schema/labels.hpp"
#include "resource/schema/delegation.hpp"

namespace Lease {
namespace resource_model {

enum class node_type_t { SERVER, VM, SWITCH, FACILITY };

enum class component_type_t { GPU, SMARTNIC, SHAREDNIC, FPGA, NVME, STORAGE };

enum class service_type_t {
    P4,
    OVS,
    MPLS,
    L2PATH,
    L2STS,
    L2BRIDGE,
    FABNETV4,
    FABNETV6,
    FABNETV4EXT,
    FABNETV6EXT,
    PORTMIRROR
};

enum class ns_layer_t { L2, L3 };

enum class reservation_operation_t { CREATE, MODIFY, EXTEND };

//! (delegation graph id, substrate element id) an element is bound to
using node_map_t = std::pair<std::string, std::string>;

const char *const FACILITY_PORT_TYPE = "FacilityPort";

struct interface_sliver_t {
    std::string name;
    std::string node_id;
    std::string type;
    labels_t labels;
    std::optional<labels_t> label_allocations;
    capacities_t capacities;
    std::optional<capacities_t> capacity_allocations;
    delegations_t<labels_t> label_delegations;
    delegations_t<capacities_t> capacity_delegations;
    std::optional<node_map_t> node_map;
};

struct network_service_sliver_t {
    std::string name;
    std::string node_id;
    service_type_t type = service_type_t::L2BRIDGE;
    ns_layer_t layer = ns_layer_t::L2;
    labels_t labels;
    std::optional<labels_t> label_allocations;
    delegations_t<labels_t> label_delegations;
    delegations_t<capacities_t> capacity_delegations;
    std::optional<labels_t> gateway;
    std::map<std::string, interface_sliver_t> interfaces;
    std::optional<node_map_t> node_map;
};

struct component_sliver_t {
    std::string name;
    std::string node_id;
    component_type_t type = component_type_t::GPU;
    std::string model;
    capacities_t capacities;
    std::optional<capacities_t> capacity_allocations;
    labels_t labels;
    std::optional<labels_t> label_allocations;
    delegations_t<capacities_t> capacity_delegations;
    delegations_t<labels_t> label_delegations;
    std::map<std::string, network_service_sliver_t> network_services;
    std::optional<node_map_t> node_map;

    //! GPU, FPGA and NVME devices are bound whole to one reservation.
    bool is_dedicated () const;
};

struct node_sliver_t {
    std::string name;
    std::string node_id;
    node_type_t type = node_type_t::VM;
    std::string site;
    std::string management_ip;
    capacities_t capacities;
    std::optional<capacities_t> capacity_allocations;
    labels_t labels;
    std::optional<labels_t> label_allocations;
    delegations_t<capacities_t> capacity_delegations;
    delegations_t<labels_t> label_delegations;
    std::map<std::string, component_sliver_t> components;
    std::map<std::string, network_service_sliver_t> network_services;
    std::optional<node_map_t> node_map;
};

/*! A request-or-allocation descriptor for one resource. New kinds must be
 *  added here so that every std::visit over a sliver has to handle them.
 */
using sliver_t = std::variant<node_sliver_t, network_service_sliver_t>;

const char *node_type_to_string (node_type_t t);
const char *component_type_to_string (component_type_t t);
const char *service_type_to_string (service_type_t t);
const char *ns_layer_to_string (ns_layer_t l);
const char *reservation_operation_to_string (reservation_operation_t op);

/*! String to enum converters.
 *
 *  \return  0 on success; -1 with errno set to EINVAL on an unknown name.
 */
int string_to_node_type (const std::string &s, node_type_t &t);
int string_to_component_type (const std::string &s, component_type_t &t);
int string_to_service_type (const std::string &s, service_type_t &t);
int string_to_ns_layer (const std::string &s, ns_layer_t &l);

//! Name of the sliver regardless of its kind.
const std::string &sliver_name (const sliver_t &s);

}  // namespace resource_model
}  // namespace Lease

#endif  // SLIVER_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
