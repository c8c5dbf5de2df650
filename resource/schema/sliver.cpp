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
#include "resource/schema/sliver.hpp"

namespace Lease {
namespace resource_model {

namespace {

template<typename E, size_t N>
int lookup (const std::pair<E, const char *> (&tab)[N], const std::string &s, E &out)
{
    for (const auto &entry : tab) {
        if (s == entry.second) {
            out = entry.first;
            return 0;
        }
    }
    errno = EINVAL;
    return -1;
}

template<typename E, size_t N>
const char *reverse_lookup (const std::pair<E, const char *> (&tab)[N], E e)
{
    for (const auto &entry : tab) {
        if (entry.first == e)
            return entry.second;
    }
    return "unknown";
}

const std::pair<node_type_t, const char *> node_types[] = {
    {node_type_t::SERVER, "Server"},
    {node_type_t::VM, "VM"},
    {node_type_t::SWITCH, "Switch"},
    {node_type_t::FACILITY, "Facility"},
};

const std::pair<component_type_t, const char *> component_types[] = {
    {component_type_t::GPU, "GPU"},
    {component_type_t::SMARTNIC, "SmartNIC"},
    {component_type_t::SHAREDNIC, "SharedNIC"},
    {component_type_t::FPGA, "FPGA"},
    {component_type_t::NVME, "NVME"},
    {component_type_t::STORAGE, "Storage"},
};

const std::pair<service_type_t, const char *> service_types[] = {
    {service_type_t::P4, "P4"},
    {service_type_t::OVS, "OVS"},
    {service_type_t::MPLS, "MPLS"},
    {service_type_t::L2PATH, "L2Path"},
    {service_type_t::L2STS, "L2STS"},
    {service_type_t::L2BRIDGE, "L2Bridge"},
    {service_type_t::FABNETV4, "FABNetv4"},
    {service_type_t::FABNETV6, "FABNetv6"},
    {service_type_t::FABNETV4EXT, "FABNetv4Ext"},
    {service_type_t::FABNETV6EXT, "FABNetv6Ext"},
    {service_type_t::PORTMIRROR, "PortMirror"},
};

const std::pair<ns_layer_t, const char *> ns_layers[] = {
    {ns_layer_t::L2, "L2"},
    {ns_layer_t::L3, "L3"},
};

}  // namespace

bool component_sliver_t::is_dedicated () const
{
    switch (type) {
        case component_type_t::GPU:
        case component_type_t::FPGA:
        case component_type_t::NVME:
            return true;
        case component_type_t::SMARTNIC:
        case component_type_t::SHAREDNIC:
        case component_type_t::STORAGE:
            return false;
    }
    return false;
}

const char *node_type_to_string (node_type_t t)
{
    return reverse_lookup (node_types, t);
}

const char *component_type_to_string (component_type_t t)
{
    return reverse_lookup (component_types, t);
}

const char *service_type_to_string (service_type_t t)
{
    return reverse_lookup (service_types, t);
}

const char *ns_layer_to_string (ns_layer_t l)
{
    return reverse_lookup (ns_layers, l);
}

const char *reservation_operation_to_string (reservation_operation_t op)
{
    switch (op) {
        case reservation_operation_t::CREATE:
            return "create";
        case reservation_operation_t::MODIFY:
            return "modify";
        case reservation_operation_t::EXTEND:
            return "extend";
    }
    return "unknown";
}

int string_to_node_type (const std::string &s, node_type_t &t)
{
    return lookup (node_types, s, t);
}

int string_to_component_type (const std::string &s, component_type_t &t)
{
    return lookup (component_types, s, t);
}

int string_to_service_type (const std::string &s, service_type_t &t)
{
    return lookup (service_types, s, t);
}

int string_to_ns_layer (const std::string &s, ns_layer_t &l)
{
    return lookup (ns_layers, s, l);
}

const std::string &sliver_name (const sliver_t &s)
{
    return std::visit ([] (const auto &v) -> const std::string & { return v.name; }, s);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
