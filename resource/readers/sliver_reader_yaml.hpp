/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef SLIVER_READER_YAML_HPP
#define SLIVER_READER_YAML_HPP

#include <string>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "resource/schema/sliver.hpp"

namespace Lease {
namespace resource_model {

class parse_error : public std::runtime_error {
   public:
    int position;
    int line;
    int column;
    parse_error (const char *msg);
    parse_error (const YAML::Mark &mark, const std::string &msg);
    parse_error (const YAML::Node &node, const std::string &msg);
};

/*! Build slivers from YAML descriptors. A document is a mapping with
 *  either a "node" or a "network_service" key:
 *
 *    node:
 *      name: renc-w1
 *      node_id: HX6VQ53
 *      type: Server
 *      capacity_delegations:
 *        primary: {core: 32, ram: 384}
 *      components:
 *        - name: gpu0
 *          type: GPU
 *          model: Tesla T4
 *          ...
 *
 *  Every reader throws parse_error on malformed input.
 */
sliver_t read_sliver_yaml (const std::string &document);
node_sliver_t read_node_sliver (const YAML::Node &node);
network_service_sliver_t read_network_service_sliver (const YAML::Node &node);
component_sliver_t read_component_sliver (const YAML::Node &node);
interface_sliver_t read_interface_sliver (const YAML::Node &node);
capacities_t read_capacities (const YAML::Node &node);
labels_t read_labels (const YAML::Node &node);

}  // namespace resource_model
}  // namespace Lease

#endif  // SLIVER_READER_YAML_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
