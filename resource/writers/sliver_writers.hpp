/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef SLIVER_WRITERS_HPP
#define SLIVER_WRITERS_HPP

#include <sstream>

extern "C" {
#include <jansson.h>
}

#include "resource/schema/sliver.hpp"

namespace Lease {
namespace resource_model {

/*! JSON writer for annotated slivers. The object carries the same keys
 *  the YAML reader accepts, with "kind" set to "node" or
 *  "network_service". Unset optional parts are left out.
 */
class sliver_writers_t {
   public:
    /*! \param s  sliver to emit.
     *  \param o  new JSON object on success; the caller owns it.
     *  \return   0 on success; -1 with errno set to ENOMEM on error.
     */
    int emit_json (const sliver_t &s, json_t **o) const;
    int emit (const sliver_t &s, std::stringstream &out) const;

    json_t *emit_node (const node_sliver_t &n) const;
    json_t *emit_network_service (const network_service_sliver_t &ns) const;
    json_t *emit_component (const component_sliver_t &c) const;
    json_t *emit_interface (const interface_sliver_t &ifs) const;
    json_t *emit_capacities (const capacities_t &c) const;
    json_t *emit_labels (const labels_t &l) const;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // SLIVER_WRITERS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
