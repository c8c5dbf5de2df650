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
#include <cstdlib>
#include "resource/writers/sliver_writers.hpp"

namespace Lease {
namespace resource_model {

namespace {

int set_new (json_t *o, const char *key, json_t *v)
{
    if (!v)
        return -1;
    if (json_object_set_new (o, key, v) < 0) {
        errno = ENOMEM;
        return -1;
    }
    return 0;
}

json_t *string_array (const std::vector<std::string> &v)
{
    json_t *a = json_array ();
    if (!a)
        return nullptr;
    for (const auto &s : v) {
        if (json_array_append_new (a, json_string (s.c_str ())) < 0) {
            json_decref (a);
            return nullptr;
        }
    }
    return a;
}

json_t *node_map_json (const node_map_t &m)
{
    return json_pack ("[s s]", m.first.c_str (), m.second.c_str ());
}

template<typename T, typename F>
json_t *delegations_json (const delegations_t<T> &dels, F emit_pool)
{
    json_t *o = json_object ();
    if (!o)
        return nullptr;
    for (const auto &d : dels) {
        if (set_new (o, d.delegation_id.c_str (), emit_pool (d.pool)) < 0) {
            json_decref (o);
            return nullptr;
        }
    }
    return o;
}

template<typename T, typename F>
json_t *named_json (const std::map<std::string, T> &m, F emit_one)
{
    json_t *a = json_array ();
    if (!a)
        return nullptr;
    for (const auto &kv : m) {
        json_t *e = emit_one (kv.second);
        if (!e || json_array_append_new (a, e) < 0) {
            json_decref (a);
            return nullptr;
        }
    }
    return a;
}

json_t *done (json_t *o, int rc)
{
    if (rc < 0) {
        json_decref (o);
        errno = ENOMEM;
        return nullptr;
    }
    return o;
}

}  // namespace

json_t *sliver_writers_t::emit_capacities (const capacities_t &c) const
{
    json_t *o = json_object ();
    int rc = 0;
    if (!o)
        return nullptr;
    for (const auto &kv : c.fields ()) {
        if ((rc = set_new (o, kv.first.c_str (), json_integer (kv.second))) < 0)
            break;
    }
    return done (o, rc);
}

json_t *sliver_writers_t::emit_labels (const labels_t &l) const
{
    const std::pair<const char *, const std::vector<std::string> *> lists[] = {
        {"bdf", &l.bdf},
        {"mac", &l.mac},
        {"numa", &l.numa},
        {"vlan", &l.vlan},
        {"local_name", &l.local_name},
        {"ipv4", &l.ipv4},
        {"ipv6", &l.ipv6},
        {"vlan_range", &l.vlan_range},
    };
    const std::pair<const char *, const std::string *> scalars[] = {
        {"ipv4_subnet", &l.ipv4_subnet},
        {"ipv6_subnet", &l.ipv6_subnet},
        {"device_name", &l.device_name},
        {"instance_parent", &l.instance_parent},
        {"region", &l.region},
    };
    json_t *o = json_object ();
    int rc = 0;
    if (!o)
        return nullptr;
    for (const auto &f : lists) {
        if (!f.second->empty () && (rc = set_new (o, f.first, string_array (*f.second))) < 0)
            return done (o, rc);
    }
    for (const auto &f : scalars) {
        if (!f.second->empty ()
            && (rc = set_new (o, f.first, json_string (f.second->c_str ()))) < 0)
            return done (o, rc);
    }
    return o;
}

json_t *sliver_writers_t::emit_interface (const interface_sliver_t &ifs) const
{
    json_t *o = nullptr;
    int rc = 0;
    if (!(o = json_pack ("{s:s s:s s:s}",
                         "name",
                         ifs.name.c_str (),
                         "node_id",
                         ifs.node_id.c_str (),
                         "type",
                         ifs.type.c_str ())))
        return nullptr;
    if (rc == 0 && !ifs.labels.empty ())
        rc = set_new (o, "labels", emit_labels (ifs.labels));
    if (rc == 0 && ifs.label_allocations)
        rc = set_new (o, "label_allocations", emit_labels (*ifs.label_allocations));
    if (rc == 0 && !ifs.capacities.empty ())
        rc = set_new (o, "capacities", emit_capacities (ifs.capacities));
    if (rc == 0 && ifs.capacity_allocations)
        rc = set_new (o, "capacity_allocations", emit_capacities (*ifs.capacity_allocations));
    if (rc == 0 && ifs.node_map)
        rc = set_new (o, "node_map", node_map_json (*ifs.node_map));
    return done (o, rc);
}

json_t *sliver_writers_t::emit_network_service (const network_service_sliver_t &ns) const
{
    json_t *o = nullptr;
    int rc = 0;
    if (!(o = json_pack ("{s:s s:s s:s s:s}",
                         "name",
                         ns.name.c_str (),
                         "node_id",
                         ns.node_id.c_str (),
                         "type",
                         service_type_to_string (ns.type),
                         "layer",
                         ns_layer_to_string (ns.layer))))
        return nullptr;
    if (rc == 0 && !ns.labels.empty ())
        rc = set_new (o, "labels", emit_labels (ns.labels));
    if (rc == 0 && ns.label_allocations)
        rc = set_new (o, "label_allocations", emit_labels (*ns.label_allocations));
    if (rc == 0 && ns.gateway)
        rc = set_new (o, "gateway", emit_labels (*ns.gateway));
    if (rc == 0 && !ns.label_delegations.empty ())
        rc = set_new (o,
                      "label_delegations",
                      delegations_json (ns.label_delegations,
                                        [this] (const labels_t &l) { return emit_labels (l); }));
    if (rc == 0 && !ns.interfaces.empty ())
        rc = set_new (o,
                      "interfaces",
                      named_json (ns.interfaces, [this] (const interface_sliver_t &i) {
                          return emit_interface (i);
                      }));
    if (rc == 0 && ns.node_map)
        rc = set_new (o, "node_map", node_map_json (*ns.node_map));
    return done (o, rc);
}

json_t *sliver_writers_t::emit_component (const component_sliver_t &c) const
{
    json_t *o = nullptr;
    int rc = 0;
    if (!(o = json_pack ("{s:s s:s s:s s:s}",
                         "name",
                         c.name.c_str (),
                         "node_id",
                         c.node_id.c_str (),
                         "type",
                         component_type_to_string (c.type),
                         "model",
                         c.model.c_str ())))
        return nullptr;
    if (rc == 0 && !c.capacities.empty ())
        rc = set_new (o, "capacities", emit_capacities (c.capacities));
    if (rc == 0 && c.capacity_allocations)
        rc = set_new (o, "capacity_allocations", emit_capacities (*c.capacity_allocations));
    if (rc == 0 && !c.labels.empty ())
        rc = set_new (o, "labels", emit_labels (c.labels));
    if (rc == 0 && c.label_allocations)
        rc = set_new (o, "label_allocations", emit_labels (*c.label_allocations));
    if (rc == 0 && !c.network_services.empty ())
        rc = set_new (o,
                      "network_services",
                      named_json (c.network_services, [this] (const network_service_sliver_t &ns) {
                          return emit_network_service (ns);
                      }));
    if (rc == 0 && c.node_map)
        rc = set_new (o, "node_map", node_map_json (*c.node_map));
    return done (o, rc);
}

json_t *sliver_writers_t::emit_node (const node_sliver_t &n) const
{
    json_t *o = nullptr;
    int rc = 0;
    if (!(o = json_pack ("{s:s s:s s:s s:s}",
                         "name",
                         n.name.c_str (),
                         "node_id",
                         n.node_id.c_str (),
                         "type",
                         node_type_to_string (n.type),
                         "site",
                         n.site.c_str ())))
        return nullptr;
    if (rc == 0 && !n.management_ip.empty ())
        rc = set_new (o, "management_ip", json_string (n.management_ip.c_str ()));
    if (rc == 0 && !n.capacities.empty ())
        rc = set_new (o, "capacities", emit_capacities (n.capacities));
    if (rc == 0 && n.capacity_allocations)
        rc = set_new (o, "capacity_allocations", emit_capacities (*n.capacity_allocations));
    if (rc == 0 && !n.labels.empty ())
        rc = set_new (o, "labels", emit_labels (n.labels));
    if (rc == 0 && n.label_allocations)
        rc = set_new (o, "label_allocations", emit_labels (*n.label_allocations));
    if (rc == 0 && !n.components.empty ())
        rc = set_new (o,
                      "components",
                      named_json (n.components, [this] (const component_sliver_t &c) {
                          return emit_component (c);
                      }));
    if (rc == 0 && !n.network_services.empty ())
        rc = set_new (o,
                      "network_services",
                      named_json (n.network_services, [this] (const network_service_sliver_t &ns) {
                          return emit_network_service (ns);
                      }));
    if (rc == 0 && n.node_map)
        rc = set_new (o, "node_map", node_map_json (*n.node_map));
    return done (o, rc);
}

int sliver_writers_t::emit_json (const sliver_t &s, json_t **o) const
{
    json_t *body = nullptr;
    const char *kind = nullptr;
    if (const node_sliver_t *n = std::get_if<node_sliver_t> (&s)) {
        kind = "node";
        body = emit_node (*n);
    } else {
        kind = "network_service";
        body = emit_network_service (std::get<network_service_sliver_t> (s));
    }
    if (!body || json_object_set_new (body, "kind", json_string (kind)) < 0) {
        json_decref (body);
        errno = ENOMEM;
        return -1;
    }
    *o = body;
    return 0;
}

int sliver_writers_t::emit (const sliver_t &s, std::stringstream &out) const
{
    json_t *o = nullptr;
    char *json_str = nullptr;
    if (emit_json (s, &o) < 0)
        return -1;
    if (!(json_str = json_dumps (o, JSON_INDENT (0) | JSON_SORT_KEYS))) {
        json_decref (o);
        errno = ENOMEM;
        return -1;
    }
    out << json_str << std::endl;
    free (json_str);
    json_decref (o);
    return 0;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
