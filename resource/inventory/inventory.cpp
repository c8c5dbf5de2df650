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
#include <cstdarg>
#include "resource/inventory/inventory.hpp"

namespace Lease {
namespace resource_model {

inventory_t::inventory_t (flux_t *h, const opts_manager::lease_opts_t &opts)
    : m_h (h), m_opts (opts)
{
}

const std::string &inventory_t::err_message () const
{
    return m_err_msg;
}

void inventory_t::clear_err_message ()
{
    m_err_msg = "";
}

void inventory_t::log (int level, const char *fmt, ...) const
{
    va_list ap;
    if (!m_h)
        return;
    va_start (ap, fmt);
    flux_vlog (m_h, level, fmt, ap);
    va_end (ap);
}

int inventory_t::fail (int errnum, const std::string &msg)
{
    m_err_msg += msg + "\n";
    log (LOG_ERR, "%s", msg.c_str ());
    errno = errnum;
    return -1;
}

std::vector<const node_sliver_t *> inventory_t::held_nodes (
    const std::string &rid,
    const std::vector<reservation_ref_t> &existing,
    bool include_extending) const
{
    std::vector<const node_sliver_t *> held;
    for (const auto &r : existing) {
        if (!r || r->get_reservation_id () == rid)
            continue;
        const sliver_t *s = allocated_sliver (*r, include_extending);
        if (!s)
            continue;
        if (const node_sliver_t *n = std::get_if<node_sliver_t> (s)) {
            log (LOG_DEBUG,
                 "existing reservation %s holds %s",
                 r->get_reservation_id ().c_str (),
                 n->name.c_str ());
            held.push_back (n);
        }
    }
    return held;
}

std::vector<std::pair<std::string, const network_service_sliver_t *>> inventory_t::held_services (
    const std::string &rid,
    const std::vector<reservation_ref_t> &existing) const
{
    std::vector<std::pair<std::string, const network_service_sliver_t *>> held;
    for (const auto &r : existing) {
        if (!r || r->get_reservation_id () == rid)
            continue;
        const sliver_t *s = allocated_sliver (*r, false);
        if (!s)
            continue;
        if (const network_service_sliver_t *ns = std::get_if<network_service_sliver_t> (s))
            held.emplace_back (r->get_reservation_id (), ns);
    }
    return held;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
