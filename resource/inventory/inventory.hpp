/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef INVENTORY_HPP
#define INVENTORY_HPP

extern "C" {
#include <flux/core.h>
}

#include <string>
#include <vector>
#include "resource/schema/sliver.hpp"
#include "resource/schema/reservation.hpp"
#include "resource/config/lease_opts.hpp"

namespace Lease {
namespace resource_model {

/*! Base of the substrate allocators. An allocator is a pure function of
 *  its arguments: it never retries and never falls back to another
 *  candidate; that is up to the calling policy.
 *
 *  Errors are reported as -1 with errno set:
 *    EINVAL  malformed or missing required input
 *    ENOSPC  capacity, component or address space exhausted
 *    EPROTO  structural mismatch between request and substrate
 *  and a human-readable explanation in err_message ().
 */
class inventory_t {
   public:
    /*! \param h     handle used for logging; nullptr disables logging.
     *  \param opts  canonicalized option set.
     */
    inventory_t (flux_t *h, const opts_manager::lease_opts_t &opts);
    virtual ~inventory_t () = default;

    const std::string &err_message () const;
    void clear_err_message ();

   protected:
    void log (int level, const char *fmt, ...) const
        __attribute__ ((format (printf, 3, 4)));
    int fail (int errnum, const std::string &msg);

    /*! The node and network-service slivers the other reservations hold.
     *  Reservations named rid, null handles and reservations holding
     *  nothing are skipped.
     */
    std::vector<const node_sliver_t *> held_nodes (const std::string &rid,
                                                   const std::vector<reservation_ref_t> &existing,
                                                   bool include_extending) const;
    std::vector<std::pair<std::string, const network_service_sliver_t *>> held_services (
        const std::string &rid,
        const std::vector<reservation_ref_t> &existing) const;

    flux_t *m_h = nullptr;
    opts_manager::lease_opts_t m_opts;
    std::string m_err_msg = "";
};

}  // namespace resource_model
}  // namespace Lease

#endif  // INVENTORY_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
