/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef RESERVATION_HPP
#define RESERVATION_HPP

#include <memory>
#include <string>
#include "resource/schema/sliver.hpp"

namespace Lease {
namespace resource_model {

enum class reservation_state_t {
    UNKNOWN,
    NASCENT,
    TICKETED,
    ACTIVE,
    ACTIVE_TICKETED,
    CLOSED,
    CLOSE_WAIT,
    FAILED
};

enum class reservation_pending_state_t {
    NONE,
    TICKETING,
    EXTENDING_TICKET,
    REDEEMING,
    EXTENDING_LEASE,
    CLOSING
};

/*! Read-only view of a reservation owned by the actor kernel. Nothing in
 *  this library creates, destroys or changes the state of a reservation;
 *  it only places handles into its index structures and reads them.
 */
class reservation_t {
   public:
    virtual ~reservation_t () = default;

    virtual const std::string &get_reservation_id () const = 0;

    /*! Resource type, used as the holdings type filter.
     */
    virtual const std::string &get_type () const = 0;
    virtual reservation_state_t get_state () const = 0;
    virtual reservation_pending_state_t get_pending_state () const = 0;

    /*! Sliver accessors. Each returns nullptr when the corresponding
     *  resource set is not (yet) available.
     */
    virtual const sliver_t *get_resources () const = 0;
    virtual const sliver_t *get_requested_resources () const = 0;
    virtual const sliver_t *get_approved_resources () const = 0;

    bool is_active () const;
    bool is_ticketed () const;
    bool is_ticketing () const;
    bool is_extending_ticket () const;
    bool is_closed () const;
    bool is_failed () const;
};

using reservation_ref_t = std::shared_ptr<reservation_t>;

/*! The sliver a reservation currently holds on the substrate.
 *
 *  \param r         reservation handle.
 *  \param include_extending
 *                   also report the requested sliver of a reservation
 *                   that is extending its ticket.
 *  \return          approved resources of a ticketing reservation,
 *                   resources of an active or ticketed one (these win
 *                   when both apply), the requested resources of an
 *                   extending one when asked, else nullptr.
 */
const sliver_t *allocated_sliver (const reservation_t &r, bool include_extending);

const char *reservation_state_to_string (reservation_state_t s);

}  // namespace resource_model
}  // namespace Lease

#endif  // RESERVATION_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
