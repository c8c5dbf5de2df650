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

#include "resource/schema/reservation.hpp"

namespace Lease {
namespace resource_model {

bool reservation_t::is_active () const
{
    reservation_state_t s = get_state ();
    return s == reservation_state_t::ACTIVE || s == reservation_state_t::ACTIVE_TICKETED;
}

bool reservation_t::is_ticketed () const
{
    reservation_state_t s = get_state ();
    return s == reservation_state_t::TICKETED || s == reservation_state_t::ACTIVE_TICKETED;
}

bool reservation_t::is_ticketing () const
{
    return get_pending_state () == reservation_pending_state_t::TICKETING;
}

bool reservation_t::is_extending_ticket () const
{
    return get_pending_state () == reservation_pending_state_t::EXTENDING_TICKET;
}

bool reservation_t::is_closed () const
{
    return get_state () == reservation_state_t::CLOSED;
}

bool reservation_t::is_failed () const
{
    return get_state () == reservation_state_t::FAILED;
}

const sliver_t *allocated_sliver (const reservation_t &r, bool include_extending)
{
    const sliver_t *s = nullptr;
    if (r.is_ticketing () && r.get_approved_resources ())
        s = r.get_approved_resources ();
    if ((r.is_active () || r.is_ticketed ()) && r.get_resources ())
        s = r.get_resources ();
    if (include_extending && r.is_extending_ticket () && r.get_requested_resources ())
        s = r.get_requested_resources ();
    return s;
}

const char *reservation_state_to_string (reservation_state_t s)
{
    switch (s) {
        case reservation_state_t::UNKNOWN:
            return "Unknown";
        case reservation_state_t::NASCENT:
            return "Nascent";
        case reservation_state_t::TICKETED:
            return "Ticketed";
        case reservation_state_t::ACTIVE:
            return "Active";
        case reservation_state_t::ACTIVE_TICKETED:
            return "ActiveTicketed";
        case reservation_state_t::CLOSED:
            return "Closed";
        case reservation_state_t::CLOSE_WAIT:
            return "CloseWait";
        case reservation_state_t::FAILED:
            return "Failed";
    }
    return "Unknown";
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
