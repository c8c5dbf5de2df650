/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CONTROLLER_CALENDAR_HPP
#define CONTROLLER_CALENDAR_HPP

#include "resource/calendar/client_calendar.hpp"

namespace Lease {
namespace resource_model {

/*! Client calendar of a controller, which also closes and redeems the
 *  reservations it holds.
 */
class controller_calendar_t : public client_calendar_t {
   public:
    explicit controller_calendar_t (const actor_clock_t &clock);

    int add_closing (const reservation_ref_t &r, int64_t cycle);
    void remove_closing (const reservation_ref_t &r);

    //! Reservations to close up to and including cycle.
    reservation_set_t get_closing (int64_t cycle) const;

    int add_redeeming (const reservation_ref_t &r, int64_t cycle);
    void remove_redeeming (const reservation_ref_t &r);

    //! Reservations to redeem up to and including cycle.
    reservation_set_t get_redeeming (int64_t cycle) const;

   protected:
    void tick_locked (int64_t cycle) override;
    void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r) override;

    cycle_bucket_list_t m_closing;
    cycle_bucket_list_t m_redeeming;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // CONTROLLER_CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
