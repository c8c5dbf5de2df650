/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef AUTHORITY_CALENDAR_HPP
#define AUTHORITY_CALENDAR_HPP

#include <optional>
#include "resource/calendar/calendar.hpp"
#include "resource/calendar/reservation_set.hpp"
#include "resource/calendar/cycle_bucket_list.hpp"
#include "resource/calendar/interval_holdings.hpp"

namespace Lease {
namespace resource_model {

/*! Calendar of a site authority: client requests and closings by cycle
 *  and the client reservations its substrate serves (outlays) by real
 *  time in milliseconds.
 */
class authority_calendar_t : public calendar_t {
   public:
    explicit authority_calendar_t (const actor_clock_t &clock);

    int add_request (const reservation_ref_t &r, int64_t cycle);
    void remove_request (const reservation_ref_t &r);

    //! Requests due at exactly cycle.
    reservation_set_t get_requests (int64_t cycle) const;

    int add_closing (const reservation_ref_t &r, int64_t cycle);
    void remove_closing (const reservation_ref_t &r);

    //! Reservations to close up to and including cycle.
    reservation_set_t get_closing (int64_t cycle) const;

    int add_outlay (const reservation_ref_t &r, int64_t start_ms, int64_t end_ms);
    void remove_outlay (const reservation_ref_t &r);
    reservation_set_t get_outlays (std::optional<int64_t> time_ms = std::nullopt) const;

   protected:
    void tick_locked (int64_t cycle) override;
    void remove_locked (const reservation_ref_t &r) override;
    void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r) override;

   private:
    cycle_bucket_list_t m_requests;
    cycle_bucket_list_t m_closing;
    interval_holdings_t m_outlays;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // AUTHORITY_CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
