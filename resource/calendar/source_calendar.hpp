/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef SOURCE_CALENDAR_HPP
#define SOURCE_CALENDAR_HPP

#include <optional>
#include "resource/calendar/calendar.hpp"
#include "resource/calendar/reservation_set.hpp"
#include "resource/calendar/cycle_bucket_list.hpp"
#include "resource/calendar/interval_holdings.hpp"

namespace Lease {
namespace resource_model {

/*! Calendar of one source delegation: the client reservations drawing
 *  resources from it (outlays) and the pending requests to extend them
 *  (extending).
 */
class source_calendar_t : public calendar_t {
   public:
    source_calendar_t (const actor_clock_t &clock, const reservation_ref_t &source);

    const reservation_ref_t &get_source () const;

    int add_outlay (const reservation_ref_t &client, int64_t start_ms, int64_t end_ms);
    void remove_outlay (const reservation_ref_t &client);
    reservation_set_t get_outlays (std::optional<int64_t> time_ms = std::nullopt) const;

    int add_extending (const reservation_ref_t &r, int64_t cycle);
    void remove_extending (const reservation_ref_t &r);

    //! Extension requests due at exactly cycle.
    reservation_set_t get_extending (int64_t cycle) const;

   protected:
    void tick_locked (int64_t cycle) override;
    void remove_locked (const reservation_ref_t &r) override;
    void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r) override;

   private:
    reservation_ref_t m_source;
    interval_holdings_t m_outlays;
    cycle_bucket_list_t m_extending;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // SOURCE_CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
