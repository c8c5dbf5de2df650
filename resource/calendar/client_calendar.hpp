/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CLIENT_CALENDAR_HPP
#define CLIENT_CALENDAR_HPP

#include <string>
#include <optional>
#include "resource/calendar/calendar.hpp"
#include "resource/calendar/reservation_set.hpp"
#include "resource/calendar/cycle_bucket_list.hpp"
#include "resource/calendar/interval_holdings.hpp"

namespace Lease {
namespace resource_model {

/*! Calendar of an actor that acquires resources.
 *
 *  demand:   reservations to be requested from a broker.
 *  pending:  reservations with an outstanding request.
 *  renewing: reservations due for renewal, by cycle.
 *  holdings: reservations held, by real time in milliseconds.
 */
class client_calendar_t : public calendar_t {
   public:
    explicit client_calendar_t (const actor_clock_t &clock);

    int add_demand (const reservation_ref_t &r);
    void remove_demand (const reservation_ref_t &r);
    reservation_set_t get_demand () const;

    int add_pending (const reservation_ref_t &r);
    void remove_pending (const reservation_ref_t &r);
    reservation_set_t get_pending () const;

    /*! \return  0 on success; -1 on error with errno set by
     *           cycle_bucket_list_t::add ().
     */
    int add_renewing (const reservation_ref_t &r, int64_t cycle);
    void remove_renewing (const reservation_ref_t &r);

    //! Reservations to renew up to and including cycle.
    reservation_set_t get_renewing (int64_t cycle) const;

    /*! \return  0 on success; -1 on error with errno set by
     *           interval_holdings_t::add ().
     */
    int add_holdings (const reservation_ref_t &r, int64_t start_ms, int64_t end_ms);
    void remove_holdings (const reservation_ref_t &r);
    reservation_set_t get_holdings (std::optional<int64_t> time_ms = std::nullopt,
                                    const std::optional<std::string> &type = std::nullopt) const;

   protected:
    void tick_locked (int64_t cycle) override;
    void remove_locked (const reservation_ref_t &r) override;
    void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r) override;

    reservation_set_t m_demand;
    reservation_set_t m_pending;
    cycle_bucket_list_t m_renewing;
    interval_holdings_t m_holdings;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // CLIENT_CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
