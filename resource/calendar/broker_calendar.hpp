/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef BROKER_CALENDAR_HPP
#define BROKER_CALENDAR_HPP

#include <map>
#include <memory>
#include <string>
#include "resource/calendar/client_calendar.hpp"
#include "resource/calendar/source_calendar.hpp"

namespace Lease {
namespace resource_model {

/*! Calendar of a broker. As a client it holds the delegations it was
 *  given (sources); as a server it tracks client requests, closings and,
 *  per source delegation, the outlays drawn from it.
 */
class broker_calendar_t : public client_calendar_t {
   public:
    explicit broker_calendar_t (const actor_clock_t &clock);

    /*! Add a client request due at cycle. With a source, the request is
     *  an extension of an outlay of that source.
     *
     *  \return          0 on success; -1 on error.
     *                   errno: EINVAL, EEXIST.
     */
    int add_request (const reservation_ref_t &r,
                     int64_t cycle,
                     const reservation_ref_t &source = nullptr);
    void remove_request (const reservation_ref_t &r, const reservation_ref_t &source = nullptr);

    //! Client requests due at exactly cycle.
    reservation_set_t get_requests (int64_t cycle) const;

    //! Client requests due up to and including cycle.
    reservation_set_t get_all_requests (int64_t cycle) const;

    //! Extension requests against source due at exactly cycle.
    reservation_set_t get_request (const reservation_ref_t &source, int64_t cycle) const;

    int add_outlay (const reservation_ref_t &source,
                    const reservation_ref_t &client,
                    int64_t start_ms,
                    int64_t end_ms);
    void remove_outlay (const reservation_ref_t &source, const reservation_ref_t &client);
    reservation_set_t get_outlays (const reservation_ref_t &source,
                                   std::optional<int64_t> time_ms = std::nullopt) const;

    /*! Register a source delegation held over [start_ms, end_ms]: create
     *  its calendar and add it to the holdings.
     */
    int add_source (const reservation_ref_t &source, int64_t start_ms, int64_t end_ms);
    void remove_source_calendar (const reservation_ref_t &source);
    bool has_source_calendar (const std::string &source_rid) const;
    size_t source_calendars () const;

    int add_closing (const reservation_ref_t &r, int64_t cycle);
    void remove_closing (const reservation_ref_t &r);
    reservation_set_t get_closing (int64_t cycle) const;

   protected:
    void tick_locked (int64_t cycle) override;
    void remove_locked (const reservation_ref_t &r) override;
    void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r) override;

   private:
    source_calendar_t *source_calendar_locked (const reservation_ref_t &source);
    const source_calendar_t *find_source_calendar_locked (const reservation_ref_t &source) const;

    cycle_bucket_list_t m_closing;
    cycle_bucket_list_t m_requests;
    std::map<std::string, std::unique_ptr<source_calendar_t>> m_sources;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // BROKER_CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
