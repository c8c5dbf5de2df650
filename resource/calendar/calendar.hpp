/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CALENDAR_HPP
#define CALENDAR_HPP

#include <mutex>
#include <cstdint>
#include "resource/calendar/clock.hpp"
#include "resource/schema/reservation.hpp"

namespace Lease {
namespace resource_model {

/*! Base of the role-specific calendars. Every public operation of a
 *  calendar holds m_lock for its duration and getters hand out copies,
 *  so callers can iterate a result without holding the lock. Derived
 *  calendars extend the *_locked hooks; those run with m_lock held.
 */
class calendar_t {
   public:
    explicit calendar_t (const actor_clock_t &clock);
    calendar_t (const calendar_t &o) = delete;
    calendar_t &operator= (const calendar_t &o) = delete;
    virtual ~calendar_t () = default;

    /*! Advance every time-indexed list to cycle.
     *
     *  \return          0 on success; -1 with errno set to EINVAL for a
     *                   negative cycle.
     */
    int tick (int64_t cycle);

    /*! Remove a reservation from every list it may be in. Absence from
     *  any list is fine.
     */
    void remove (const reservation_ref_t &r);

    /*! Remove a reservation from the lists of operations scheduled for
     *  the future or in progress. Holdings and outlays are kept.
     */
    void remove_scheduled_or_in_progress (const reservation_ref_t &r);

    const actor_clock_t &get_clock () const;

   protected:
    virtual void tick_locked (int64_t cycle);
    virtual void remove_locked (const reservation_ref_t &r);
    virtual void remove_scheduled_or_in_progress_locked (const reservation_ref_t &r);

    actor_clock_t m_clock;
    mutable std::mutex m_lock;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // CALENDAR_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
