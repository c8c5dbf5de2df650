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

#include "resource/calendar/authority_calendar.hpp"

namespace Lease {
namespace resource_model {

authority_calendar_t::authority_calendar_t (const actor_clock_t &clock) : calendar_t (clock)
{
}

int authority_calendar_t::add_request (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_requests.add (r, cycle);
}

void authority_calendar_t::remove_request (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_requests.remove (r);
}

reservation_set_t authority_calendar_t::get_requests (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_requests.get (cycle);
}

int authority_calendar_t::add_closing (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.add (r, cycle);
}

void authority_calendar_t::remove_closing (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_closing.remove (r);
}

reservation_set_t authority_calendar_t::get_closing (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.get_through (cycle);
}

int authority_calendar_t::add_outlay (const reservation_ref_t &r, int64_t start_ms, int64_t end_ms)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_outlays.add (r, start_ms, end_ms);
}

void authority_calendar_t::remove_outlay (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_outlays.remove (r);
}

reservation_set_t authority_calendar_t::get_outlays (std::optional<int64_t> time_ms) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_outlays.query (time_ms);
}

void authority_calendar_t::tick_locked (int64_t cycle)
{
    calendar_t::tick_locked (cycle);
    m_requests.tick (cycle);
    m_closing.tick (cycle);
    m_outlays.tick (m_clock.cycle_end_millis (cycle));
}

void authority_calendar_t::remove_locked (const reservation_ref_t &r)
{
    remove_scheduled_or_in_progress_locked (r);
    m_outlays.remove (r);
}

void authority_calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
    m_requests.remove (r);
    m_closing.remove (r);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
