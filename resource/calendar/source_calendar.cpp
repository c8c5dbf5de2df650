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

#include "resource/calendar/source_calendar.hpp"

namespace Lease {
namespace resource_model {

source_calendar_t::source_calendar_t (const actor_clock_t &clock, const reservation_ref_t &source)
    : calendar_t (clock), m_source (source)
{
}

const reservation_ref_t &source_calendar_t::get_source () const
{
    return m_source;
}

int source_calendar_t::add_outlay (const reservation_ref_t &client, int64_t start_ms, int64_t end_ms)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_outlays.add (client, start_ms, end_ms);
}

void source_calendar_t::remove_outlay (const reservation_ref_t &client)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_outlays.remove (client);
}

reservation_set_t source_calendar_t::get_outlays (std::optional<int64_t> time_ms) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_outlays.query (time_ms);
}

int source_calendar_t::add_extending (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_extending.add (r, cycle);
}

void source_calendar_t::remove_extending (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_extending.remove (r);
}

reservation_set_t source_calendar_t::get_extending (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_extending.get (cycle);
}

void source_calendar_t::tick_locked (int64_t cycle)
{
    calendar_t::tick_locked (cycle);
    m_extending.tick (cycle);
    m_outlays.tick (m_clock.cycle_end_millis (cycle));
}

void source_calendar_t::remove_locked (const reservation_ref_t &r)
{
    remove_scheduled_or_in_progress_locked (r);
    m_outlays.remove (r);
}

void source_calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
    m_extending.remove (r);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
