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

#include "resource/calendar/client_calendar.hpp"

namespace Lease {
namespace resource_model {

client_calendar_t::client_calendar_t (const actor_clock_t &clock) : calendar_t (clock)
{
}

int client_calendar_t::add_demand (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_demand.add (r);
}

void client_calendar_t::remove_demand (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_demand.remove (r);
}

reservation_set_t client_calendar_t::get_demand () const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_demand;
}

int client_calendar_t::add_pending (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_pending.add (r);
}

void client_calendar_t::remove_pending (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_pending.remove (r);
}

reservation_set_t client_calendar_t::get_pending () const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_pending;
}

int client_calendar_t::add_renewing (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_renewing.add (r, cycle);
}

void client_calendar_t::remove_renewing (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_renewing.remove (r);
}

reservation_set_t client_calendar_t::get_renewing (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_renewing.get_through (cycle);
}

int client_calendar_t::add_holdings (const reservation_ref_t &r, int64_t start_ms, int64_t end_ms)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_holdings.add (r, start_ms, end_ms);
}

void client_calendar_t::remove_holdings (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_holdings.remove (r);
}

reservation_set_t client_calendar_t::get_holdings (std::optional<int64_t> time_ms,
                                                   const std::optional<std::string> &type) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_holdings.query (time_ms, type);
}

void client_calendar_t::tick_locked (int64_t cycle)
{
    calendar_t::tick_locked (cycle);
    m_renewing.tick (cycle);
    m_holdings.tick (m_clock.cycle_end_millis (cycle));
}

void client_calendar_t::remove_locked (const reservation_ref_t &r)
{
    calendar_t::remove_locked (r);
    remove_scheduled_or_in_progress_locked (r);
    m_holdings.remove (r);
}

void client_calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
    calendar_t::remove_scheduled_or_in_progress_locked (r);
    m_demand.remove (r);
    m_pending.remove (r);
    m_renewing.remove (r);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
