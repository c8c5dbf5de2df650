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

#include <cerrno>
#include "resource/calendar/broker_calendar.hpp"

namespace Lease {
namespace resource_model {

////////////////////////////////////////////////////////////////////////////////
// Private Broker Calendar API
////////////////////////////////////////////////////////////////////////////////

source_calendar_t *broker_calendar_t::source_calendar_locked (const reservation_ref_t &source)
{
    const std::string &id = source->get_reservation_id ();
    auto it = m_sources.find (id);
    if (it == m_sources.end ())
        it = m_sources.emplace (id, std::make_unique<source_calendar_t> (m_clock, source)).first;
    return it->second.get ();
}

const source_calendar_t *broker_calendar_t::find_source_calendar_locked (
    const reservation_ref_t &source) const
{
    auto it = m_sources.find (source->get_reservation_id ());
    return (it != m_sources.end ()) ? it->second.get () : nullptr;
}

void broker_calendar_t::tick_locked (int64_t cycle)
{
    client_calendar_t::tick_locked (cycle);
    m_requests.tick (cycle);
    m_closing.tick (cycle);
    for (auto &kv : m_sources)
        kv.second->tick (cycle);
}

void broker_calendar_t::remove_locked (const reservation_ref_t &r)
{
    client_calendar_t::remove_locked (r);
    for (auto &kv : m_sources)
        kv.second->remove (r);
}

void broker_calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
    client_calendar_t::remove_scheduled_or_in_progress_locked (r);
    m_closing.remove (r);
    m_requests.remove (r);
    for (auto &kv : m_sources)
        kv.second->remove_scheduled_or_in_progress (r);
}

////////////////////////////////////////////////////////////////////////////////
// Public Broker Calendar API
////////////////////////////////////////////////////////////////////////////////

broker_calendar_t::broker_calendar_t (const actor_clock_t &clock) : client_calendar_t (clock)
{
}

int broker_calendar_t::add_request (const reservation_ref_t &r,
                                    int64_t cycle,
                                    const reservation_ref_t &source)
{
    std::lock_guard<std::mutex> guard (m_lock);
    if (!source)
        return m_requests.add (r, cycle);
    return source_calendar_locked (source)->add_extending (r, cycle);
}

void broker_calendar_t::remove_request (const reservation_ref_t &r, const reservation_ref_t &source)
{
    std::lock_guard<std::mutex> guard (m_lock);
    if (!source) {
        m_requests.remove (r);
        return;
    }
    auto it = m_sources.find (source->get_reservation_id ());
    if (it != m_sources.end ())
        it->second->remove_extending (r);
}

reservation_set_t broker_calendar_t::get_requests (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_requests.get (cycle);
}

reservation_set_t broker_calendar_t::get_all_requests (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_requests.get_through (cycle);
}

reservation_set_t broker_calendar_t::get_request (const reservation_ref_t &source,
                                                  int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    const source_calendar_t *cal = source ? find_source_calendar_locked (source) : nullptr;
    return cal ? cal->get_extending (cycle) : reservation_set_t ();
}

int broker_calendar_t::add_outlay (const reservation_ref_t &source,
                                   const reservation_ref_t &client,
                                   int64_t start_ms,
                                   int64_t end_ms)
{
    if (!source) {
        errno = EINVAL;
        return -1;
    }
    std::lock_guard<std::mutex> guard (m_lock);
    return source_calendar_locked (source)->add_outlay (client, start_ms, end_ms);
}

void broker_calendar_t::remove_outlay (const reservation_ref_t &source,
                                       const reservation_ref_t &client)
{
    if (!source)
        return;
    std::lock_guard<std::mutex> guard (m_lock);
    auto it = m_sources.find (source->get_reservation_id ());
    if (it != m_sources.end ())
        it->second->remove_outlay (client);
}

reservation_set_t broker_calendar_t::get_outlays (const reservation_ref_t &source,
                                                  std::optional<int64_t> time_ms) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    const source_calendar_t *cal = source ? find_source_calendar_locked (source) : nullptr;
    return cal ? cal->get_outlays (time_ms) : reservation_set_t ();
}

int broker_calendar_t::add_source (const reservation_ref_t &source, int64_t start_ms, int64_t end_ms)
{
    if (!source) {
        errno = EINVAL;
        return -1;
    }
    std::lock_guard<std::mutex> guard (m_lock);
    source_calendar_locked (source);
    return m_holdings.add (source, start_ms, end_ms);
}

void broker_calendar_t::remove_source_calendar (const reservation_ref_t &source)
{
    if (!source)
        return;
    std::lock_guard<std::mutex> guard (m_lock);
    m_sources.erase (source->get_reservation_id ());
}

bool broker_calendar_t::has_source_calendar (const std::string &source_rid) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_sources.find (source_rid) != m_sources.end ();
}

size_t broker_calendar_t::source_calendars () const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_sources.size ();
}

int broker_calendar_t::add_closing (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.add (r, cycle);
}

void broker_calendar_t::remove_closing (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_closing.remove (r);
}

reservation_set_t broker_calendar_t::get_closing (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.get_through (cycle);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
