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

#include "resource/calendar/controller_calendar.hpp"

namespace Lease {
namespace resource_model {

controller_calendar_t::controller_calendar_t (const actor_clock_t &clock)
    : client_calendar_t (clock)
{
}

int controller_calendar_t::add_closing (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.add (r, cycle);
}

void controller_calendar_t::remove_closing (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_closing.remove (r);
}

reservation_set_t controller_calendar_t::get_closing (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_closing.get_through (cycle);
}

int controller_calendar_t::add_redeeming (const reservation_ref_t &r, int64_t cycle)
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_redeeming.add (r, cycle);
}

void controller_calendar_t::remove_redeeming (const reservation_ref_t &r)
{
    std::lock_guard<std::mutex> guard (m_lock);
    m_redeeming.remove (r);
}

reservation_set_t controller_calendar_t::get_redeeming (int64_t cycle) const
{
    std::lock_guard<std::mutex> guard (m_lock);
    return m_redeeming.get_through (cycle);
}

void controller_calendar_t::tick_locked (int64_t cycle)
{
    client_calendar_t::tick_locked (cycle);
    m_closing.tick (cycle);
    m_redeeming.tick (cycle);
}

void controller_calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
    client_calendar_t::remove_scheduled_or_in_progress_locked (r);
    m_closing.remove (r);
    m_redeeming.remove (r);
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
