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
#include "resource/calendar/calendar.hpp"

namespace Lease {
namespace resource_model {

calendar_t::calendar_t (const actor_clock_t &clock) : m_clock (clock)
{
}

int calendar_t::tick (int64_t cycle)
{
    if (cycle < 0) {
        errno = EINVAL;
        return -1;
    }
    std::lock_guard<std::mutex> guard (m_lock);
    tick_locked (cycle);
    return 0;
}

void calendar_t::remove (const reservation_ref_t &r)
{
    if (!r)
        return;
    std::lock_guard<std::mutex> guard (m_lock);
    remove_locked (r);
}

void calendar_t::remove_scheduled_or_in_progress (const reservation_ref_t &r)
{
    if (!r)
        return;
    std::lock_guard<std::mutex> guard (m_lock);
    remove_scheduled_or_in_progress_locked (r);
}

const actor_clock_t &calendar_t::get_clock () const
{
    return m_clock;
}

void calendar_t::tick_locked (int64_t cycle)
{
}

void calendar_t::remove_locked (const reservation_ref_t &r)
{
}

void calendar_t::remove_scheduled_or_in_progress_locked (const reservation_ref_t &r)
{
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
