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
#include <string>
#include <stdexcept>
#include "resource/calendar/clock.hpp"
#include "src/common/c++wrappers/chrono.hpp"

namespace Lease {
namespace resource_model {

actor_clock_t::actor_clock_t (int64_t beginning_of_time, int64_t cycle_millis)
{
    if (beginning_of_time < 0 || cycle_millis < 1)
        throw std::invalid_argument ("invalid clock: beginning-of-time="
                                     + std::to_string (beginning_of_time)
                                     + " cycle-millis=" + std::to_string (cycle_millis));
    m_beginning_of_time = beginning_of_time;
    m_cycle_millis = cycle_millis;
}

int64_t actor_clock_t::to_millis (const time_point_t &when)
{
    return Lease::chrono::millis_since_epoch (when);
}

actor_clock_t::time_point_t actor_clock_t::from_millis (int64_t millis)
{
    return Lease::chrono::time_point_from_millis (millis);
}

int64_t actor_clock_t::now_millis ()
{
    return Lease::chrono::millis_since_epoch ();
}

int64_t actor_clock_t::cycle (const time_point_t &when) const
{
    return cycle (to_millis (when));
}

int64_t actor_clock_t::cycle (int64_t millis) const
{
    if (millis < m_beginning_of_time)
        return 0;
    return (millis - m_beginning_of_time) / m_cycle_millis;
}

int64_t actor_clock_t::cycle_start_millis (int64_t cycle) const
{
    if (cycle < 0) {
        errno = EINVAL;
        return -1;
    }
    return m_beginning_of_time + cycle * m_cycle_millis;
}

int64_t actor_clock_t::cycle_end_millis (int64_t cycle) const
{
    if (cycle < 0) {
        errno = EINVAL;
        return -1;
    }
    return cycle_start_millis (cycle) + m_cycle_millis - 1;
}

actor_clock_t::time_point_t actor_clock_t::cycle_start_date (int64_t cycle) const
{
    return date (cycle);
}

actor_clock_t::time_point_t actor_clock_t::cycle_end_date (int64_t cycle) const
{
    if (cycle < 0)
        throw std::invalid_argument ("negative cycle: " + std::to_string (cycle));
    return from_millis (cycle_end_millis (cycle));
}

actor_clock_t::time_point_t actor_clock_t::date (int64_t cycle) const
{
    if (cycle < 0)
        throw std::invalid_argument ("negative cycle: " + std::to_string (cycle));
    return from_millis (cycle_start_millis (cycle));
}

int64_t actor_clock_t::millis (int64_t cycles) const
{
    if (cycles < 0) {
        errno = EINVAL;
        return -1;
    }
    return cycles * m_cycle_millis;
}

int64_t actor_clock_t::convert_millis (int64_t millis) const
{
    if (millis < 0) {
        errno = EINVAL;
        return -1;
    }
    return millis / m_cycle_millis;
}

int64_t actor_clock_t::get_beginning_of_time () const
{
    return m_beginning_of_time;
}

int64_t actor_clock_t::get_cycle_millis () const
{
    return m_cycle_millis;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
