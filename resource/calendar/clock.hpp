/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace Lease {
namespace resource_model {

/*! Conversions between wall-clock time (milliseconds since the Unix
 *  epoch), dates and the discrete cycle counter of an actor. A cycle
 *  covers [cycle_start_millis (c), cycle_end_millis (c)], closed on both
 *  sides.
 */
class actor_clock_t {
   public:
    using time_point_t = std::chrono::system_clock::time_point;

    /*! Construct a clock.
     *
     *  \param beginning_of_time
     *                   millisecond offset of cycle 0; must be >= 0.
     *  \param cycle_millis
     *                   cycle length in milliseconds; must be >= 1.
     *  \throw           std::invalid_argument on a bad argument.
     */
    actor_clock_t (int64_t beginning_of_time, int64_t cycle_millis);

    static int64_t to_millis (const time_point_t &when);
    static time_point_t from_millis (int64_t millis);
    static int64_t now_millis ();

    /*! Cycle containing a point in time; 0 if it precedes the epoch.
     */
    int64_t cycle (const time_point_t &when) const;
    int64_t cycle (int64_t millis) const;

    /*! First and last millisecond of a cycle.
     *
     *  \return          millisecond value; -1 with errno set to EINVAL
     *                   for a negative cycle.
     */
    int64_t cycle_start_millis (int64_t cycle) const;
    int64_t cycle_end_millis (int64_t cycle) const;

    //! \throw std::invalid_argument for a negative cycle.
    time_point_t cycle_start_date (int64_t cycle) const;
    time_point_t cycle_end_date (int64_t cycle) const;
    time_point_t date (int64_t cycle) const;

    /*! Length of a span of cycles in milliseconds. The epoch is not
     *  taken into account.
     *
     *  \return          -1 with errno set to EINVAL if cycles < 0.
     */
    int64_t millis (int64_t cycles) const;

    /*! Number of whole cycles a span of milliseconds represents.
     *
     *  \return          -1 with errno set to EINVAL if millis < 0.
     */
    int64_t convert_millis (int64_t millis) const;

    int64_t get_beginning_of_time () const;
    int64_t get_cycle_millis () const;

   private:
    int64_t m_beginning_of_time = 0;
    int64_t m_cycle_millis = 1;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // CLOCK_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
