/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CYCLE_BUCKET_LIST_HPP
#define CYCLE_BUCKET_LIST_HPP

#include <map>
#include <string>
#include <cstdint>
#include <unordered_map>

#include "resource/schema/reservation.hpp"
#include "resource/calendar/reservation_set.hpp"

namespace Lease {
namespace resource_model {

/*! Reservations grouped by the cycle at which something is due for them
 *  (renew, close, redeem). A reservation belongs to at most one bucket.
 */
class cycle_bucket_list_t {
   public:
    /*! Add a reservation to the bucket of cycle. Adding it again at the
     *  same cycle is a no-op.
     *
     *  \return          0 on success; -1 on error.
     *                   errno: EINVAL (null handle or negative cycle),
     *                   EEXIST (already in the bucket of another cycle).
     */
    int add (const reservation_ref_t &r, int64_t cycle);

    //! Removing an absent reservation is a no-op.
    void remove (const reservation_ref_t &r);
    void remove (const std::string &rid);

    //! Reservations in the bucket of exactly this cycle.
    reservation_set_t get (int64_t cycle) const;

    //! Reservations in every bucket whose cycle is <= cycle.
    reservation_set_t get_through (int64_t cycle) const;

    /*! Reclaim every bucket whose cycle is <= cycle.
     *
     *  \return          number of reservations reclaimed.
     */
    size_t tick (int64_t cycle);

    bool contains (const std::string &rid) const;

    //! \return  cycle of the reservation or -1 if absent.
    int64_t cycle_of (const std::string &rid) const;

    //! Number of reservations across all buckets.
    size_t size () const;

    //! Number of non-empty buckets.
    size_t cycles () const;
    void clear ();

   private:
    std::map<int64_t, reservation_set_t> m_buckets;
    std::unordered_map<std::string, int64_t> m_rid_to_cycle;
    size_t m_size = 0;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // CYCLE_BUCKET_LIST_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
