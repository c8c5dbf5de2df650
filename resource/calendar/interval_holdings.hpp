/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef INTERVAL_HOLDINGS_HPP
#define INTERVAL_HOLDINGS_HPP

#include <string>
#include <cstdint>
#include <optional>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/composite_key.hpp>

#include "resource/schema/reservation.hpp"
#include "resource/calendar/reservation_set.hpp"

namespace Lease {
namespace resource_model {

struct holding_t {
    std::string rid;
    int64_t start = 0;
    int64_t end = 0;
    reservation_ref_t reservation;
};

/* tags for accessing the corresponding indices of holding_t */
struct by_end {};
struct by_rid {};

using holdings_container_t = boost::multi_index::multi_index_container<
    holding_t,
    boost::multi_index::indexed_by<
        boost::multi_index::ordered_unique<
            boost::multi_index::tag<by_end>,
            boost::multi_index::composite_key<
                holding_t,
                boost::multi_index::member<holding_t, int64_t, &holding_t::end>,
                boost::multi_index::member<holding_t, std::string, &holding_t::rid>>>,
        boost::multi_index::hashed_unique<
            boost::multi_index::tag<by_rid>,
            boost::multi_index::member<holding_t, std::string, &holding_t::rid>>>>;

/*! Reservations held over closed [start, end] time intervals, ordered by
 *  end time and then by reservation id. A reservation appears at most
 *  once.
 */
class interval_holdings_t {
   public:
    /*! Add a reservation held over [start, end]. Re-adding a reservation
     *  extends it: the new interval must start no later than one time
     *  unit after the old one ended and the earlier start is kept.
     *
     *  \return          0 on success; -1 with errno set to EINVAL on a
     *                   null handle, on end < start, or when the new
     *                   interval does not extend the old one.
     */
    int add (const reservation_ref_t &r, int64_t start, int64_t end);

    //! Removing an absent reservation is a no-op.
    void remove (const reservation_ref_t &r);
    void remove (const std::string &rid);

    /*! Reservations whose interval contains time and, when given, whose
     *  resource type equals type. With neither filter, every reservation.
     */
    reservation_set_t query (std::optional<int64_t> time = std::nullopt,
                             const std::optional<std::string> &type = std::nullopt) const;

    /*! Drop every holding whose end is <= time.
     *
     *  \return          number of holdings removed.
     */
    size_t tick (int64_t time);

    bool contains (const std::string &rid) const;

    //! \return  the stored interval or std::nullopt.
    std::optional<std::pair<int64_t, int64_t>> interval (const std::string &rid) const;

    size_t size () const;
    void clear ();

   private:
    holdings_container_t m_holdings;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // INTERVAL_HOLDINGS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
