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
#include <algorithm>
#include <boost/tuple/tuple.hpp>
#include "resource/calendar/interval_holdings.hpp"

namespace Lease {
namespace resource_model {

int interval_holdings_t::add (const reservation_ref_t &r, int64_t start, int64_t end)
{
    if (!r || end < start) {
        errno = EINVAL;
        return -1;
    }

    const std::string &rid = r->get_reservation_id ();
    auto &rid_idx = m_holdings.get<by_rid> ();
    auto it = rid_idx.find (rid);
    if (it != rid_idx.end ()) {
        // Only a contiguous extension may replace an existing interval
        if (start - it->end > 1) {
            errno = EINVAL;
            return -1;
        }
        start = std::min (start, it->start);
        rid_idx.erase (it);
    }
    m_holdings.insert (holding_t{rid, start, end, r});
    return 0;
}

void interval_holdings_t::remove (const reservation_ref_t &r)
{
    if (r)
        remove (r->get_reservation_id ());
}

void interval_holdings_t::remove (const std::string &rid)
{
    m_holdings.get<by_rid> ().erase (rid);
}

reservation_set_t interval_holdings_t::query (std::optional<int64_t> time,
                                              const std::optional<std::string> &type) const
{
    reservation_set_t result;
    const auto &end_idx = m_holdings.get<by_end> ();

    // Everything ending before time is out; the rest is checked on start.
    auto it = time ? end_idx.lower_bound (boost::make_tuple (*time)) : end_idx.begin ();
    for (; it != end_idx.end (); ++it) {
        if (time && it->start > *time)
            continue;
        if (type && it->reservation->get_type () != *type)
            continue;
        result.add (it->reservation);
    }
    return result;
}

size_t interval_holdings_t::tick (int64_t time)
{
    size_t n = 0;
    auto &end_idx = m_holdings.get<by_end> ();
    while (!end_idx.empty () && end_idx.begin ()->end <= time) {
        end_idx.erase (end_idx.begin ());
        n++;
    }
    return n;
}

bool interval_holdings_t::contains (const std::string &rid) const
{
    const auto &rid_idx = m_holdings.get<by_rid> ();
    return rid_idx.find (rid) != rid_idx.end ();
}

std::optional<std::pair<int64_t, int64_t>> interval_holdings_t::interval (
    const std::string &rid) const
{
    const auto &rid_idx = m_holdings.get<by_rid> ();
    auto it = rid_idx.find (rid);
    if (it == rid_idx.end ())
        return std::nullopt;
    return std::make_pair (it->start, it->end);
}

size_t interval_holdings_t::size () const
{
    return m_holdings.size ();
}

void interval_holdings_t::clear ()
{
    m_holdings.clear ();
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
