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
#include "resource/calendar/cycle_bucket_list.hpp"

namespace Lease {
namespace resource_model {

int cycle_bucket_list_t::add (const reservation_ref_t &r, int64_t cycle)
{
    if (!r || cycle < 0) {
        errno = EINVAL;
        return -1;
    }
    const std::string &rid = r->get_reservation_id ();
    auto it = m_rid_to_cycle.find (rid);
    if (it != m_rid_to_cycle.end ()) {
        if (it->second == cycle)
            return 0;
        errno = EEXIST;
        return -1;
    }
    m_buckets[cycle].add (r);
    m_rid_to_cycle.emplace (rid, cycle);
    m_size++;
    return 0;
}

void cycle_bucket_list_t::remove (const reservation_ref_t &r)
{
    if (r)
        remove (r->get_reservation_id ());
}

void cycle_bucket_list_t::remove (const std::string &rid)
{
    auto it = m_rid_to_cycle.find (rid);
    if (it == m_rid_to_cycle.end ())
        return;
    auto b = m_buckets.find (it->second);
    if (b != m_buckets.end ()) {
        b->second.remove (rid);
        if (b->second.empty ())
            m_buckets.erase (b);
    }
    m_rid_to_cycle.erase (it);
    m_size--;
}

reservation_set_t cycle_bucket_list_t::get (int64_t cycle) const
{
    auto b = m_buckets.find (cycle);
    return (b != m_buckets.end ()) ? b->second : reservation_set_t ();
}

reservation_set_t cycle_bucket_list_t::get_through (int64_t cycle) const
{
    reservation_set_t result;
    for (const auto &kv : m_buckets) {
        if (kv.first > cycle)
            break;
        result += kv.second;
    }
    return result;
}

size_t cycle_bucket_list_t::tick (int64_t cycle)
{
    size_t n = 0;
    auto b = m_buckets.begin ();
    while (b != m_buckets.end () && b->first <= cycle) {
        for (const auto &kv : b->second)
            m_rid_to_cycle.erase (kv.first);
        n += b->second.size ();
        b = m_buckets.erase (b);
    }
    m_size -= n;
    return n;
}

bool cycle_bucket_list_t::contains (const std::string &rid) const
{
    return m_rid_to_cycle.find (rid) != m_rid_to_cycle.end ();
}

int64_t cycle_bucket_list_t::cycle_of (const std::string &rid) const
{
    auto it = m_rid_to_cycle.find (rid);
    return (it != m_rid_to_cycle.end ()) ? it->second : -1;
}

size_t cycle_bucket_list_t::size () const
{
    return m_size;
}

size_t cycle_bucket_list_t::cycles () const
{
    return m_buckets.size ();
}

void cycle_bucket_list_t::clear ()
{
    m_buckets.clear ();
    m_rid_to_cycle.clear ();
    m_size = 0;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
