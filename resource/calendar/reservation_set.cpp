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
#include "resource/calendar/reservation_set.hpp"

namespace Lease {
namespace resource_model {

int reservation_set_t::add (const reservation_ref_t &r)
{
    if (!r) {
        errno = EINVAL;
        return -1;
    }
    m_set[r->get_reservation_id ()] = r;
    return 0;
}

void reservation_set_t::remove (const std::string &rid)
{
    m_set.erase (rid);
}

void reservation_set_t::remove (const reservation_ref_t &r)
{
    if (r)
        m_set.erase (r->get_reservation_id ());
}

bool reservation_set_t::contains (const std::string &rid) const
{
    return m_set.find (rid) != m_set.end ();
}

bool reservation_set_t::contains (const reservation_ref_t &r) const
{
    return r && contains (r->get_reservation_id ());
}

reservation_ref_t reservation_set_t::get (const std::string &rid) const
{
    auto it = m_set.find (rid);
    return (it != m_set.end ()) ? it->second : nullptr;
}

reservation_set_t &reservation_set_t::operator+= (const reservation_set_t &o)
{
    for (const auto &kv : o.m_set)
        m_set[kv.first] = kv.second;
    return *this;
}

size_t reservation_set_t::size () const
{
    return m_set.size ();
}

bool reservation_set_t::empty () const
{
    return m_set.empty ();
}

void reservation_set_t::clear ()
{
    m_set.clear ();
}

reservation_set_t::const_iterator reservation_set_t::begin () const
{
    return m_set.begin ();
}

reservation_set_t::const_iterator reservation_set_t::end () const
{
    return m_set.end ();
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
