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

#include "resource/schema/capacities.hpp"

namespace Lease {
namespace resource_model {

capacities_t::capacities_t (std::initializer_list<std::pair<const std::string, int64_t>> il)
    : m_fields (il)
{
}

int64_t capacities_t::get (const std::string &field) const
{
    auto it = m_fields.find (field);
    return (it != m_fields.end ()) ? it->second : 0;
}

void capacities_t::set (const std::string &field, int64_t value)
{
    m_fields[field] = value;
}

bool capacities_t::has (const std::string &field) const
{
    return m_fields.find (field) != m_fields.end ();
}

const std::map<std::string, int64_t> &capacities_t::fields () const
{
    return m_fields;
}

bool capacities_t::empty () const
{
    return m_fields.empty ();
}

capacities_t &capacities_t::operator+= (const capacities_t &o)
{
    for (const auto &kv : o.m_fields)
        m_fields[kv.first] += kv.second;
    return *this;
}

capacities_t &capacities_t::operator-= (const capacities_t &o)
{
    for (const auto &kv : o.m_fields)
        m_fields[kv.first] -= kv.second;
    return *this;
}

capacities_t capacities_t::operator+ (const capacities_t &o) const
{
    capacities_t result = *this;
    result += o;
    return result;
}

capacities_t capacities_t::operator- (const capacities_t &o) const
{
    capacities_t result = *this;
    result -= o;
    return result;
}

bool capacities_t::operator== (const capacities_t &o) const
{
    // Absent and zero-valued fields are the same thing
    for (const auto &kv : m_fields) {
        if (o.get (kv.first) != kv.second)
            return false;
    }
    for (const auto &kv : o.m_fields) {
        if (get (kv.first) != kv.second)
            return false;
    }
    return true;
}

bool capacities_t::operator!= (const capacities_t &o) const
{
    return !operator== (o);
}

std::vector<std::string> capacities_t::negative_fields () const
{
    std::vector<std::string> negatives;
    for (const auto &kv : m_fields) {
        if (kv.second < 0)
            negatives.push_back (kv.first);
    }
    return negatives;
}

std::ostream &operator<< (std::ostream &out, const capacities_t &c)
{
    bool first = true;
    out << "{";
    for (const auto &kv : c.fields ()) {
        if (!first)
            out << ", ";
        out << kv.first << ":" << kv.second;
        first = false;
    }
    out << "}";
    return out;
}

}  // namespace resource_model
}  // namespace Lease

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
