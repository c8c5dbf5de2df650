/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef DELEGATION_HPP
#define DELEGATION_HPP

#include <string>
#include <vector>

namespace Lease {
namespace resource_model {

/*! A pool of capacities or labels advertised by a substrate element and
 *  scoped by the delegation that handed it to this actor.
 */
template<class T>
struct delegation_t {
    std::string delegation_id;
    T pool;
};

template<class T>
class delegations_t {
   public:
    void add (const std::string &delegation_id, const T &pool)
    {
        m_delegations.push_back (delegation_t<T>{delegation_id, pool});
    }

    /*! The delegation an allocation attempt draws from: the first one.
     *
     *  \return  pointer to the selected delegation or nullptr when
     *           nothing has been delegated.
     */
    const delegation_t<T> *select () const
    {
        return m_delegations.empty () ? nullptr : &m_delegations.front ();
    }

    delegation_t<T> *select ()
    {
        return m_delegations.empty () ? nullptr : &m_delegations.front ();
    }

    bool empty () const
    {
        return m_delegations.empty ();
    }

    size_t size () const
    {
        return m_delegations.size ();
    }

    typename std::vector<delegation_t<T>>::const_iterator begin () const
    {
        return m_delegations.begin ();
    }

    typename std::vector<delegation_t<T>>::const_iterator end () const
    {
        return m_delegations.end ();
    }

   private:
    std::vector<delegation_t<T>> m_delegations;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // DELEGATION_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
