/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef RESERVATION_SET_HPP
#define RESERVATION_SET_HPP

#include <map>
#include <string>
#include "resource/schema/reservation.hpp"

namespace Lease {
namespace resource_model {

/*! Set of reservation handles keyed by reservation id. Iteration is in
 *  reservation id order. Copies are independent snapshots of the handles.
 */
class reservation_set_t {
   public:
    using container_t = std::map<std::string, reservation_ref_t>;
    using const_iterator = container_t::const_iterator;

    /*! Add a reservation, replacing any handle with the same id.
     *
     *  \return  0 on success; -1 with errno set to EINVAL on a null handle.
     */
    int add (const reservation_ref_t &r);

    //! Removing an absent reservation is a no-op.
    void remove (const std::string &rid);
    void remove (const reservation_ref_t &r);

    bool contains (const std::string &rid) const;
    bool contains (const reservation_ref_t &r) const;

    //! \return  the handle or nullptr.
    reservation_ref_t get (const std::string &rid) const;

    //! Insert every handle of o into this set.
    reservation_set_t &operator+= (const reservation_set_t &o);

    size_t size () const;
    bool empty () const;
    void clear ();

    const_iterator begin () const;
    const_iterator end () const;

   private:
    container_t m_set;
};

}  // namespace resource_model
}  // namespace Lease

#endif  // RESERVATION_SET_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
