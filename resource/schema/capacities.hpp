/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef CAPACITIES_HPP
#define CAPACITIES_HPP

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <ostream>

namespace Lease {
namespace resource_model {

const char *const CAP_CORE = "core";
const char *const CAP_CPU = "cpu";
const char *const CAP_RAM = "ram";
const char *const CAP_DISK = "disk";
const char *const CAP_BW = "bw";
const char *const CAP_BURST_SIZE = "burst_size";
const char *const CAP_UNIT = "unit";
const char *const CAP_MTU = "mtu";

/*! A capacity vector: a resource pool when it comes from a delegation,
 *  a single request or allocation otherwise. Fields that were never set
 *  read as zero.
 */
class capacities_t {
   public:
    capacities_t () = default;
    capacities_t (std::initializer_list<std::pair<const std::string, int64_t>> il);

    int64_t get (const std::string &field) const;
    void set (const std::string &field, int64_t value);
    bool has (const std::string &field) const;
    const std::map<std::string, int64_t> &fields () const;
    bool empty () const;

    capacities_t &operator+= (const capacities_t &o);
    capacities_t &operator-= (const capacities_t &o);
    capacities_t operator+ (const capacities_t &o) const;
    capacities_t operator- (const capacities_t &o) const;
    bool operator== (const capacities_t &o) const;
    bool operator!= (const capacities_t &o) const;

    /*! Names of the fields whose value dropped below zero. A non-empty
     *  result after subtracting a request from a pool means the pool
     *  cannot serve it.
     */
    std::vector<std::string> negative_fields () const;

   private:
    std::map<std::string, int64_t> m_fields;
};

std::ostream &operator<< (std::ostream &out, const capacities_t &c);

}  // namespace resource_model
}  // namespace Lease

#endif  // CAPACITIES_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
