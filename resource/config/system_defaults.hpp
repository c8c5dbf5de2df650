/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef SYSTEM_DEFAULT_HPP
#define SYSTEM_DEFAULT_HPP

#include <cstdint>

namespace Lease {
namespace resource_model {
namespace detail {
const int64_t SYSTEM_DEFAULT_CYCLE_MILLIS = 1000;
const int64_t SYSTEM_DEFAULT_BEGINNING_OF_TIME = 0;
const char *const SYSTEM_DEFAULT_VNIC_MODEL = "OpenStack-vNIC";
const int SYSTEM_DEFAULT_IPV4_SUBNET_PREFIX = 24;
const int SYSTEM_DEFAULT_IPV6_SUBNET_PREFIX = 64;
const int SYSTEM_DEFAULT_RESERVED_SUBNETS = 1;  // control plane
const char *const SYSTEM_DEFAULT_VLAN_EXHAUSTION = "strict";
const int SYSTEM_MIN_VLAN = 1;
const int SYSTEM_MAX_VLAN = 4095;
}  // namespace detail
}  // namespace resource_model
}  // namespace Lease

#endif  // SYSTEM_DEFAULT_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
