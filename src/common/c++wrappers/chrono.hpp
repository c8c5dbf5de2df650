/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef WRAPPERS_CHRONO_HPP
#define WRAPPERS_CHRONO_HPP
#include <chrono>
#include <cstdint>

namespace Lease {
namespace chrono {
template<typename clock = std::chrono::system_clock>
int64_t millis_since_epoch (const typename clock::time_point &when)
{
    auto duration_since_epoch = when.time_since_epoch ();
    return std::chrono::duration_cast<std::chrono::milliseconds> (duration_since_epoch).count ();
}

template<typename clock = std::chrono::system_clock>
int64_t millis_since_epoch ()
{
    return millis_since_epoch<clock> (clock::now ());
}

template<typename clock = std::chrono::system_clock>
typename clock::time_point time_point_from_millis (int64_t millis)
{
    return typename clock::time_point (
        std::chrono::duration_cast<typename clock::duration> (std::chrono::milliseconds (millis)));
}
}  // namespace chrono
}  // namespace Lease

#endif
