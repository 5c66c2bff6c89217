// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_CAPACITY_H_
#define VNET_PLANNER_CAPACITY_H_

#include <stdint.h>

#include <base/types/expected.h>
#include <brillo/brillo_export.h>

#include "vnet-planner/plan_error.h"

namespace vnet_planner {

// Number of addresses the hosting platform keeps in every subnet: the network
// address, the broadcast address, the default gateway and two addresses for
// platform services.
inline constexpr uint32_t kDefaultReservedAddressesPerSubnet = 5;

// Returns the longest prefix length whose block leaves at least
// |usable_addresses| addresses once |reserved_addresses| are taken by the
// platform, e.g. 10 usable addresses with 5 reserved need a /28.
BRILLO_EXPORT base::expected<int, PlanError> PrefixLengthForUsableAddresses(
    uint64_t usable_addresses, uint32_t reserved_addresses);

// Returns the longest prefix length whose block holds at least
// |total_addresses| addresses. |total_addresses| must be in [1, 2^32].
BRILLO_EXPORT base::expected<int, PlanError> PrefixLengthForTotalAddresses(
    uint64_t total_addresses);

// Returns the number of addresses left for hosts in a block of
// |prefix_length|, or 0 if the block is not larger than |reserved_addresses|.
BRILLO_EXPORT uint64_t UsableAddressCount(int prefix_length,
                                          uint32_t reserved_addresses);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_CAPACITY_H_
