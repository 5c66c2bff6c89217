// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/capacity.h"

#include <algorithm>

#include <base/strings/stringprintf.h>

#include "vnet-planner/ipv4_cidr.h"

namespace vnet_planner {

namespace {

constexpr uint64_t kIPv4AddressSpaceSize = uint64_t{1} << 32;

}  // namespace

base::expected<int, PlanError> PrefixLengthForUsableAddresses(
    uint64_t usable_addresses, uint32_t reserved_addresses) {
  if (usable_addresses > kIPv4AddressSpaceSize ||
      usable_addresses + reserved_addresses > kIPv4AddressSpaceSize) {
    return base::unexpected(PlanError::CapacityUnsatisfiable(
        base::StringPrintf("%lu usable addresses with %u reserved per subnet "
                           "exceed the largest IPv4 block",
                           static_cast<unsigned long>(usable_addresses),
                           reserved_addresses)));
  }
  // Even an empty requirement takes one address.
  return PrefixLengthForTotalAddresses(
      std::max<uint64_t>(usable_addresses + reserved_addresses, 1));
}

base::expected<int, PlanError> PrefixLengthForTotalAddresses(
    uint64_t total_addresses) {
  if (total_addresses == 0) {
    return base::unexpected(PlanError::CapacityUnsatisfiable(
        "Address count must be a positive integer"));
  }
  if (total_addresses > kIPv4AddressSpaceSize) {
    return base::unexpected(PlanError::CapacityUnsatisfiable(
        base::StringPrintf("%lu addresses exceed the IPv4 address space",
                           static_cast<unsigned long>(total_addresses))));
  }

  int prefix_length = IPv4CIDR::kMaxPrefixLength;
  while (IPv4CIDR::GetAddressCount(prefix_length) < total_addresses) {
    --prefix_length;
  }
  return prefix_length;
}

uint64_t UsableAddressCount(int prefix_length, uint32_t reserved_addresses) {
  const uint64_t size = IPv4CIDR::GetAddressCount(prefix_length);
  return size > reserved_addresses ? size - reserved_addresses : 0;
}

}  // namespace vnet_planner
