// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_PLAN_REQUEST_H_
#define VNET_PLANNER_PLAN_REQUEST_H_

#include <stdint.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <brillo/brillo_export.h>

#include "vnet-planner/capacity.h"
#include "vnet-planner/ipv4_address.h"
#include "vnet-planner/ipv4_cidr.h"
#include "vnet-planner/search_strategy.h"

namespace vnet_planner {

// One subnet to carve out of the network block. The block is either given
// by an explicit prefix length or sized from a usable-address count.
struct BRILLO_EXPORT SubnetRequest {
  static SubnetRequest WithPrefixLength(std::string_view role,
                                        int prefix_length);
  static SubnetRequest WithUsableAddresses(std::string_view role,
                                           uint64_t usable_addresses);

  bool operator==(const SubnetRequest& rhs) const;

  // Name of the subnet in the plan, e.g. "webApp".
  std::string role;
  // Takes precedence over |usable_addresses| when set.
  std::optional<int> prefix_length;
  uint64_t usable_addresses = 0;
};

// Everything a planning run needs besides the existing reservations.
struct BRILLO_EXPORT PlanRequest {
  PlanRequest();
  PlanRequest(const PlanRequest& other);
  PlanRequest& operator=(const PlanRequest& other);
  ~PlanRequest();

  SearchStrategyType strategy = SearchStrategyType::kExpanding;
  // Region walked by the expanding search, or the base block of the base
  // search.
  IPv4CIDR region;
  // First address tried by the expanding search. Defaults to the base
  // address of |region|.
  std::optional<IPv4Address> start;
  // Explicit size of the network block. |network_prefix_length| wins over
  // |network_address_count|; with neither, the block is the smallest that
  // holds all subnets.
  std::optional<int> network_prefix_length;
  std::optional<uint64_t> network_address_count;
  // Addresses the platform keeps in each subnet.
  uint32_t reserved_addresses_per_subnet = kDefaultReservedAddressesPerSubnet;
  // Packed in this order.
  std::vector<SubnetRequest> subnets;
};

// Parses a comma separated list of "role=/prefix" (explicit prefix length)
// or "role=count" (usable addresses) entries, e.g.
// "webApp=/27,privateEndpoint=10". Returns std::nullopt and logs the reason if
// an entry is malformed or a role appears twice.
BRILLO_EXPORT std::optional<std::vector<SubnetRequest>> ParseSubnetRequests(
    std::string_view subnets);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_PLAN_REQUEST_H_
