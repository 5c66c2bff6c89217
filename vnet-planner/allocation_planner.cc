// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/allocation_planner.h"

#include <memory>

#include <base/check.h>
#include <base/containers/flat_set.h>
#include <base/logging.h>
#include <base/strings/strcat.h>
#include <base/strings/string_number_conversions.h>

#include "vnet-planner/capacity.h"
#include "vnet-planner/search_strategy.h"

namespace vnet_planner {

namespace {

// Rounds |value| up to a multiple of |alignment|, which is a power of two.
uint64_t AlignUp(uint64_t value, uint64_t alignment) {
  DCHECK_NE(alignment, 0u);
  return (value + alignment - 1) & ~(alignment - 1);
}

std::string PrefixLiteral(int prefix_length) {
  return base::StrCat({"/", base::NumberToString(prefix_length)});
}

}  // namespace

AllocationPlan::AllocationPlan() = default;
AllocationPlan::AllocationPlan(const AllocationPlan& other) = default;
AllocationPlan& AllocationPlan::operator=(const AllocationPlan& other) =
    default;
AllocationPlan::~AllocationPlan() = default;

std::optional<IPv4CIDR> AllocationPlan::GetSubnet(std::string_view role) const {
  for (const auto& [subnet_role, cidr] : subnets) {
    if (subnet_role == role) {
      return cidr;
    }
  }
  return std::nullopt;
}

bool AllocationPlan::operator==(const AllocationPlan& rhs) const {
  return network == rhs.network && subnets == rhs.subnets;
}

AllocationPlanner::AllocationPlanner(const ReservationSet& reserved)
    : reserved_(reserved) {}

AllocationPlanner::~AllocationPlanner() = default;

base::expected<AllocationPlan, PlanError> AllocationPlanner::Plan(
    const PlanRequest& request) const {
  const auto subnet_prefixes = SizeSubnets(request);
  if (!subnet_prefixes.has_value()) {
    return base::unexpected(subnet_prefixes.error());
  }

  const auto network_prefix = SizeNetwork(request, *subnet_prefixes);
  if (!network_prefix.has_value()) {
    return base::unexpected(network_prefix.error());
  }

  const auto strategy =
      SearchStrategy::Create(request.strategy, request.region, request.start);
  if (!strategy.has_value()) {
    return base::unexpected(strategy.error());
  }

  const auto network =
      (*strategy)->FindFirstFree(*network_prefix, reserved_);
  if (!network.has_value()) {
    return base::unexpected(network.error());
  }

  const auto subnets = PackSubnets(*network, request, *subnet_prefixes);
  if (!subnets.has_value()) {
    return base::unexpected(subnets.error());
  }

  AllocationPlan plan;
  plan.network = *network;
  for (size_t i = 0; i < subnets->size(); ++i) {
    plan.subnets.emplace_back(request.subnets[i].role, (*subnets)[i]);
  }
  LOG(INFO) << "Planned network " << plan.network << " with "
            << plan.subnets.size() << " subnets against " << reserved_.size()
            << " existing reservations";
  return plan;
}

// static
base::expected<std::vector<int>, PlanError> AllocationPlanner::SizeSubnets(
    const PlanRequest& request) {
  std::vector<int> prefixes;
  base::flat_set<std::string_view> roles;
  for (const auto& subnet : request.subnets) {
    if (!roles.insert(subnet.role).second) {
      return base::unexpected(PlanError::DuplicateRole(
          subnet.role, base::StrCat({"Subnet role ", subnet.role,
                                     " is requested more than once"})));
    }
    if (subnet.prefix_length) {
      if (!IPv4CIDR::IsValidPrefixLength(*subnet.prefix_length)) {
        return base::unexpected(PlanError::InvalidCIDR(
            PrefixLiteral(*subnet.prefix_length),
            base::StrCat({"Invalid prefix length for subnet ", subnet.role})));
      }
      prefixes.push_back(*subnet.prefix_length);
      continue;
    }

    const auto prefix = PrefixLengthForUsableAddresses(
        subnet.usable_addresses, request.reserved_addresses_per_subnet);
    if (!prefix.has_value()) {
      return base::unexpected(PlanError::CapacityUnsatisfiable(base::StrCat(
          {"Subnet ", subnet.role, ": ", prefix.error().message()})));
    }
    VLOG(1) << "Subnet " << subnet.role << " needs "
            << subnet.usable_addresses << " usable addresses: /" << *prefix;
    prefixes.push_back(*prefix);
  }
  return prefixes;
}

// static
base::expected<int, PlanError> AllocationPlanner::SizeNetwork(
    const PlanRequest& request, const std::vector<int>& subnet_prefixes) {
  if (request.network_prefix_length) {
    if (!IPv4CIDR::IsValidPrefixLength(*request.network_prefix_length)) {
      return base::unexpected(PlanError::InvalidCIDR(
          PrefixLiteral(*request.network_prefix_length),
          "Invalid prefix length for the network"));
    }
    return *request.network_prefix_length;
  }

  if (request.network_address_count) {
    return PrefixLengthForTotalAddresses(*request.network_address_count);
  }

  if (subnet_prefixes.empty()) {
    return base::unexpected(PlanError::CapacityUnsatisfiable(
        "The network size cannot be derived without any subnet"));
  }

  // Replays the packing from offset 0. The network block is aligned to its
  // own size, which is at least the size of any subnet, so the same offsets
  // hold once the block is placed.
  uint64_t end = 0;
  for (const int prefix_length : subnet_prefixes) {
    const uint64_t size = IPv4CIDR::GetAddressCount(prefix_length);
    end = AlignUp(end, size) + size;
  }
  return PrefixLengthForTotalAddresses(end);
}

base::expected<std::vector<IPv4CIDR>, PlanError>
AllocationPlanner::PackSubnets(const IPv4CIDR& network,
                               const PlanRequest& request,
                               const std::vector<int>& subnet_prefixes) const {
  DCHECK_EQ(request.subnets.size(), subnet_prefixes.size());

  // Pre-existing reservations plus the subnets committed so far.
  ReservationSet working = reserved_;
  std::vector<IPv4CIDR> packed;

  uint64_t cursor = network.address().ToHostOrder();
  const uint64_t network_end = cursor + network.GetAddressCount();
  for (size_t i = 0; i < subnet_prefixes.size(); ++i) {
    const std::string& role = request.subnets[i].role;
    const uint64_t size = IPv4CIDR::GetAddressCount(subnet_prefixes[i]);
    cursor = AlignUp(cursor, size);
    if (cursor + size > network_end) {
      return base::unexpected(PlanError::SubnetOverflow(base::StrCat(
          {"Subnet ", role, " (", PrefixLiteral(subnet_prefixes[i]),
           ") does not fit in the remaining space of network ",
           network.ToString()})));
    }

    const IPv4CIDR subnet = *IPv4CIDR::CreateFromAddressAndPrefix(
        IPv4Address::CreateFromHostOrder(static_cast<uint32_t>(cursor)),
        subnet_prefixes[i]);
    if (!network.Contains(subnet) || working.Overlaps(subnet)) {
      return base::unexpected(PlanError::SubnetOverflow(
          base::StrCat({"Subnet ", role, " at ", subnet.ToString(),
                        " collides with an existing block"})));
    }

    working.Add(subnet);
    packed.push_back(subnet);
    cursor += size;
  }
  return packed;
}

}  // namespace vnet_planner
