// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_ALLOCATION_PLANNER_H_
#define VNET_PLANNER_ALLOCATION_PLANNER_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <base/types/expected.h>
#include <brillo/brillo_export.h>

#include "vnet-planner/ipv4_cidr.h"
#include "vnet-planner/plan_error.h"
#include "vnet-planner/plan_request.h"
#include "vnet-planner/reservation_set.h"

namespace vnet_planner {

// The outcome of a successful planning run: the network block and the block
// of every requested subnet, in request order. Every subnet is inside
// |network|, subnets do not overlap each other, and neither |network| nor any
// subnet overlaps the reservations the plan was computed against.
struct BRILLO_EXPORT AllocationPlan {
  AllocationPlan();
  AllocationPlan(const AllocationPlan& other);
  AllocationPlan& operator=(const AllocationPlan& other);
  ~AllocationPlan();

  // Returns the block assigned to |role|, if any.
  std::optional<IPv4CIDR> GetSubnet(std::string_view role) const;

  bool operator==(const AllocationPlan& rhs) const;

  IPv4CIDR network;
  std::vector<std::pair<std::string, IPv4CIDR>> subnets;
};

// Picks a free network block and packs the requested subnets inside it.
class BRILLO_EXPORT AllocationPlanner {
 public:
  // |reserved| must outlive this object and is never modified.
  explicit AllocationPlanner(const ReservationSet& reserved);
  AllocationPlanner(const AllocationPlanner&) = delete;
  AllocationPlanner& operator=(const AllocationPlanner&) = delete;

  ~AllocationPlanner();

  // Runs the whole planning: sizes every subnet, searches the network block
  // with the strategy of |request| and packs the subnets in request order.
  // Stops at the first failure.
  base::expected<AllocationPlan, PlanError> Plan(
      const PlanRequest& request) const;

  // Returns the prefix length of every subnet of |request|, in order.
  static base::expected<std::vector<int>, PlanError> SizeSubnets(
      const PlanRequest& request);

  // Returns the prefix length of the network block for |request| given the
  // sizes computed by SizeSubnets(). Without an explicit size, this is the
  // smallest block in which the subnets can be packed in request order.
  static base::expected<int, PlanError> SizeNetwork(
      const PlanRequest& request, const std::vector<int>& subnet_prefixes);

 private:
  // Places blocks of |subnet_prefixes| one after the other inside |network|,
  // each aligned to its own size.
  base::expected<std::vector<IPv4CIDR>, PlanError> PackSubnets(
      const IPv4CIDR& network,
      const PlanRequest& request,
      const std::vector<int>& subnet_prefixes) const;

  const ReservationSet& reserved_;
};

}  // namespace vnet_planner

#endif  // VNET_PLANNER_ALLOCATION_PLANNER_H_
