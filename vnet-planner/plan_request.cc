// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/plan_request.h"

#include <set>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_split.h>
#include <base/strings/string_util.h>

namespace vnet_planner {

// static
SubnetRequest SubnetRequest::WithPrefixLength(std::string_view role,
                                              int prefix_length) {
  SubnetRequest request;
  request.role = std::string(role);
  request.prefix_length = prefix_length;
  return request;
}

// static
SubnetRequest SubnetRequest::WithUsableAddresses(std::string_view role,
                                                 uint64_t usable_addresses) {
  SubnetRequest request;
  request.role = std::string(role);
  request.usable_addresses = usable_addresses;
  return request;
}

bool SubnetRequest::operator==(const SubnetRequest& rhs) const {
  return role == rhs.role && prefix_length == rhs.prefix_length &&
         usable_addresses == rhs.usable_addresses;
}

PlanRequest::PlanRequest() : region(DefaultSearchRegion()) {}
PlanRequest::PlanRequest(const PlanRequest& other) = default;
PlanRequest& PlanRequest::operator=(const PlanRequest& other) = default;
PlanRequest::~PlanRequest() = default;

std::optional<std::vector<SubnetRequest>> ParseSubnetRequests(
    std::string_view subnets) {
  std::vector<SubnetRequest> requests;
  std::set<std::string> roles;
  for (const auto entry : base::SplitStringPiece(
           subnets, ",", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY)) {
    const auto parts = base::SplitStringPiece(
        entry, "=", base::TRIM_WHITESPACE, base::SPLIT_WANT_ALL);
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
      LOG(ERROR) << "Subnet entry \"" << entry
                 << "\" is not of the form role=/prefix or role=count";
      return std::nullopt;
    }

    const std::string role(parts[0]);
    if (!roles.insert(role).second) {
      LOG(ERROR) << "Subnet role \"" << role << "\" is requested twice";
      return std::nullopt;
    }

    if (base::StartsWith(parts[1], "/")) {
      int prefix_length;
      if (!base::StringToInt(parts[1].substr(1), &prefix_length)) {
        LOG(ERROR) << "Invalid prefix length for subnet \"" << role
                   << "\": " << parts[1];
        return std::nullopt;
      }
      requests.push_back(SubnetRequest::WithPrefixLength(role, prefix_length));
      continue;
    }

    uint64_t usable_addresses;
    if (!base::StringToUint64(parts[1], &usable_addresses)) {
      LOG(ERROR) << "Invalid usable address count for subnet \"" << role
                 << "\": " << parts[1];
      return std::nullopt;
    }
    requests.push_back(
        SubnetRequest::WithUsableAddresses(role, usable_addresses));
  }
  return requests;
}

}  // namespace vnet_planner
