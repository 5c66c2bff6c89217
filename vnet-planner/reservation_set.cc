// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/reservation_set.h"

#include <algorithm>

#include <base/logging.h>

namespace vnet_planner {

// static
base::expected<ReservationSet, PlanError> ReservationSet::CreateFromStrings(
    const std::vector<std::string>& cidr_strings) {
  ReservationSet reservations;
  for (const auto& cidr_string : cidr_strings) {
    const auto cidr = IPv4CIDR::CreateFromCIDRString(cidr_string);
    if (!cidr) {
      return base::unexpected(PlanError::InvalidCIDR(
          cidr_string, "Existing reservation is not a valid IPv4 CIDR"));
    }
    if (!reservations.Add(*cidr)) {
      VLOG(1) << "Duplicate reservation " << cidr_string << " ignored";
    }
  }
  return reservations;
}

ReservationSet::ReservationSet() = default;

ReservationSet::ReservationSet(const std::vector<IPv4CIDR>& cidrs)
    : cidrs_(cidrs.begin(), cidrs.end()) {}

ReservationSet::ReservationSet(const ReservationSet& other) = default;
ReservationSet& ReservationSet::operator=(const ReservationSet& other) =
    default;
ReservationSet::ReservationSet(ReservationSet&& other) = default;
ReservationSet& ReservationSet::operator=(ReservationSet&& other) = default;
ReservationSet::~ReservationSet() = default;

bool ReservationSet::Add(const IPv4CIDR& cidr) {
  return cidrs_.insert(cidr).second;
}

bool ReservationSet::Overlaps(const IPv4CIDR& cidr) const {
  return std::any_of(
      cidrs_.begin(), cidrs_.end(),
      [&cidr](const IPv4CIDR& reserved) { return reserved.Overlaps(cidr); });
}

std::optional<IPv4CIDR> ReservationSet::FindContaining(
    const IPv4CIDR& cidr) const {
  const auto it = std::find_if(
      cidrs_.begin(), cidrs_.end(),
      [&cidr](const IPv4CIDR& reserved) { return reserved.Contains(cidr); });
  if (it == cidrs_.end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace vnet_planner
