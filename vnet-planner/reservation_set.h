// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_RESERVATION_SET_H_
#define VNET_PLANNER_RESERVATION_SET_H_

#include <optional>
#include <string>
#include <vector>

#include <base/containers/flat_set.h>
#include <base/types/expected.h>
#include <brillo/brillo_export.h>

#include "vnet-planner/ipv4_cidr.h"
#include "vnet-planner/plan_error.h"

namespace vnet_planner {

// A deduplicated collection of address blocks that are not available for new
// allocations. A set only grows: blocks can be added but never removed.
class BRILLO_EXPORT ReservationSet {
 public:
  // Parses every entry of |cidr_strings|. Entries with host bits set are
  // normalized to their block. Fails with kInvalidCIDR on the first entry that
  // cannot be parsed.
  static base::expected<ReservationSet, PlanError> CreateFromStrings(
      const std::vector<std::string>& cidr_strings);

  ReservationSet();
  explicit ReservationSet(const std::vector<IPv4CIDR>& cidrs);
  ReservationSet(const ReservationSet& other);
  ReservationSet& operator=(const ReservationSet& other);
  ReservationSet(ReservationSet&& other);
  ReservationSet& operator=(ReservationSet&& other);
  ~ReservationSet();

  // Adds |cidr| to the set. Returns false if the block was already there.
  bool Add(const IPv4CIDR& cidr);

  // Returns true if |cidr| overlaps any block of the set.
  bool Overlaps(const IPv4CIDR& cidr) const;

  // Returns the first block of the set that contains all of |cidr|, if any.
  std::optional<IPv4CIDR> FindContaining(const IPv4CIDR& cidr) const;

  size_t size() const { return cidrs_.size(); }
  bool empty() const { return cidrs_.empty(); }

  // Blocks in ascending order.
  const base::flat_set<IPv4CIDR>& cidrs() const { return cidrs_; }

 private:
  base::flat_set<IPv4CIDR> cidrs_;
};

}  // namespace vnet_planner

#endif  // VNET_PLANNER_RESERVATION_SET_H_
