// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_SEARCH_STRATEGY_H_
#define VNET_PLANNER_SEARCH_STRATEGY_H_

#include <memory>
#include <optional>
#include <ostream>
#include <string_view>

#include <base/types/expected.h>
#include <brillo/brillo_export.h>

#include "vnet-planner/ipv4_address.h"
#include "vnet-planner/ipv4_cidr.h"
#include "vnet-planner/plan_error.h"
#include "vnet-planner/reservation_set.h"

namespace vnet_planner {

enum class SearchStrategyType {
  // Walks the second and third octets of a region, third octet first.
  kExpanding,
  // Walks the blocks of a fixed size inside one base block.
  kBase,
};

// The address prefix searched by default: 172.16.0.0/12, one of the RFC1918
// private ranges.
BRILLO_EXPORT IPv4CIDR DefaultSearchRegion();

// Enumerates candidate blocks of a given prefix length in a fixed order and
// finds the first one that is free. Enumeration is always bounded by the
// region, and the reservations are never modified.
class BRILLO_EXPORT SearchStrategy {
 public:
  // Creates the strategy of |type| over |region|. For kExpanding, |start| is
  // the address the search starts from and must be inside |region|; it
  // defaults to the base address of |region|. kBase ignores |start|.
  static base::expected<std::unique_ptr<SearchStrategy>, PlanError> Create(
      SearchStrategyType type,
      const IPv4CIDR& region,
      const std::optional<IPv4Address>& start = std::nullopt);

  SearchStrategy(const SearchStrategy&) = delete;
  SearchStrategy& operator=(const SearchStrategy&) = delete;

  virtual ~SearchStrategy();

  // Returns the first candidate of |prefix_length| which does not overlap
  // |reserved|. Fails with kSearchExhausted once every candidate was checked.
  base::expected<IPv4CIDR, PlanError> FindFirstFree(
      int prefix_length, const ReservationSet& reserved) const;

  // Returns the first candidate of |prefix_length|, or std::nullopt if there
  // is none.
  virtual std::optional<IPv4CIDR> GetFirstCandidate(
      int prefix_length) const = 0;

  // Returns the candidate which follows |candidate| in the search order, or
  // std::nullopt if |candidate| is the last one.
  virtual std::optional<IPv4CIDR> GetNextCandidate(
      const IPv4CIDR& candidate) const = 0;

  virtual SearchStrategyType type() const = 0;

  const IPv4CIDR& region() const { return region_; }

 protected:
  explicit SearchStrategy(const IPv4CIDR& region);

 private:
  const IPv4CIDR region_;
};

// Enumerates every block of the requested size inside the base block, in
// ascending address order.
class BRILLO_EXPORT BaseSearchStrategy : public SearchStrategy {
 public:
  explicit BaseSearchStrategy(const IPv4CIDR& base);
  ~BaseSearchStrategy() override;

  std::optional<IPv4CIDR> GetFirstCandidate(int prefix_length) const override;
  std::optional<IPv4CIDR> GetNextCandidate(
      const IPv4CIDR& candidate) const override;
  SearchStrategyType type() const override;
};

// Enumerates candidates "a.outer.inner.0/prefix" of a region "a.x.y.z/p". The
// outer index is the second octet and the inner index the third octet; the
// inner index runs through its whole range before the outer index advances:
//   172.16.0.0/24, 172.16.1.0/24, ..., 172.16.255.0/24, 172.17.0.0/24, ...
// Prefixes longer than /24 walk every block of that size inside the /24 at
// "a.outer.inner.0" before moving to the next inner index. Prefixes between
// /16 and /24 only visit inner indexes aligned to the block size. Prefixes
// shorter than /16 have no candidate.
class BRILLO_EXPORT ExpandingSearchStrategy : public SearchStrategy {
 public:
  // |start| must be inside |region|. The first outer index is the second
  // octet of |start|, and for that outer index only, the inner index starts at
  // the third octet of |start|.
  ExpandingSearchStrategy(const IPv4CIDR& region, const IPv4Address& start);
  ~ExpandingSearchStrategy() override;

  std::optional<IPv4CIDR> GetFirstCandidate(int prefix_length) const override;
  std::optional<IPv4CIDR> GetNextCandidate(
      const IPv4CIDR& candidate) const override;
  SearchStrategyType type() const override;

 private:
  // Returns the first candidate at or after the /24 bucket
  // "a.|outer|.|inner|.0".
  std::optional<IPv4CIDR> FirstCandidateFrom(int outer,
                                             int inner,
                                             int prefix_length) const;

  // First octet shared by every candidate.
  int first_octet_;
  // Bounds of the outer (second octet) and inner (third octet) indexes.
  int outer_min_;
  int outer_max_;
  int inner_min_;
  int inner_max_;
  // Where the search starts.
  int start_outer_;
  int start_inner_;
};

BRILLO_EXPORT std::ostream& operator<<(std::ostream& stream,
                                       SearchStrategyType type);

// Parses "expanding" or "base".
BRILLO_EXPORT std::optional<SearchStrategyType> ParseSearchStrategyType(
    std::string_view name);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_SEARCH_STRATEGY_H_
