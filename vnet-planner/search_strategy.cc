// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/search_strategy.h"

#include <string>

#include <base/check.h>
#include <base/logging.h>
#include <base/strings/strcat.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/stringprintf.h>

namespace vnet_planner {

namespace {

// Prefix length of the bucket addressed by one (outer, inner) pair.
constexpr int kBucketPrefixLength = 24;
// Shortest prefix length the expanding search can express.
constexpr int kMinExpandingPrefixLength = 16;

IPv4CIDR BucketAt(int first_octet, int outer, int inner, int prefix_length) {
  return *IPv4CIDR::CreateFromAddressAndPrefix(
      IPv4Address(static_cast<uint8_t>(first_octet),
                  static_cast<uint8_t>(outer), static_cast<uint8_t>(inner), 0),
      prefix_length);
}

}  // namespace

IPv4CIDR DefaultSearchRegion() {
  return *IPv4CIDR::CreateFromAddressAndPrefix(IPv4Address(172, 16, 0, 0), 12);
}

// static
base::expected<std::unique_ptr<SearchStrategy>, PlanError>
SearchStrategy::Create(SearchStrategyType type,
                       const IPv4CIDR& region,
                       const std::optional<IPv4Address>& start) {
  switch (type) {
    case SearchStrategyType::kBase:
      if (start) {
        LOG(WARNING) << "Start address " << *start
                     << " is ignored by the base search";
      }
      return std::make_unique<BaseSearchStrategy>(region);
    case SearchStrategyType::kExpanding: {
      const IPv4Address first = start.value_or(region.address());
      // The expanding search never leaves the first octet of the region.
      if (!region.InSameSubnetWith(first) ||
          first.GetOctet(0) != region.address().GetOctet(0)) {
        return base::unexpected(PlanError::InvalidCIDR(
            first.ToString(), base::StrCat({"Start address is outside of the "
                                            "search region ",
                                            region.ToString()})));
      }
      return std::make_unique<ExpandingSearchStrategy>(region, first);
    }
  }
}

SearchStrategy::SearchStrategy(const IPv4CIDR& region) : region_(region) {}

SearchStrategy::~SearchStrategy() = default;

base::expected<IPv4CIDR, PlanError> SearchStrategy::FindFirstFree(
    int prefix_length, const ReservationSet& reserved) const {
  if (!IPv4CIDR::IsValidPrefixLength(prefix_length)) {
    return base::unexpected(PlanError::InvalidCIDR(
        base::StrCat({"/", base::NumberToString(prefix_length)}),
        "Prefix length must be between 0 and 32"));
  }

  size_t candidates_tried = 0;
  for (auto candidate = GetFirstCandidate(prefix_length); candidate;
       candidate = GetNextCandidate(*candidate)) {
    ++candidates_tried;
    if (!reserved.Overlaps(*candidate)) {
      VLOG(1) << type() << " search picked " << *candidate << " after "
              << candidates_tried << " candidates";
      return *candidate;
    }
  }

  std::string message = base::StringPrintf(
      "No free /%d block found in %s by the %s search after trying %zu "
      "candidates",
      prefix_length, region().ToString().c_str(),
      type() == SearchStrategyType::kBase ? "base" : "expanding",
      candidates_tried);
  if (candidates_tried == 0) {
    base::StrAppend(&message,
                    {"; the region has no candidate of that prefix length"});
  } else if (const auto covering = reserved.FindContaining(region())) {
    base::StrAppend(&message, {"; the existing reservation ",
                               covering->ToString(), " covers all of ",
                               region().ToString()});
  }
  return base::unexpected(PlanError::SearchExhausted(message));
}

BaseSearchStrategy::BaseSearchStrategy(const IPv4CIDR& base)
    : SearchStrategy(base) {}

BaseSearchStrategy::~BaseSearchStrategy() = default;

std::optional<IPv4CIDR> BaseSearchStrategy::GetFirstCandidate(
    int prefix_length) const {
  if (prefix_length < region().prefix_length()) {
    return std::nullopt;
  }
  return IPv4CIDR::CreateFromAddressAndPrefix(region().address(),
                                              prefix_length);
}

std::optional<IPv4CIDR> BaseSearchStrategy::GetNextCandidate(
    const IPv4CIDR& candidate) const {
  const auto next = candidate.GetNextSibling();
  if (!next || !region().Contains(*next)) {
    return std::nullopt;
  }
  return next;
}

SearchStrategyType BaseSearchStrategy::type() const {
  return SearchStrategyType::kBase;
}

ExpandingSearchStrategy::ExpandingSearchStrategy(const IPv4CIDR& region,
                                                 const IPv4Address& start)
    : SearchStrategy(region) {
  DCHECK(region.InSameSubnetWith(start));

  const IPv4Address first = region.address();
  const IPv4Address last = region.GetBroadcast();
  first_octet_ = first.GetOctet(0);

  // Regions wider than a /8 are clipped to the /8 of their base address.
  outer_min_ = first.GetOctet(1);
  outer_max_ = region.prefix_length() >= 8 ? last.GetOctet(1) : 255;
  inner_min_ = region.prefix_length() >= 16 ? first.GetOctet(2) : 0;
  inner_max_ = region.prefix_length() >= 16 ? last.GetOctet(2) : 255;

  start_outer_ = start.GetOctet(1);
  start_inner_ = start.GetOctet(2);
}

ExpandingSearchStrategy::~ExpandingSearchStrategy() = default;

std::optional<IPv4CIDR> ExpandingSearchStrategy::GetFirstCandidate(
    int prefix_length) const {
  if (prefix_length < kMinExpandingPrefixLength ||
      prefix_length > IPv4CIDR::kMaxPrefixLength) {
    return std::nullopt;
  }
  return FirstCandidateFrom(start_outer_, start_inner_, prefix_length);
}

std::optional<IPv4CIDR> ExpandingSearchStrategy::GetNextCandidate(
    const IPv4CIDR& candidate) const {
  const int outer = candidate.address().GetOctet(1);
  const int inner = candidate.address().GetOctet(2);

  if (candidate.prefix_length() > kBucketPrefixLength) {
    const IPv4CIDR bucket =
        BucketAt(first_octet_, outer, inner, kBucketPrefixLength);
    for (auto next = candidate.GetNextSibling(); next && bucket.Contains(*next);
         next = next->GetNextSibling()) {
      if (region().Contains(*next)) {
        return next;
      }
    }
  }
  return FirstCandidateFrom(outer, inner + 1, candidate.prefix_length());
}

SearchStrategyType ExpandingSearchStrategy::type() const {
  return SearchStrategyType::kExpanding;
}

std::optional<IPv4CIDR> ExpandingSearchStrategy::FirstCandidateFrom(
    int outer, int inner, int prefix_length) const {
  // Blocks shorter than a /24 span several inner indexes.
  const int inner_step = prefix_length < kBucketPrefixLength
                             ? 1 << (kBucketPrefixLength - prefix_length)
                             : 1;

  for (; outer <= outer_max_; ++outer, inner = inner_min_) {
    for (; inner <= inner_max_; ++inner) {
      if (inner % inner_step != 0) {
        continue;
      }
      if (prefix_length <= kBucketPrefixLength) {
        const IPv4CIDR candidate =
            BucketAt(first_octet_, outer, inner, prefix_length);
        if (region().Contains(candidate)) {
          return candidate;
        }
        continue;
      }
      // Longer prefixes walk the blocks inside the bucket.
      const IPv4CIDR bucket =
          BucketAt(first_octet_, outer, inner, kBucketPrefixLength);
      for (std::optional<IPv4CIDR> candidate =
               BucketAt(first_octet_, outer, inner, prefix_length);
           candidate && bucket.Contains(*candidate);
           candidate = candidate->GetNextSibling()) {
        if (region().Contains(*candidate)) {
          return candidate;
        }
      }
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& stream, SearchStrategyType type) {
  switch (type) {
    case SearchStrategyType::kExpanding:
      return stream << "expanding";
    case SearchStrategyType::kBase:
      return stream << "base";
  }
}

std::optional<SearchStrategyType> ParseSearchStrategyType(
    std::string_view name) {
  if (name == "expanding") {
    return SearchStrategyType::kExpanding;
  }
  if (name == "base") {
    return SearchStrategyType::kBase;
  }
  return std::nullopt;
}

}  // namespace vnet_planner
