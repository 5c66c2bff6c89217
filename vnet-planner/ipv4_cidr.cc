// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/ipv4_cidr.h"

#include <vector>

#include <base/check.h>
#include <base/strings/string_number_conversions.h>
#include <base/strings/string_split.h>
#include <base/strings/stringprintf.h>

namespace vnet_planner {

namespace {

// Returns the netmask of |prefix_length| in host byte order.
uint32_t HostOrderNetmask(int prefix_length) {
  if (prefix_length == 0) {
    return 0;
  }
  return 0xffffffffu << (IPv4CIDR::kMaxPrefixLength - prefix_length);
}

}  // namespace

// static
uint64_t IPv4CIDR::GetAddressCount(int prefix_length) {
  DCHECK(IsValidPrefixLength(prefix_length));
  return uint64_t{1} << (kMaxPrefixLength - prefix_length);
}

// static
std::optional<IPv4CIDR> IPv4CIDR::CreateFromCIDRString(
    std::string_view cidr_string) {
  const std::vector<std::string_view> parts = base::SplitStringPiece(
      cidr_string, "/", base::TRIM_WHITESPACE, base::SPLIT_WANT_ALL);
  if (parts.size() != 2) {
    return std::nullopt;
  }

  int prefix_length;
  if (!base::StringToInt(parts[1], &prefix_length)) {
    return std::nullopt;
  }
  return CreateFromStringAndPrefix(parts[0], prefix_length);
}

// static
std::optional<IPv4CIDR> IPv4CIDR::CreateFromStringAndPrefix(
    std::string_view address_string, int prefix_length) {
  const auto address = IPv4Address::CreateFromString(address_string);
  if (!address) {
    return std::nullopt;
  }
  return CreateFromAddressAndPrefix(*address, prefix_length);
}

// static
std::optional<IPv4CIDR> IPv4CIDR::CreateFromAddressAndPrefix(
    const IPv4Address& address, int prefix_length) {
  if (!IsValidPrefixLength(prefix_length)) {
    return std::nullopt;
  }
  return IPv4CIDR(address, prefix_length);
}

IPv4CIDR::IPv4CIDR(const IPv4Address& address, int prefix_length)
    : address_(IPv4Address::CreateFromHostOrder(
          address.ToHostOrder() & HostOrderNetmask(prefix_length))),
      prefix_length_(prefix_length) {}

uint64_t IPv4CIDR::GetAddressCount() const {
  return GetAddressCount(prefix_length_);
}

IPv4Address IPv4CIDR::ToNetmask() const {
  return IPv4Address::CreateFromHostOrder(HostOrderNetmask(prefix_length_));
}

IPv4Address IPv4CIDR::GetBroadcast() const {
  return IPv4Address::CreateFromHostOrder(LastHostOrder());
}

bool IPv4CIDR::InSameSubnetWith(const IPv4Address& address) const {
  const uint32_t netmask = HostOrderNetmask(prefix_length_);
  return (address.ToHostOrder() & netmask) == FirstHostOrder();
}

bool IPv4CIDR::Contains(const IPv4CIDR& other) const {
  return prefix_length_ <= other.prefix_length_ &&
         InSameSubnetWith(other.address_);
}

bool IPv4CIDR::Overlaps(const IPv4CIDR& other) const {
  // Two aligned blocks either are disjoint or one contains the other.
  return Contains(other) || other.Contains(*this);
}

std::optional<IPv4CIDR> IPv4CIDR::GetNextSibling() const {
  const uint64_t next = uint64_t{FirstHostOrder()} + GetAddressCount();
  if (next > 0xffffffffu) {
    return std::nullopt;
  }
  return IPv4CIDR(IPv4Address::CreateFromHostOrder(static_cast<uint32_t>(next)),
                  prefix_length_);
}

std::string IPv4CIDR::ToString() const {
  return base::StringPrintf("%s/%d", address_.ToString().c_str(),
                            prefix_length_);
}

bool IPv4CIDR::operator==(const IPv4CIDR& rhs) const {
  return address_ == rhs.address_ && prefix_length_ == rhs.prefix_length_;
}

bool IPv4CIDR::operator!=(const IPv4CIDR& rhs) const {
  return !(*this == rhs);
}

bool IPv4CIDR::operator<(const IPv4CIDR& rhs) const {
  if (address_ != rhs.address_) {
    return address_ < rhs.address_;
  }
  return prefix_length_ < rhs.prefix_length_;
}

uint32_t IPv4CIDR::FirstHostOrder() const {
  return address_.ToHostOrder();
}

uint32_t IPv4CIDR::LastHostOrder() const {
  return FirstHostOrder() | ~HostOrderNetmask(prefix_length_);
}

std::ostream& operator<<(std::ostream& os, const IPv4CIDR& cidr) {
  os << cidr.ToString();
  return os;
}

}  // namespace vnet_planner
