// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_IPV4_CIDR_H_
#define VNET_PLANNER_IPV4_CIDR_H_

#include <stdint.h>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <brillo/brillo_export.h>

#include "vnet-planner/ipv4_address.h"

namespace vnet_planner {

// Represents an IPv4 address block, i.e. a network address and a prefix
// length. The address is always the base address of the block: host bits are
// masked out on creation, so "10.0.0.1/24" and "10.0.0.0/24" are the same
// block.
class BRILLO_EXPORT IPv4CIDR {
 public:
  static constexpr int kMaxPrefixLength = 32;

  // Returns true if |prefix_length| is in [0, kMaxPrefixLength].
  static constexpr bool IsValidPrefixLength(int prefix_length) {
    return 0 <= prefix_length && prefix_length <= kMaxPrefixLength;
  }

  // Returns the number of addresses in a block of |prefix_length|, i.e.
  // 2^(32 - prefix_length). |prefix_length| must be valid.
  static uint64_t GetAddressCount(int prefix_length);

  // Creates the block from the "a.b.c.d/p" notation. Returns std::nullopt if
  // the address or the prefix length is malformed or out of range.
  static std::optional<IPv4CIDR> CreateFromCIDRString(
      std::string_view cidr_string);

  // Creates the block from the address notation string and the prefix length.
  // Returns std::nullopt if the string format or the prefix length is invalid.
  static std::optional<IPv4CIDR> CreateFromStringAndPrefix(
      std::string_view address_string, int prefix_length);

  // Creates the block containing |address| with |prefix_length|. Returns
  // std::nullopt if the prefix length is invalid.
  static std::optional<IPv4CIDR> CreateFromAddressAndPrefix(
      const IPv4Address& address, int prefix_length);

  // Constructs "0.0.0.0/0".
  constexpr IPv4CIDR() = default;

  // Getter methods for the internal data.
  const IPv4Address& address() const { return address_; }
  int prefix_length() const { return prefix_length_; }

  // Returns the number of addresses in this block.
  uint64_t GetAddressCount() const;

  // Creates the address that has all the high-order prefix length bits set.
  IPv4Address ToNetmask() const;

  // Returns the last address of the block, i.e. all host-part bits set to 1.
  IPv4Address GetBroadcast() const;

  // Returns true if |address| is inside this block.
  bool InSameSubnetWith(const IPv4Address& address) const;

  // Returns true if every address of |other| is inside this block. A block
  // contains itself.
  bool Contains(const IPv4CIDR& other) const;

  // Returns true if this block and |other| share at least one address. The
  // relation is symmetric and reflexive.
  bool Overlaps(const IPv4CIDR& other) const;

  // Returns the block of the same size that directly follows this one, or
  // std::nullopt if this block ends at 255.255.255.255.
  std::optional<IPv4CIDR> GetNextSibling() const;

  // Returns the string in the CIDR notation.
  std::string ToString() const;

  bool operator==(const IPv4CIDR& rhs) const;
  bool operator!=(const IPv4CIDR& rhs) const;
  // Orders by base address, then by prefix length.
  bool operator<(const IPv4CIDR& rhs) const;

 private:
  IPv4CIDR(const IPv4Address& address, int prefix_length);

  // Returns the first and the last address as host-order values.
  uint32_t FirstHostOrder() const;
  uint32_t LastHostOrder() const;

  IPv4Address address_;
  int prefix_length_ = 0;
};

BRILLO_EXPORT std::ostream& operator<<(std::ostream& os, const IPv4CIDR& cidr);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_IPV4_CIDR_H_
