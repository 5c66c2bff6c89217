// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_IPV4_ADDRESS_H_
#define VNET_PLANNER_IPV4_ADDRESS_H_

#include <stdint.h>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <brillo/brillo_export.h>

namespace vnet_planner {

// A single IPv4 address. The value is kept in host byte order so that block
// arithmetic (masking, stepping to the next block) is plain integer math.
class BRILLO_EXPORT IPv4Address {
 public:
  // Parses the dotted-decimal "a.b.c.d" form. Shorthands accepted by
  // inet_aton(), like "10.1", are rejected.
  static std::optional<IPv4Address> CreateFromString(
      std::string_view address_string);

  // e.g. 0x0a000001 is "10.0.0.1".
  static constexpr IPv4Address CreateFromHostOrder(uint32_t value) {
    return IPv4Address(value);
  }

  // "0.0.0.0".
  constexpr IPv4Address() = default;

  // |b0| is the first octet of the dotted-decimal form.
  constexpr IPv4Address(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3)
      : value_((uint32_t{b0} << 24) | (uint32_t{b1} << 16) |
               (uint32_t{b2} << 8) | uint32_t{b3}) {}

  // Returns the octet at |index|, 0 being the leftmost one.
  uint8_t GetOctet(int index) const;

  uint32_t ToHostOrder() const { return value_; }

  std::string ToString() const;

  bool operator==(const IPv4Address& rhs) const { return value_ == rhs.value_; }
  bool operator!=(const IPv4Address& rhs) const { return value_ != rhs.value_; }
  bool operator<(const IPv4Address& rhs) const { return value_ < rhs.value_; }

 private:
  constexpr explicit IPv4Address(uint32_t value) : value_(value) {}

  uint32_t value_ = 0;
};

BRILLO_EXPORT std::ostream& operator<<(std::ostream& os,
                                       const IPv4Address& address);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_IPV4_ADDRESS_H_
