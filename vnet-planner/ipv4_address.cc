// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/ipv4_address.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <base/check.h>
#include <base/check_op.h>

namespace vnet_planner {

// static
std::optional<IPv4Address> IPv4Address::CreateFromString(
    std::string_view address_string) {
  // inet_pton() reads a NUL-terminated string no longer than
  // "255.255.255.255".
  if (address_string.size() >= INET_ADDRSTRLEN) {
    return std::nullopt;
  }
  const std::string terminated(address_string);
  struct in_addr addr;
  if (inet_pton(AF_INET, terminated.c_str(), &addr) != 1) {
    return std::nullopt;
  }
  return IPv4Address(ntohl(addr.s_addr));
}

uint8_t IPv4Address::GetOctet(int index) const {
  DCHECK_GE(index, 0);
  DCHECK_LT(index, 4);
  return static_cast<uint8_t>((value_ >> (24 - 8 * index)) & 0xff);
}

std::string IPv4Address::ToString() const {
  struct in_addr addr = {.s_addr = htonl(value_)};
  char buf[INET_ADDRSTRLEN];
  const char* res = inet_ntop(AF_INET, &addr, buf, sizeof(buf));
  DCHECK(res);
  return std::string(buf);
}

std::ostream& operator<<(std::ostream& os, const IPv4Address& address) {
  return os << address.ToString();
}

}  // namespace vnet_planner
