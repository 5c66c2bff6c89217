// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/reservation_set.h"

#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAre;

namespace vnet_planner {
namespace {

IPv4CIDR CIDR(std::string_view cidr_string) {
  return *IPv4CIDR::CreateFromCIDRString(cidr_string);
}

TEST(ReservationSetTest, Empty) {
  const ReservationSet reservations;
  EXPECT_TRUE(reservations.empty());
  EXPECT_EQ(reservations.size(), 0u);
  EXPECT_FALSE(reservations.Overlaps(CIDR("0.0.0.0/0")));
  EXPECT_EQ(reservations.FindContaining(CIDR("10.0.0.0/24")), std::nullopt);
}

TEST(ReservationSetTest, CreateFromStrings) {
  const auto reservations = ReservationSet::CreateFromStrings(
      {"172.16.1.0/24", "10.0.0.0/16", " 192.168.0.0/24 "});
  ASSERT_TRUE(reservations.has_value());
  EXPECT_THAT(reservations->cidrs(),
              ElementsAre(CIDR("10.0.0.0/16"), CIDR("172.16.1.0/24"),
                          CIDR("192.168.0.0/24")));
}

TEST(ReservationSetTest, CreateFromStrings_Normalizes) {
  const auto reservations = ReservationSet::CreateFromStrings(
      {"10.0.0.7/24", "10.0.0.0/24", "10.0.0.200/24"});
  ASSERT_TRUE(reservations.has_value());
  EXPECT_THAT(reservations->cidrs(), ElementsAre(CIDR("10.0.0.0/24")));
}

TEST(ReservationSetTest, CreateFromStrings_Invalid) {
  const auto reservations = ReservationSet::CreateFromStrings(
      {"10.0.0.0/16", "10.0.0.0/33", "not-a-cidr"});
  ASSERT_FALSE(reservations.has_value());
  EXPECT_EQ(reservations.error().type(), PlanError::Type::kInvalidCIDR);
  EXPECT_EQ(reservations.error().literal(), "10.0.0.0/33");
}

TEST(ReservationSetTest, CreateFromStrings_NoEntry) {
  const auto reservations = ReservationSet::CreateFromStrings({});
  ASSERT_TRUE(reservations.has_value());
  EXPECT_TRUE(reservations->empty());
}

TEST(ReservationSetTest, Add) {
  ReservationSet reservations;
  EXPECT_TRUE(reservations.Add(CIDR("10.0.0.0/24")));
  EXPECT_FALSE(reservations.Add(CIDR("10.0.0.0/24")));
  EXPECT_TRUE(reservations.Add(CIDR("10.0.0.0/25")));
  EXPECT_EQ(reservations.size(), 2u);
}

TEST(ReservationSetTest, Overlaps) {
  const ReservationSet reservations(
      {CIDR("10.0.0.0/24"), CIDR("172.16.4.0/22")});

  EXPECT_TRUE(reservations.Overlaps(CIDR("10.0.0.0/24")));
  EXPECT_TRUE(reservations.Overlaps(CIDR("10.0.0.64/26")));
  EXPECT_TRUE(reservations.Overlaps(CIDR("10.0.0.0/8")));
  EXPECT_TRUE(reservations.Overlaps(CIDR("172.16.7.255/32")));
  EXPECT_TRUE(reservations.Overlaps(CIDR("172.16.0.0/12")));

  EXPECT_FALSE(reservations.Overlaps(CIDR("10.0.1.0/24")));
  EXPECT_FALSE(reservations.Overlaps(CIDR("172.16.0.0/22")));
  EXPECT_FALSE(reservations.Overlaps(CIDR("172.16.8.0/24")));
  EXPECT_FALSE(reservations.Overlaps(CIDR("192.168.0.0/16")));
}

TEST(ReservationSetTest, FindContaining) {
  const ReservationSet reservations(
      {CIDR("10.0.0.0/8"), CIDR("10.1.0.0/16"), CIDR("172.16.0.0/24")});

  EXPECT_EQ(reservations.FindContaining(CIDR("10.1.2.0/24")),
            CIDR("10.0.0.0/8"));
  EXPECT_EQ(reservations.FindContaining(CIDR("172.16.0.128/25")),
            CIDR("172.16.0.0/24"));
  EXPECT_EQ(reservations.FindContaining(CIDR("172.16.0.0/12")), std::nullopt);
  EXPECT_EQ(reservations.FindContaining(CIDR("192.168.0.0/24")),
            std::nullopt);
}

TEST(ReservationSetTest, CidrsAreOrdered) {
  const ReservationSet reservations(
      {CIDR("172.16.1.0/24"), CIDR("10.0.0.0/16"), CIDR("172.16.0.0/24")});
  const std::vector<IPv4CIDR> expected = {
      CIDR("10.0.0.0/16"), CIDR("172.16.0.0/24"), CIDR("172.16.1.0/24")};
  EXPECT_EQ(std::vector<IPv4CIDR>(reservations.cidrs().begin(),
                                  reservations.cidrs().end()),
            expected);
}

TEST(ReservationSetTest, CopyIsIndependent) {
  const ReservationSet reservations({CIDR("10.0.0.0/24")});
  ReservationSet working = reservations;
  working.Add(CIDR("10.0.1.0/24"));

  EXPECT_EQ(reservations.size(), 1u);
  EXPECT_FALSE(reservations.Overlaps(CIDR("10.0.1.0/24")));
  EXPECT_TRUE(working.Overlaps(CIDR("10.0.1.0/24")));
}

}  // namespace
}  // namespace vnet_planner
