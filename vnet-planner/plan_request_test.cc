// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/plan_request.h"

#include <vector>

#include <gtest/gtest.h>

namespace vnet_planner {
namespace {

TEST(PlanRequestTest, Defaults) {
  const PlanRequest request;
  EXPECT_EQ(request.strategy, SearchStrategyType::kExpanding);
  EXPECT_EQ(request.region, DefaultSearchRegion());
  EXPECT_EQ(request.start, std::nullopt);
  EXPECT_EQ(request.network_prefix_length, std::nullopt);
  EXPECT_EQ(request.network_address_count, std::nullopt);
  EXPECT_EQ(request.reserved_addresses_per_subnet, 5u);
  EXPECT_TRUE(request.subnets.empty());
}

TEST(PlanRequestTest, ParseSubnetRequests) {
  const auto requests =
      ParseSubnetRequests("webApp=/27, privateEndpoint = 10 ,database=/29");
  ASSERT_TRUE(requests);
  EXPECT_EQ(*requests,
            std::vector<SubnetRequest>(
                {SubnetRequest::WithPrefixLength("webApp", 27),
                 SubnetRequest::WithUsableAddresses("privateEndpoint", 10),
                 SubnetRequest::WithPrefixLength("database", 29)}));
}

TEST(PlanRequestTest, ParseSubnetRequests_Empty) {
  const auto requests = ParseSubnetRequests("");
  ASSERT_TRUE(requests);
  EXPECT_TRUE(requests->empty());

  const auto trailing = ParseSubnetRequests("webApp=/27,");
  ASSERT_TRUE(trailing);
  EXPECT_EQ(trailing->size(), 1u);
}

TEST(PlanRequestTest, ParseSubnetRequests_OutOfRangePrefixIsKept) {
  // Prefix lengths are range checked when the plan is computed.
  const auto requests = ParseSubnetRequests("webApp=/40");
  ASSERT_TRUE(requests);
  EXPECT_EQ(*requests, std::vector<SubnetRequest>(
                           {SubnetRequest::WithPrefixLength("webApp", 40)}));
}

TEST(PlanRequestTest, ParseSubnetRequests_Fail) {
  EXPECT_EQ(ParseSubnetRequests("webApp"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp="), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("=/27"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=/27=1"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=/"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=/x"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=1.5"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=ten"), std::nullopt);
  EXPECT_EQ(ParseSubnetRequests("webApp=/27,webApp=10"), std::nullopt);
}

}  // namespace
}  // namespace vnet_planner
