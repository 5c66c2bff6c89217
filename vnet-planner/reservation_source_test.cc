// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/reservation_source.h"

#include <string>
#include <vector>

#include <base/files/file_path.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "vnet-planner/mock_command_runner.h"

using testing::ElementsAre;
using testing::Return;

namespace vnet_planner {
namespace {

constexpr char kAzPath[] = "/usr/bin/az";

TEST(ParseAddressPrefixListTest, Parse) {
  EXPECT_THAT(*ParseAddressPrefixList(
                  R"(["10.0.0.0/16", "172.16.0.0/24", "192.168.1.0/24"])"),
              ElementsAre("10.0.0.0/16", "172.16.0.0/24", "192.168.1.0/24"));
  EXPECT_THAT(*ParseAddressPrefixList("[]"), ElementsAre());
}

TEST(ParseAddressPrefixListTest, DropsIPv6AndEmptyEntries) {
  EXPECT_THAT(*ParseAddressPrefixList(R"([
                  "10.0.0.0/16", "fd00:db8::/48", null, "", " 10.1.0.0/16 "
              ])"),
              ElementsAre("10.0.0.0/16", "10.1.0.0/16"));
}

TEST(ParseAddressPrefixListTest, KeepsMalformedEntries) {
  // Malformed entries are reported when the reservations are parsed.
  EXPECT_THAT(*ParseAddressPrefixList(R"(["10.0.0.0/16", "garbage"])"),
              ElementsAre("10.0.0.0/16", "garbage"));
}

TEST(ParseAddressPrefixListTest, Fail) {
  EXPECT_EQ(ParseAddressPrefixList(""), std::nullopt);
  EXPECT_EQ(ParseAddressPrefixList("not json"), std::nullopt);
  EXPECT_EQ(ParseAddressPrefixList(R"({"prefix": "10.0.0.0/16"})"),
            std::nullopt);
  EXPECT_EQ(ParseAddressPrefixList(R"("10.0.0.0/16")"), std::nullopt);
  EXPECT_EQ(ParseAddressPrefixList(R"(["10.0.0.0/16", 42])"), std::nullopt);
  EXPECT_EQ(ParseAddressPrefixList(R"([["10.0.0.0/16"]])"), std::nullopt);
}

class SnapshotReservationSourceTest : public testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(temp_dir_.CreateUniqueTempDir()); }

  base::FilePath WriteSnapshot(const std::string& contents) {
    const base::FilePath path = temp_dir_.GetPath().Append("existing.json");
    EXPECT_TRUE(base::WriteFile(path, contents));
    return path;
  }

  base::ScopedTempDir temp_dir_;
};

TEST_F(SnapshotReservationSourceTest, Fetch) {
  SnapshotReservationSource source(
      WriteSnapshot(R"(["172.16.0.0/24", "172.16.1.0/24"])"));
  const auto prefixes = source.FetchAddressPrefixes();
  ASSERT_TRUE(prefixes);
  EXPECT_THAT(*prefixes, ElementsAre("172.16.0.0/24", "172.16.1.0/24"));
}

TEST_F(SnapshotReservationSourceTest, MissingFile) {
  SnapshotReservationSource source(
      temp_dir_.GetPath().Append("does_not_exist.json"));
  EXPECT_EQ(source.FetchAddressPrefixes(), std::nullopt);
}

TEST_F(SnapshotReservationSourceTest, NotAList) {
  SnapshotReservationSource source(WriteSnapshot("{}"));
  EXPECT_EQ(source.FetchAddressPrefixes(), std::nullopt);
}

TEST(AzureReservationSourceTest, Fetch) {
  MockCommandRunner command_runner;
  EXPECT_CALL(command_runner,
              Run(base::FilePath(kAzPath),
                              ElementsAre("network", "vnet", "list", "--query",
                                          "[].addressSpace.addressPrefixes[]",
                                          "-o", "json")))
      .WillOnce(Return(R"([
  "10.0.0.0/16",
  "172.16.0.0/24"
])"));

  AzureReservationSource source(&command_runner, base::FilePath(kAzPath),
                                "");
  const auto prefixes = source.FetchAddressPrefixes();
  ASSERT_TRUE(prefixes);
  EXPECT_THAT(*prefixes, ElementsAre("10.0.0.0/16", "172.16.0.0/24"));
}

TEST(AzureReservationSourceTest, Subscription) {
  MockCommandRunner command_runner;
  EXPECT_CALL(command_runner,
              Run(base::FilePath(kAzPath),
                              ElementsAre("network", "vnet", "list", "--query",
                                          "[].addressSpace.addressPrefixes[]",
                                          "--subscription", "my-subscription",
                                          "-o", "json")))
      .WillOnce(Return("[]"));

  AzureReservationSource source(&command_runner, base::FilePath(kAzPath),
                                "my-subscription");
  const auto prefixes = source.FetchAddressPrefixes();
  ASSERT_TRUE(prefixes);
  EXPECT_TRUE(prefixes->empty());
}

TEST(AzureReservationSourceTest, EmptyOutput) {
  MockCommandRunner command_runner;
  EXPECT_CALL(command_runner, Run)
      .WillOnce(Return(std::string("\n")));

  AzureReservationSource source(&command_runner, base::FilePath(kAzPath),
                                "");
  const auto prefixes = source.FetchAddressPrefixes();
  ASSERT_TRUE(prefixes);
  EXPECT_TRUE(prefixes->empty());
}

TEST(AzureReservationSourceTest, CommandFails) {
  MockCommandRunner command_runner;
  EXPECT_CALL(command_runner, Run)
      .WillOnce(Return(std::nullopt));

  AzureReservationSource source(&command_runner, base::FilePath(kAzPath),
                                "");
  EXPECT_EQ(source.FetchAddressPrefixes(), std::nullopt);
}

TEST(AzureReservationSourceTest, UnexpectedOutput) {
  MockCommandRunner command_runner;
  EXPECT_CALL(command_runner, Run)
      .WillOnce(Return(std::string("ERROR: Please run 'az login'")));

  AzureReservationSource source(&command_runner, base::FilePath(kAzPath),
                                "");
  EXPECT_EQ(source.FetchAddressPrefixes(), std::nullopt);
}

}  // namespace
}  // namespace vnet_planner
