// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/reservation_source.h"

#include <utility>

#include <base/files/file_util.h>
#include <base/json/json_reader.h>
#include <base/logging.h>
#include <base/strings/string_util.h>
#include <base/values.h>

namespace vnet_planner {

namespace {

// Returns the address prefixes of all virtual networks as a flat JSON array.
constexpr char kVnetPrefixesQuery[] = "[].addressSpace.addressPrefixes[]";

}  // namespace

SnapshotReservationSource::SnapshotReservationSource(
    const base::FilePath& path)
    : path_(path) {}

SnapshotReservationSource::~SnapshotReservationSource() = default;

std::optional<std::vector<std::string>>
SnapshotReservationSource::FetchAddressPrefixes() {
  std::string contents;
  if (!base::ReadFileToString(path_, &contents)) {
    PLOG(ERROR) << "Failed to read reservation snapshot " << path_;
    return std::nullopt;
  }
  auto prefixes = ParseAddressPrefixList(contents);
  if (!prefixes) {
    LOG(ERROR) << "Reservation snapshot " << path_
               << " is not a JSON array of address prefixes";
    return std::nullopt;
  }
  LOG(INFO) << "Loaded " << prefixes->size() << " reservations from "
            << path_;
  return prefixes;
}

AzureReservationSource::AzureReservationSource(
    CommandRunner* command_runner,
    const base::FilePath& az_path,
    std::string_view subscription)
    : command_runner_(command_runner),
      az_path_(az_path),
      subscription_(subscription) {}

AzureReservationSource::~AzureReservationSource() = default;

std::optional<std::vector<std::string>>
AzureReservationSource::FetchAddressPrefixes() {
  std::vector<std::string> args = {"network", "vnet", "list", "--query",
                                   kVnetPrefixesQuery};
  if (!subscription_.empty()) {
    args.push_back("--subscription");
    args.push_back(subscription_);
  }
  args.push_back("-o");
  args.push_back("json");

  const auto output = command_runner_->Run(az_path_, args);
  if (!output) {
    LOG(ERROR) << "Failed to list virtual networks with " << az_path_;
    return std::nullopt;
  }

  // The CLI prints nothing when the subscription has no virtual network.
  if (base::TrimWhitespaceASCII(*output, base::TRIM_ALL).empty()) {
    return std::vector<std::string>();
  }

  auto prefixes = ParseAddressPrefixList(*output);
  if (!prefixes) {
    LOG(ERROR) << "Unexpected output from " << az_path_ << ": " << *output;
    return std::nullopt;
  }
  LOG(INFO) << "Found " << prefixes->size()
            << " virtual network address prefixes";
  return prefixes;
}

std::optional<std::vector<std::string>> ParseAddressPrefixList(
    std::string_view json) {
  const auto value = base::JSONReader::Read(json, base::JSON_PARSE_RFC);
  if (!value || !value->is_list()) {
    return std::nullopt;
  }

  std::vector<std::string> prefixes;
  for (const base::Value& item : value->GetList()) {
    if (item.is_none()) {
      continue;
    }
    if (!item.is_string()) {
      LOG(ERROR) << "Address prefix entry is not a string: " << item;
      return std::nullopt;
    }
    std::string prefix(
        base::TrimWhitespaceASCII(item.GetString(), base::TRIM_ALL));
    if (prefix.empty()) {
      continue;
    }
    if (prefix.find(':') != std::string::npos) {
      VLOG(1) << "Skipping IPv6 prefix " << prefix;
      continue;
    }
    prefixes.push_back(std::move(prefix));
  }
  return prefixes;
}

}  // namespace vnet_planner
