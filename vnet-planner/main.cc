// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <stdint.h>
#include <stdlib.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <base/files/file_path.h>
#include <base/logging.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "vnet-planner/allocation_planner.h"
#include "vnet-planner/command_runner.h"
#include "vnet-planner/ipv4_address.h"
#include "vnet-planner/ipv4_cidr.h"
#include "vnet-planner/plan_formatter.h"
#include "vnet-planner/plan_request.h"
#include "vnet-planner/reservation_set.h"
#include "vnet-planner/reservation_source.h"
#include "vnet-planner/search_strategy.h"

int main(int argc, char* argv[]) {
  DEFINE_string(existing, "",
                "Path to a JSON array of existing CIDRs. When set, the Azure "
                "CLI is not queried.");
  DEFINE_string(subscription, "",
                "Azure subscription id or name. Empty uses the default "
                "subscription of the Azure CLI.");
  DEFINE_string(az_path, "az",
                "Azure CLI executable. A bare name is looked up in PATH.");
  DEFINE_string(search_strategy, "expanding",
                "'expanding' walks the third then the second octet of "
                "--region; 'base' walks the blocks of --region in order.");
  DEFINE_string(region, "172.16.0.0/12",
                "Region searched by the expanding search, or base block of "
                "the base search.");
  DEFINE_string(start, "",
                "Address the expanding search starts from, e.g. 172.16.1.0. "
                "Defaults to the base address of --region.");
  DEFINE_int32(vnet_prefix, 24,
               "Prefix length of the virtual network, ignored when "
               "--vnet_ips is set. -1 derives it from the subnets.");
  DEFINE_int64(vnet_ips, 0,
                "Total addresses of the virtual network. 0 uses "
                "--vnet_prefix instead.");
  DEFINE_string(subnets, "webApp=/27,privateEndpoint=/27",
                "Comma separated subnets, each 'role=/prefix' or "
                "'role=usable_ips'.");
  DEFINE_uint32(reserved_per_subnet, 5,
                "Addresses the platform reserves in every subnet.");
  DEFINE_string(format, "bicep", "Output format: 'bicep' or 'json'.");
  brillo::FlagHelper::Init(
      argc, argv,
      "vnet_planner finds a virtual network range that does not overlap the "
      "existing ones and allocates its subnets.");
  brillo::InitLog(brillo::kLogToStderr);

  const auto strategy =
      vnet_planner::ParseSearchStrategyType(FLAGS_search_strategy);
  if (!strategy) {
    LOG(ERROR) << "Unknown search strategy: " << FLAGS_search_strategy;
    return EXIT_FAILURE;
  }
  const auto region =
      vnet_planner::IPv4CIDR::CreateFromCIDRString(FLAGS_region);
  if (!region) {
    LOG(ERROR) << "Invalid region: " << FLAGS_region;
    return EXIT_FAILURE;
  }
  const auto subnets = vnet_planner::ParseSubnetRequests(FLAGS_subnets);
  if (!subnets) {
    return EXIT_FAILURE;
  }
  const auto format = vnet_planner::ParseOutputFormat(FLAGS_format);
  if (!format) {
    LOG(ERROR) << "Unknown output format: " << FLAGS_format;
    return EXIT_FAILURE;
  }

  vnet_planner::PlanRequest request;
  request.strategy = *strategy;
  request.region = *region;
  if (!FLAGS_start.empty()) {
    request.start = vnet_planner::IPv4Address::CreateFromString(FLAGS_start);
    if (!request.start) {
      LOG(ERROR) << "Invalid start address: " << FLAGS_start;
      return EXIT_FAILURE;
    }
  }
  if (FLAGS_vnet_ips < 0) {
    LOG(ERROR) << "Invalid network address count: " << FLAGS_vnet_ips;
    return EXIT_FAILURE;
  }
  if (FLAGS_vnet_ips > 0) {
    request.network_address_count = static_cast<uint64_t>(FLAGS_vnet_ips);
  } else if (FLAGS_vnet_prefix >= 0) {
    request.network_prefix_length = FLAGS_vnet_prefix;
  }
  request.reserved_addresses_per_subnet = FLAGS_reserved_per_subnet;
  request.subnets = *subnets;

  std::unique_ptr<vnet_planner::CommandRunner> command_runner;
  std::unique_ptr<vnet_planner::ReservationSource> source;
  if (!FLAGS_existing.empty()) {
    source = std::make_unique<vnet_planner::SnapshotReservationSource>(
        base::FilePath(FLAGS_existing));
  } else {
    command_runner = vnet_planner::CommandRunner::Create();
    source = std::make_unique<vnet_planner::AzureReservationSource>(
        command_runner.get(), base::FilePath(FLAGS_az_path),
        FLAGS_subscription);
  }

  const auto prefixes = source->FetchAddressPrefixes();
  if (!prefixes) {
    return EXIT_FAILURE;
  }
  const auto reserved =
      vnet_planner::ReservationSet::CreateFromStrings(*prefixes);
  if (!reserved.has_value()) {
    LOG(ERROR) << reserved.error();
    return EXIT_FAILURE;
  }

  const vnet_planner::AllocationPlanner planner(*reserved);
  const auto plan = planner.Plan(request);
  if (!plan.has_value()) {
    LOG(ERROR) << plan.error();
    return EXIT_FAILURE;
  }

  switch (*format) {
    case vnet_planner::OutputFormat::kBicep:
      std::cout << vnet_planner::FormatPlanAsBicep(*plan);
      break;
    case vnet_planner::OutputFormat::kJson: {
      const auto json = vnet_planner::FormatPlanAsJson(*plan);
      if (!json) {
        LOG(ERROR) << "Failed to serialize the plan";
        return EXIT_FAILURE;
      }
      std::cout << *json;
      break;
    }
  }
  return EXIT_SUCCESS;
}
