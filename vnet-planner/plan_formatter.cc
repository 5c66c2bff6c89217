// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/plan_formatter.h"

#include <base/json/json_writer.h>
#include <base/strings/strcat.h>
#include <base/values.h>

namespace vnet_planner {

namespace {

constexpr char kNetworkParameterName[] = "vnetAddressPrefix";
constexpr char kSubnetParameterSuffix[] = "SubnetAddressPrefix";

}  // namespace

std::optional<OutputFormat> ParseOutputFormat(std::string_view name) {
  if (name == "bicep") {
    return OutputFormat::kBicep;
  }
  if (name == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

std::string SubnetParameterName(std::string_view role) {
  return base::StrCat({role, kSubnetParameterSuffix});
}

std::string FormatPlanAsBicep(const AllocationPlan& plan) {
  std::string output = "# Bicep parameter values\n";
  base::StrAppend(&output, {kNetworkParameterName, ": ",
                            plan.network.ToString(), "\n"});
  for (const auto& [role, cidr] : plan.subnets) {
    base::StrAppend(&output,
                    {SubnetParameterName(role), ": ", cidr.ToString(), "\n"});
  }
  return output;
}

std::optional<std::string> FormatPlanAsJson(const AllocationPlan& plan) {
  base::Value::Dict doc;
  doc.Set(kNetworkParameterName, plan.network.ToString());
  for (const auto& [role, cidr] : plan.subnets) {
    doc.Set(SubnetParameterName(role), cidr.ToString());
  }

  std::string json;
  if (!base::JSONWriter::WriteWithOptions(
          doc, base::JSONWriter::OPTIONS_PRETTY_PRINT, &json)) {
    return std::nullopt;
  }
  return json;
}

}  // namespace vnet_planner
