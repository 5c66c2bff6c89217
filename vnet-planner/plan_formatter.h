// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_PLAN_FORMATTER_H_
#define VNET_PLANNER_PLAN_FORMATTER_H_

#include <optional>
#include <string>
#include <string_view>

#include <brillo/brillo_export.h>

#include "vnet-planner/allocation_planner.h"

namespace vnet_planner {

enum class OutputFormat {
  // "name: value" lines ready to be pasted in a Bicep parameter file.
  kBicep,
  // A JSON object with the same names.
  kJson,
};

// Parses "bicep" or "json".
BRILLO_EXPORT std::optional<OutputFormat> ParseOutputFormat(
    std::string_view name);

// Returns the parameter name of the subnet |role|, e.g.
// "webAppSubnetAddressPrefix" for "webApp".
BRILLO_EXPORT std::string SubnetParameterName(std::string_view role);

// Renders |plan| as:
//   # Bicep parameter values
//   vnetAddressPrefix: 172.16.0.0/26
//   webAppSubnetAddressPrefix: 172.16.0.0/27
//   ...
BRILLO_EXPORT std::string FormatPlanAsBicep(const AllocationPlan& plan);

// Renders |plan| as a pretty-printed JSON object. Returns std::nullopt if the
// serialization fails. Keys are written in alphabetical order, not in the
// network-then-request order of FormatPlanAsBicep().
BRILLO_EXPORT std::optional<std::string> FormatPlanAsJson(
    const AllocationPlan& plan);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_PLAN_FORMATTER_H_
