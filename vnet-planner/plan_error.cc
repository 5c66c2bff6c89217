// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/plan_error.h"

namespace vnet_planner {

// static
PlanError PlanError::InvalidCIDR(std::string_view literal,
                                 std::string_view message) {
  return PlanError(Type::kInvalidCIDR, message, literal);
}

// static
PlanError PlanError::CapacityUnsatisfiable(std::string_view message) {
  return PlanError(Type::kCapacityUnsatisfiable, message, "");
}

// static
PlanError PlanError::SearchExhausted(std::string_view message) {
  return PlanError(Type::kSearchExhausted, message, "");
}

// static
PlanError PlanError::SubnetOverflow(std::string_view message) {
  return PlanError(Type::kSubnetOverflow, message, "");
}

// static
PlanError PlanError::DuplicateRole(std::string_view role,
                                   std::string_view message) {
  return PlanError(Type::kDuplicateRole, message, role);
}

PlanError::PlanError(Type type,
                     std::string_view message,
                     std::string_view literal)
    : type_(type), message_(message), literal_(literal) {}

PlanError::PlanError(const PlanError& other) = default;
PlanError& PlanError::operator=(const PlanError& other) = default;
PlanError::PlanError(PlanError&& other) = default;
PlanError& PlanError::operator=(PlanError&& other) = default;
PlanError::~PlanError() = default;

bool PlanError::operator==(const PlanError& rhs) const {
  return type_ == rhs.type_ && message_ == rhs.message_ &&
         literal_ == rhs.literal_;
}

std::ostream& operator<<(std::ostream& stream, PlanError::Type type) {
  switch (type) {
    case PlanError::Type::kInvalidCIDR:
      return stream << "InvalidCIDR";
    case PlanError::Type::kCapacityUnsatisfiable:
      return stream << "CapacityUnsatisfiable";
    case PlanError::Type::kSearchExhausted:
      return stream << "SearchExhausted";
    case PlanError::Type::kSubnetOverflow:
      return stream << "SubnetOverflow";
    case PlanError::Type::kDuplicateRole:
      return stream << "DuplicateRole";
  }
}

std::ostream& operator<<(std::ostream& stream, const PlanError& error) {
  stream << error.type() << ": " << error.message();
  if (!error.literal().empty()) {
    stream << " (\"" << error.literal() << "\")";
  }
  return stream;
}

}  // namespace vnet_planner
