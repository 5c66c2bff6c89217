// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_PLAN_ERROR_H_
#define VNET_PLANNER_PLAN_ERROR_H_

#include <ostream>
#include <string>
#include <string_view>

#include <brillo/brillo_export.h>

namespace vnet_planner {

// The reason a planning run failed. A run stops at the first failure, so a
// single PlanError describes the whole outcome.
class BRILLO_EXPORT PlanError {
 public:
  enum class Type {
    // An address block or a prefix length in the reservations or the request
    // is malformed. literal() holds the offending text.
    kInvalidCIDR,
    // A usable-address or total-address count does not fit in any block.
    kCapacityUnsatisfiable,
    // Every candidate of the search strategy overlaps a reservation.
    kSearchExhausted,
    // A subnet does not fit in the chosen network block.
    kSubnetOverflow,
    // Two subnets of the request share a role. literal() holds the role.
    kDuplicateRole,
  };

  static PlanError InvalidCIDR(std::string_view literal,
                               std::string_view message);
  static PlanError CapacityUnsatisfiable(std::string_view message);
  static PlanError SearchExhausted(std::string_view message);
  static PlanError SubnetOverflow(std::string_view message);
  static PlanError DuplicateRole(std::string_view role,
                                 std::string_view message);

  PlanError(const PlanError& other);
  PlanError& operator=(const PlanError& other);
  PlanError(PlanError&& other);
  PlanError& operator=(PlanError&& other);
  ~PlanError();

  Type type() const { return type_; }
  const std::string& message() const { return message_; }
  // Only set for kInvalidCIDR and kDuplicateRole.
  const std::string& literal() const { return literal_; }

  bool operator==(const PlanError& rhs) const;

 private:
  PlanError(Type type, std::string_view message, std::string_view literal);

  Type type_;
  std::string message_;
  std::string literal_;
};

BRILLO_EXPORT std::ostream& operator<<(std::ostream& stream,
                                       PlanError::Type type);
BRILLO_EXPORT std::ostream& operator<<(std::ostream& stream,
                                       const PlanError& error);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_PLAN_ERROR_H_
