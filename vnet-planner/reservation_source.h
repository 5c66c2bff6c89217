// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_RESERVATION_SOURCE_H_
#define VNET_PLANNER_RESERVATION_SOURCE_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <base/files/file_path.h>
#include <brillo/brillo_export.h>

#include "vnet-planner/command_runner.h"

namespace vnet_planner {

// Provides the address prefixes already in use in an account. Entries are
// returned as text and are parsed by the planner, so that a malformed entry
// is reported rather than skipped. IPv6 prefixes are dropped since they never
// collide with an IPv4 plan.
class BRILLO_EXPORT ReservationSource {
 public:
  virtual ~ReservationSource() = default;

  ReservationSource(const ReservationSource&) = delete;
  ReservationSource& operator=(const ReservationSource&) = delete;

  // Returns the reserved address prefixes, or std::nullopt if they could not
  // be retrieved.
  virtual std::optional<std::vector<std::string>> FetchAddressPrefixes() = 0;

 protected:
  ReservationSource() = default;
};

// Reads a snapshot file holding a JSON array of address prefixes, e.g.
//   ["10.0.0.0/16", "172.16.0.0/24"]
class BRILLO_EXPORT SnapshotReservationSource : public ReservationSource {
 public:
  explicit SnapshotReservationSource(const base::FilePath& path);
  ~SnapshotReservationSource() override;

  std::optional<std::vector<std::string>> FetchAddressPrefixes() override;

 private:
  const base::FilePath path_;
};

// Lists the address spaces of every virtual network of a subscription with
// the Azure CLI.
class BRILLO_EXPORT AzureReservationSource : public ReservationSource {
 public:
  // |command_runner| must outlive this object. An empty |subscription|
  // uses the default subscription of the CLI.
  AzureReservationSource(CommandRunner* command_runner,
                         const base::FilePath& az_path,
                         std::string_view subscription);
  ~AzureReservationSource() override;

  std::optional<std::vector<std::string>> FetchAddressPrefixes() override;

 private:
  CommandRunner* command_runner_;
  const base::FilePath az_path_;
  const std::string subscription_;
};

// Parses a JSON array of address prefix strings. null and empty entries and
// IPv6 prefixes are dropped. Returns std::nullopt if |json| is not a JSON
// array or holds a non-string entry.
BRILLO_EXPORT std::optional<std::vector<std::string>> ParseAddressPrefixList(
    std::string_view json);

}  // namespace vnet_planner

#endif  // VNET_PLANNER_RESERVATION_SOURCE_H_
