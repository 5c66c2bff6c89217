// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_COMMAND_RUNNER_H_
#define VNET_PLANNER_COMMAND_RUNNER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <base/files/file_path.h>
#include <brillo/brillo_export.h>

namespace vnet_planner {

// Runs command line tools and captures what they print. Used to query the
// cloud inventory through its CLI.
class BRILLO_EXPORT CommandRunner {
 public:
  static std::unique_ptr<CommandRunner> Create();

  virtual ~CommandRunner() = default;

  CommandRunner(const CommandRunner&) = delete;
  CommandRunner& operator=(const CommandRunner&) = delete;

  // Runs |program| with |args| and returns its stdout if it exits with 0.
  // A |program| without any directory component, e.g. "az", is looked up in
  // PATH. On failure, returns std::nullopt and logs the exit code and the
  // beginning of stderr.
  virtual std::optional<std::string> Run(
      const base::FilePath& program, const std::vector<std::string>& args) = 0;

 protected:
  CommandRunner() = default;
};

}  // namespace vnet_planner

#endif  // VNET_PLANNER_COMMAND_RUNNER_H_
