// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef VNET_PLANNER_MOCK_COMMAND_RUNNER_H_
#define VNET_PLANNER_MOCK_COMMAND_RUNNER_H_

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "vnet-planner/command_runner.h"

namespace vnet_planner {

class MockCommandRunner : public CommandRunner {
 public:
  MockCommandRunner();
  MockCommandRunner(const MockCommandRunner&) = delete;
  MockCommandRunner& operator=(const MockCommandRunner&) = delete;

  ~MockCommandRunner() override;

  MOCK_METHOD(std::optional<std::string>,
              Run,
              (const base::FilePath& program,
               const std::vector<std::string>& args),
              (override));
};

}  // namespace vnet_planner

#endif  // VNET_PLANNER_MOCK_COMMAND_RUNNER_H_
