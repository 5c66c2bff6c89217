// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/mock_command_runner.h"

namespace vnet_planner {

MockCommandRunner::MockCommandRunner() = default;

MockCommandRunner::~MockCommandRunner() = default;

}  // namespace vnet_planner
