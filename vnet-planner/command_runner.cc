// Copyright 2026 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "vnet-planner/command_runner.h"

#include <unistd.h>

#include <string_view>
#include <utility>

#include <base/logging.h>
#include <base/strings/strcat.h>
#include <base/strings/string_util.h>
#include <brillo/process/process.h>

namespace vnet_planner {
namespace {

// CLI tools can dump whole stack traces on stderr.
constexpr size_t kMaxLoggedOutputLength = 2048;

std::string_view Truncate(std::string_view output) {
  return output.substr(0, kMaxLoggedOutputLength);
}

class CommandRunnerImpl : public CommandRunner {
 public:
  CommandRunnerImpl() = default;
  ~CommandRunnerImpl() override = default;

  std::optional<std::string> Run(const base::FilePath& program,
                                 const std::vector<std::string>& args) override;
};

std::optional<std::string> CommandRunnerImpl::Run(
    const base::FilePath& program, const std::vector<std::string>& args) {
  const std::string command_line =
      base::StrCat({program.value(), " ", base::JoinString(args, " ")});
  VLOG(1) << "Running " << command_line;

  brillo::ProcessImpl process;
  process.AddArg(program.value());
  for (const auto& arg : args) {
    process.AddArg(arg);
  }
  process.SetSearchPath(program.DirName() ==
                        base::FilePath(base::FilePath::kCurrentDirectory));
  process.RedirectOutputToMemory(/*combine=*/false);

  const int exit_code = process.Run();
  std::string output = process.GetOutputString(STDOUT_FILENO);
  const std::string errors = process.GetOutputString(STDERR_FILENO);
  if (exit_code != 0) {
    LOG(ERROR) << "`" << command_line << "` exited with " << exit_code << ": "
               << Truncate(errors);
    return std::nullopt;
  }
  if (!errors.empty()) {
    LOG(WARNING) << "`" << command_line << "` printed on stderr: "
                 << Truncate(errors);
  }
  return std::move(output);
}

}  // namespace

std::unique_ptr<CommandRunner> CommandRunner::Create() {
  return std::make_unique<CommandRunnerImpl>();
}

}  // namespace vnet_planner
