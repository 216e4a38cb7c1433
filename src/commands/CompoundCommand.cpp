/* @file CompoundCommand.cpp
 * @brief binds each argument record to its compound creator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// PipetGen headers
#include "commands/CompoundCommand.hpp"
#include "commands/Consolidate.hpp"
#include "commands/Distribute.hpp"
#include "commands/Mix.hpp"
#include "commands/Transfer.hpp"

namespace pipetgen::commands {

  std::unique_ptr<CompoundCommand> makeCommand(protocols::DistributeArgs args) {
    return std::make_unique<OperationCommand<protocols::DistributeArgs>>(
        "distribute", std::move(args), &distribute);
  }

  std::unique_ptr<CompoundCommand> makeCommand(protocols::ConsolidateArgs args) {
    return std::make_unique<OperationCommand<protocols::ConsolidateArgs>>(
        "consolidate", std::move(args), &consolidate);
  }

  std::unique_ptr<CompoundCommand> makeCommand(protocols::TransferArgs args) {
    return std::make_unique<OperationCommand<protocols::TransferArgs>>(
        "transfer", std::move(args), &transfer);
  }

  std::unique_ptr<CompoundCommand> makeCommand(protocols::MixArgs args) {
    return std::make_unique<OperationCommand<protocols::MixArgs>>("mix", std::move(args), &mix);
  }

} // namespace pipetgen::commands
