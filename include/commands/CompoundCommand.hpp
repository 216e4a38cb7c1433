#pragma once
/** @file  CompoundCommand.hpp
 *  @brief Polymorphic handle over one declarative step and its compound creator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>
#include <utility>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"
#include "protocols/OperationArgs.hpp"

namespace pipetgen::commands {

  /**
 * @class CompoundCommand
 * @brief Common interface every step kind (distribute, consolidate, transfer, mix)
 *        exposes to the protocol compiler.
 *
 *  * Owns its argument record; `compile()` is pure and may be called repeatedly.
 *  * Knows nothing about logging or error escalation (see core::ProtocolCompiler).
 */
  class CompoundCommand {
  public:
    virtual ~CompoundCommand() = default;

    /// Registry key, e.g. "distribute".
    virtual const char* kind() const = 0;

    /// User-facing step name from the argument record.
    virtual const std::string& name() const = 0;

    virtual protocols::CompilationResult compile(const model::StaticContext& ctx,
                                                 const model::SimulationState& state) const = 0;
  };

  template <typename Args> class OperationCommand : public CompoundCommand {
  public:
    using Compiler = protocols::CompilationResult (*)(const Args&, const model::StaticContext&,
                                                      const model::SimulationState&);

    OperationCommand(const char* kind, Args args, Compiler compiler)
        : kind_(kind), args_(std::move(args)), compiler_(compiler) {}

    const char* kind() const override { return kind_; }
    const std::string& name() const override { return args_.name; }
    const Args& args() const { return args_; }

    protocols::CompilationResult compile(const model::StaticContext& ctx,
                                         const model::SimulationState& state) const override {
      return compiler_(args_, ctx, state);
    }

  private:
    const char* kind_;
    Args args_;
    Compiler compiler_;
  };

  std::unique_ptr<CompoundCommand> makeCommand(protocols::DistributeArgs args);
  std::unique_ptr<CompoundCommand> makeCommand(protocols::ConsolidateArgs args);
  std::unique_ptr<CompoundCommand> makeCommand(protocols::TransferArgs args);
  std::unique_ptr<CompoundCommand> makeCommand(protocols::MixArgs args);

} // namespace pipetgen::commands
