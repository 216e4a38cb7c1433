#pragma once
/** @file  CompilationResult.hpp
 *  @brief Success-or-failure results of atomic steps and whole operations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "protocols/CommandError.hpp"
#include "protocols/Instruction.hpp"

namespace pipetgen {
  namespace protocols {

    struct StepSuccess {
      Instruction instruction;
      model::SimulationState nextState;
      std::vector<CommandWarning> warnings;
    };

    /// Outcome of one atomic creator call.
    class StepResult {
    public:
      StepResult(StepSuccess success) : value_(std::move(success)) {}
      StepResult(CommandError error) : value_(std::move(error)) {}

      bool ok() const { return std::holds_alternative<StepSuccess>(value_); }

      /// Throws `std::logic_error` when called on the other alternative.
      const StepSuccess& success() const {
        if (!ok())
          throw std::logic_error("[StepResult] success() on a failed step");
        return std::get<StepSuccess>(value_);
      }
      const CommandError& error() const {
        if (ok())
          throw std::logic_error("[StepResult] error() on a successful step");
        return std::get<CommandError>(value_);
      }

      StepSuccess takeSuccess() && { return std::get<StepSuccess>(std::move(value_)); }

    private:
      std::variant<StepSuccess, CommandError> value_;
    };

    struct CompileSuccess {
      std::vector<Instruction> instructions;
      std::vector<CommandWarning> warnings;
      model::SimulationState finalState;
    };

    struct CompileFailure {
      std::vector<CommandError> errors;
    };

    /**
 * @class CompilationResult
 * @brief Either every instruction of an operation, or only its errors.
 *
 *  * A failure never carries instructions; partial output is discarded upstream.
 */
    class CompilationResult {
    public:
      CompilationResult(CompileSuccess success) : value_(std::move(success)) {}
      CompilationResult(CompileFailure failure) : value_(std::move(failure)) {}

      bool ok() const { return std::holds_alternative<CompileSuccess>(value_); }

      const CompileSuccess& success() const {
        if (!ok())
          throw std::logic_error("[CompilationResult] success() on a failed compilation");
        return std::get<CompileSuccess>(value_);
      }
      const CompileFailure& failure() const {
        if (ok())
          throw std::logic_error("[CompilationResult] failure() on a successful compilation");
        return std::get<CompileFailure>(value_);
      }

    private:
      std::variant<CompileSuccess, CompileFailure> value_;
    };

  } // namespace protocols
} // namespace pipetgen
