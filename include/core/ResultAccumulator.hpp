#pragma once
/** @file  ResultAccumulator.hpp
 *  @brief Threads simulation state through a chain of atomic creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>
#include <vector>

// PipetGen headers
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"

namespace pipetgen {
  namespace core {

    /**
 * @class ResultAccumulator
 * @brief The only place a compound creator may apply an atomic step.
 *
 *  * `chain()` runs a creator against the current state; success appends the
 *    instruction and replaces the state, failure records the error.
 *  * After the first failure every further `chain()` is a no-op and `finish()`
 *    returns the errors alone; instructions compiled so far are discarded.
 */
    class ResultAccumulator {
    public:
      template <typename Args>
      using Creator = protocols::StepResult (*)(const Args&, const model::StaticContext&,
                                                const model::SimulationState&);

      ResultAccumulator(const model::StaticContext& ctx, model::SimulationState initial)
          : ctx_(ctx), state_(std::move(initial)) {}

      template <typename Args> ResultAccumulator& chain(Creator<Args> creator, const Args& args) {
        if (failed())
          return *this;

        protocols::StepResult result = creator(args, ctx_, state_);
        if (!result.ok()) {
          errors_.push_back(result.error());
          return *this;
        }

        protocols::StepSuccess step = std::move(result).takeSuccess();
        instructions_.push_back(std::move(step.instruction));
        warnings_.insert(warnings_.end(), step.warnings.begin(), step.warnings.end());
        state_ = std::move(step.nextState);
        return *this;
      }

      /// Record a failure detected by the compound creator itself (up-front checks).
      void fail(protocols::CommandError error) { errors_.push_back(std::move(error)); }

      /// Non-fatal notice, kept only if the operation succeeds.
      void warn(protocols::CommandWarning warning) { warnings_.push_back(std::move(warning)); }

      bool failed() const { return !errors_.empty(); }
      const model::SimulationState& state() const { return state_; }
      const model::StaticContext& context() const { return ctx_; }
      std::size_t instructionCount() const { return instructions_.size(); }

      protocols::CompilationResult finish() && {
        if (failed())
          return protocols::CompileFailure{ std::move(errors_) };
        return protocols::CompileSuccess{ std::move(instructions_), std::move(warnings_),
                                          std::move(state_) };
      }

    private:
      const model::StaticContext& ctx_;
      model::SimulationState state_;
      std::vector<protocols::Instruction> instructions_;
      std::vector<protocols::CommandWarning> warnings_;
      std::vector<protocols::CommandError> errors_;
    };

  } // namespace core
} // namespace pipetgen
