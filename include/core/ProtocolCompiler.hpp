#pragma once

/** @file  ProtocolCompiler.hpp
 *  @brief Compiles an ordered list of steps, threading simulation state between them.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/CreatorRegistry.hpp"
#include "model/SimulationState.hpp"
#include "model/StaticContext.hpp"
#include "protocols/CompilationResult.hpp"

namespace pipetgen {
  namespace commands {
    class CompoundCommand;
  }

  namespace core {

    class ErrorMonitor;
    class Logger;

    /**
 * @class ProtocolCompiler
 * @brief Owns the step list of one protocol and drives its compilation.
 *
 *  * Step N compiles against step N-1's final state; the first failure stops the run.
 *  * Step progress and warnings go to the run Logger, failures to the ErrorMonitor.
 *  * The instruction lists of all steps are concatenated in step order.
 */
    class ProtocolCompiler {

    public:
      enum class State : std::uint8_t { BOOT, IDLE, COMPILING, FINISHED, ERROR };

      ProtocolCompiler(std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                       CreatorRegistry registry = CreatorRegistry::withDefaults());
      ~ProtocolCompiler();

      ProtocolCompiler(const ProtocolCompiler&) = delete;
      ProtocolCompiler& operator=(const ProtocolCompiler&) = delete;

      /// Load the catalog at \p catalogPath (context + optional initial state).
      /// Throws `std::runtime_error` if the file is unreadable or malformed.
      void initialize(const std::string& catalogPath);
      void initialize(std::shared_ptr<const model::StaticContext> ctx,
                      model::SimulationState initial);

      void addStep(std::unique_ptr<commands::CompoundCommand> step);

      /// Decode one `{"commandCreatorFnName": ...}` record through the registry.
      void addStep(const nlohmann::json& record);

      /// Append every record of a JSON array of steps.
      void addSteps(const nlohmann::json& records);

      void clearSteps();

      /// Compile every step in order. Throws `std::logic_error` before initialize().
      protocols::CompilationResult run();

      State state() const { return currentState_; }
      std::size_t stepCount() const { return steps_.size(); }
      std::optional<std::size_t> failedStep() const { return failedStep_; }
      const model::StaticContext& context() const;
      const model::SimulationState& initialState() const { return initial_; }

    private:
      void transitionTo(State next);
      void handleError(const std::string& reason);
      void info(const std::string& message) const;

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      CreatorRegistry registry_;

      std::shared_ptr<const model::StaticContext> ctx_;
      model::SimulationState initial_;
      std::vector<std::unique_ptr<commands::CompoundCommand>> steps_;
      std::optional<std::size_t> failedStep_;
      State currentState_{ State::BOOT };
    };

    inline const char* toString(ProtocolCompiler::State s) {
      switch (s) {
      case ProtocolCompiler::State::BOOT:
        return "BOOT";
      case ProtocolCompiler::State::IDLE:
        return "IDLE";
      case ProtocolCompiler::State::COMPILING:
        return "COMPILING";
      case ProtocolCompiler::State::FINISHED:
        return "FINISHED";
      case ProtocolCompiler::State::ERROR:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

  } // namespace core
} // namespace pipetgen
