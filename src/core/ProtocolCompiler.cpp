/* @file ProtocolCompiler.cpp
 * @brief step loop that chains final state from one compound command into the next
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Third-party headers
#include <nlohmann/json.hpp>

// PipetGen headers
#include "commands/CompoundCommand.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ProtocolCompiler.hpp"
#include "io/JsonCodec.hpp"

using namespace pipetgen::core;
using namespace pipetgen;

namespace {
  constexpr const char* kSource = "ProtocolCompiler";
}

ProtocolCompiler::ProtocolCompiler(std::shared_ptr<ErrorMonitor> errorMonitor,
                                   std::shared_ptr<Logger> logger, CreatorRegistry registry)
    : errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)),
      registry_(std::move(registry)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[ProtocolCompiler] error monitor is nullptr");
  if (!logger_)
    throw std::invalid_argument("[ProtocolCompiler] logger is nullptr");
}

ProtocolCompiler::~ProtocolCompiler() = default;

void ProtocolCompiler::initialize(const std::string& catalogPath) {
  try {
    const nlohmann::json catalog = ConfigLoader(catalogPath).load();
    auto ctx = io::contextFromJson(catalog);
    auto initial = io::initialStateFromJson(catalog, *ctx);
    initialize(std::move(ctx), std::move(initial));
  } catch (const std::runtime_error& e) {
    handleError(e.what());
    throw;
  }
  info("catalog loaded from " + catalogPath);
}

void ProtocolCompiler::initialize(std::shared_ptr<const model::StaticContext> ctx,
                                  model::SimulationState initial) {
  if (!ctx)
    throw std::invalid_argument("[ProtocolCompiler] static context is nullptr");
  ctx_ = std::move(ctx);
  initial_ = std::move(initial);
  failedStep_.reset();
  transitionTo(State::IDLE);
}

void ProtocolCompiler::addStep(std::unique_ptr<commands::CompoundCommand> step) {
  if (!step)
    throw std::invalid_argument("[ProtocolCompiler] step is nullptr");
  steps_.push_back(std::move(step));
}

void ProtocolCompiler::addStep(const nlohmann::json& record) { addStep(registry_.create(record)); }

void ProtocolCompiler::addSteps(const nlohmann::json& records) {
  if (!records.is_array())
    throw std::runtime_error("[ProtocolCompiler] steps must be a JSON array");
  for (const auto& record : records)
    addStep(record);
}

void ProtocolCompiler::clearSteps() {
  steps_.clear();
  failedStep_.reset();
}

protocols::CompilationResult ProtocolCompiler::run() {
  if (!ctx_)
    throw std::logic_error("[ProtocolCompiler] run() called before initialize()");

  transitionTo(State::COMPILING);
  failedStep_.reset();

  protocols::CompileSuccess total;
  total.finalState = initial_;

  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const auto& step = *steps_[i];
    const std::string label = "step " + std::to_string(i + 1) + "/" +
                              std::to_string(steps_.size()) + " " + step.kind() + " '" +
                              step.name() + "'";
    info(label + " started");

    protocols::CompilationResult result = step.compile(*ctx_, total.finalState);
    if (!result.ok()) {
      failedStep_ = i;
      for (const auto& error : result.failure().errors)
        logger_->log(LogEvent{ 0, LogLevel::Error, kSource,
                               label + ": " + toString(error.kind) + " " + error.message });
      const auto& errors = result.failure().errors;
      handleError(errors.empty() ? label + " failed"
                                 : label + " failed: " + toString(errors.front().kind) + " " +
                                       errors.front().message);
      return result;
    }

    const auto& success = result.success();
    for (const auto& warning : success.warnings)
      logger_->log(LogEvent{ 0, LogLevel::Warning, kSource,
                             label + ": " + toString(warning.kind) + " " + warning.message });
    info(label + " compiled " + std::to_string(success.instructions.size()) + " instructions");

    total.instructions.insert(total.instructions.end(), success.instructions.begin(),
                              success.instructions.end());
    total.warnings.insert(total.warnings.end(), success.warnings.begin(), success.warnings.end());
    total.finalState = success.finalState;
  }

  transitionTo(State::FINISHED);
  return total;
}

const model::StaticContext& ProtocolCompiler::context() const {
  if (!ctx_)
    throw std::logic_error("[ProtocolCompiler] no static context loaded");
  return *ctx_;
}

void ProtocolCompiler::transitionTo(State next) {
  if (next == currentState_)
    return;
  info(std::string("state ") + toString(currentState_) + " -> " + toString(next));
  currentState_ = next;
}

void ProtocolCompiler::handleError(const std::string& reason) {
  errorMonitor_->notifyFailure("[ProtocolCompiler] " + reason);
  transitionTo(State::ERROR);
}

void ProtocolCompiler::info(const std::string& message) const {
  logger_->log(LogEvent{ 0, LogLevel::Info, kSource, message });
}
