#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Collects compile and catalog failures and escalates each distinct one.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace pipetgen::core {

  /**
 * @class ErrorMonitor
 * @brief ProtocolCompiler reports through `notifyFailure()`; the embedding
 *        application learns about a message the first time it is reported.
 *
 * * Safe to share between compilers running on different threads.
 * * Recompiling a protocol that keeps failing the same way escalates once.
 * * `notifyFailure()` is virtual so tests can observe it with a mock.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Replaces any earlier callback.
    void registerEscalation(Escalation cb);

    virtual void notifyFailure(const std::string& message);

    std::size_t uniqueFailures() const;

    /// Distinct messages in the order they were first reported.
    std::vector<std::string> failures() const;

  private:
    void forwardIfNew(const std::string& message);

    Escalation escalation_{};
    std::vector<std::string> seen_;
    mutable std::mutex mtx_;
  };

} // namespace pipetgen::core
