/* @file ErrorMonitor.cpp
 * @brief de-duplicates failures and escalates each one once
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// PipetGen headers
#include "core/ErrorMonitor.hpp"

namespace pipetgen {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // callback runs unlocked so it may report further failures
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace pipetgen
