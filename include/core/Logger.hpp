#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace pipetgen {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel : std::uint8_t { Info, Warning, Error };

    inline const char* toString(LogLevel l) {
      switch (l) {
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    struct LogEvent {
      std::uint64_t timestampMs{ 0 }; ///< ms since epoch, stamped by log() when left 0
      LogLevel level{ LogLevel::Info };
      std::string source;
      std::string message;
    };

    /// One CSV row `timestamp_ms,level,source,message\n`; quotes fields that need it.
    std::string toCsv(const LogEvent& event);

    /**
 * @class Logger
 * @brief Run log: events are queued by `log()` and written by a worker thread.
 *
 *  * `log()` never blocks; when the queue is full the event is counted in `dropped()`.
 *  * `startNewRun()` and `finishRun()` belong to the owning thread and must not race `log()`.
 */
    class Logger {

    public:
      static constexpr std::size_t kQueueCapacity = 1024;
      static constexpr const char* kCsvHeader = "timestamp_ms,level,source,message\n";

      Logger();
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      void finishRun();                             ///< drain + flush + join worker thread

      bool running() const { return running_; }
      const std::string& runPath() const { return csvFile_.path(); }
      std::size_t dropped() const { return dropped_; } ///< events lost to a full queue

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace pipetgen
