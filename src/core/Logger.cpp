/* @file Logger.cpp
 * @brief worker thread draining log events into the run CSV
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <stdexcept>
#include <utility>

// PipetGen headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace pipetgen::core;

namespace {

  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\n\r") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  std::uint64_t nowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
  }

} // namespace

namespace pipetgen::core {

  std::string toCsv(const LogEvent& event) {
    return std::to_string(event.timestampMs) + ',' + toString(event.level) + ',' +
           csvField(event.source) + ',' + csvField(event.message) + '\n';
  }

} // namespace pipetgen::core

Logger::Logger() = default;

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  finishRun();

  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open run log: " + csvPath);
  csvFile_.write(kCsvHeader);

  buffer_ = std::make_unique<RingBuffer<LogEvent>>(kQueueCapacity);
  dropped_ = 0;
  running_ = true;
  worker_ = std::thread(&Logger::drain, this);
}

void Logger::log(LogEvent event) {
  if (!running_)
    return;
  if (event.timestampMs == 0)
    event.timestampMs = nowMs();
  if (!buffer_->tryPush(std::move(event)))
    ++dropped_;
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;

  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  csvFile_.close();
  buffer_.reset();
}

void Logger::drain() {
  while (auto event = buffer_->pop())
    csvFile_.write(toCsv(*event));
  csvFile_.flush();
}
