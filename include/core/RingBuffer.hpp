#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue used by the run logger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pipetgen::core {

  /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO. Producers never block: `tryPush()` fails when full.
 *
 *  * The consumer blocks in `pop()` until an item arrives or the buffer is closed.
 *  * After `close()` pending items are still drained, then `pop()` returns nullopt.
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

    bool tryPush(T item) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_ || count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
      }
      cv_.notify_one();
      return true;
    }

    std::optional<T> pop() {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return count_ > 0 || closed_; });
      if (count_ == 0)
        return std::nullopt;
      T item = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --count_;
      return item;
    }

    void close() {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
      }
      cv_.notify_all();
    }

    std::size_t size() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t count_{ 0 };
    bool closed_{ false };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace pipetgen::core
