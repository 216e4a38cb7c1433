#pragma once
/** @file  FileLogger.hpp
 *  @brief Append-only text sink backing the run log CSV.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace pipetgen {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns one `FILE*`; rows collect in memory and reach the disk on
 *        `flush()`, when the buffer passes kFlushThreshold, or on close.
 *
 *  * Only the Logger worker thread writes, so there is no locking here.
 *  * I/O failures are reported on std::cerr and through the bool returns.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kFlushThreshold = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< close()

      /// Truncates \p path. @returns false if it cannot be opened for writing.
      bool open(const std::string& path);

      /// Append \p row (caller supplies the trailing '\n'). No-op when closed.
      void write(const std::string& row);

      /// Push buffered rows to the OS; false on a short write or fflush error.
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; } ///< last path passed to open()
      std::size_t pending() const { return buffer_.size(); } ///< bytes not yet written

      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace pipetgen
