#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered text writer for the host FS (session exports).
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace dcbench {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for session exports (1 kB – 1 MB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 *  * Every failure leaves a human-readable cause in lastError().
 */
    class FileLogger {
    public:
      enum class Mode { Truncate, Append };

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path, Mode mode = Mode::Truncate);

      /** Queues text (caller includes line endings). */
      void write(const std::string& text);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** flush + fclose; returns false if either failed. */
      bool close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      std::FILE* fp_{ nullptr };
      std::string path_{};
      std::vector<char> buffer_;
      std::string lastError_{};
    };

  } // namespace io
} // namespace dcbench
