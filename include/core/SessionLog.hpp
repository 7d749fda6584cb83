#pragma once
/** @file  SessionLog.hpp
 *  @brief Append-only, timestamped operations transcript for one session.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace dcbench {
  namespace core {

    struct LogEntry {
      std::chrono::system_clock::time_point time;
      std::string text;

      /// `[HH:MM:SS] text` in local time.
      std::string formatted() const;
    };

    /**
 * @class SessionLog
 * @brief Audit trail of a run. Entries can be appended and read, never edited or removed.
 *
 *  * One optional listener mirrors every appended entry (scrolling log view).
 *  * The clock is injectable so tests get stable timestamps.
 */
    class SessionLog {

    public:
      using Clock = std::function<std::chrono::system_clock::time_point()>;
      using Listener = std::function<void(const LogEntry&)>;

      explicit SessionLog(Clock clock = {});

      // --- public API ---
      const LogEntry& append(std::string text); ///< timestamp + store + notify listener
      void setListener(Listener listener) { listener_ = std::move(listener); }

      const std::vector<LogEntry>& entries() const { return entries_; }
      std::size_t size() const { return entries_.size(); }
      bool empty() const { return entries_.empty(); }

      /// Every entry formatted, one per line, no trailing newline.
      std::string transcript() const;

    private:
      Clock clock_;
      Listener listener_{};
      std::vector<LogEntry> entries_;
    };

  } // namespace core
} // namespace dcbench
