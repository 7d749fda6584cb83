/* @file SessionLog.cpp
 * @brief operations transcript
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "core/SessionLog.hpp"

#include "core/Format.hpp"

using namespace dcbench::core;

std::string LogEntry::formatted() const { return "[" + formatTime(time, "%H:%M:%S") + "] " + text; }

SessionLog::SessionLog(Clock clock) : clock_(std::move(clock)) {
  if (!clock_)
    clock_ = [] { return std::chrono::system_clock::now(); };
}

const LogEntry& SessionLog::append(std::string text) {
  entries_.push_back(LogEntry{ clock_(), std::move(text) });
  const LogEntry& entry = entries_.back();
  if (listener_)
    listener_(entry);
  return entry;
}

std::string SessionLog::transcript() const {
  std::string out;
  for (const auto& entry : entries_) {
    if (!out.empty())
      out += '\n';
    out += entry.formatted();
  }
  return out;
}
