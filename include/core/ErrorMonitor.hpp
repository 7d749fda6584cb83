#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace dcbench::core {

  /**
 * @class ErrorMonitor
 * @brief Connection and driver layers call `notifyFailure()`; we call the
 *        registered escalation callback exactly once per unique error.
 *
 * * Lives on the single control thread, so no locking.
 * * Debounces duplicate failures so the front panel doesn’t get spammed.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the front end.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Most recent unique failures kept for de-duplication.
    static constexpr std::size_t kHistoryLimit = 128;

    /// Unique failures seen so far, oldest first. Holds at most `kHistoryLimit`;
    /// an evicted message escalates again if it recurs.
    const std::vector<std::string>& failures() const { return seen_; }

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
  };

} // namespace dcbench::core
