/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation.
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

#include "core/ErrorMonitor.hpp"

namespace dcbench {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::cerr << "[ErrorMonitor] " << message << "\n";
      forwardIfNew(message);
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return;
      if (seen_.size() >= kHistoryLimit)
        seen_.erase(seen_.begin());
      seen_.push_back(message);
      if (escalation_)
        escalation_(message);
    }

  } // namespace core
} // namespace dcbench
