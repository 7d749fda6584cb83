#pragma once
/** @file  Format.hpp
 *  @brief Number / time formatting shared by log entries, SCPI commands and exports.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace dcbench::core {

  /// Shortest round-trippable-enough text for a setpoint (5 -> "5", 20.0001 -> "20.0001").
  inline std::string formatNumber(double value) {
    std::ostringstream os;
    os << std::setprecision(10) << value;
    return os.str();
  }

  /// Local-time rendering of \p tp with a strftime-style \p pattern.
  inline std::string formatTime(std::chrono::system_clock::time_point tp, const char* pattern) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream os;
    os << std::put_time(&local, pattern);
    return os.str();
  }

} // namespace dcbench::core
