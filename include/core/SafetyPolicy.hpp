#pragma once
/** @file  SafetyPolicy.hpp
 *  @brief Pure accept/reject decision for one proposed instrument parameter.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <string>

// dcbench headers
#include "core/SafetyLimits.hpp"

namespace dcbench::core {

  /// Outcome of one interlock check. When accepted, `value` holds the parsed number.
  struct Verdict {
    bool accepted{ false };
    double value{ 0.0 };
    std::string reason{};

    static Verdict accept(double v) { return Verdict{ true, v, {} }; }
    static Verdict reject(std::string why) { return Verdict{ false, 0.0, std::move(why) }; }

    explicit operator bool() const { return accepted; }
    bool operator==(const Verdict&) const = default;
  };

  /**
 * @class SafetyPolicy
 * @brief The interlock. Deterministic, no I/O, never throws for bad input.
 *
 *  * Text that is not a complete finite number is "invalid input".
 *  * A value equal to its ceiling is accepted; anything above is rejected.
 *  * Amplitude / voltage / current must be ≥ 0, frequency > 0, channel a
 *    positive integer that fits an `int`.
 */
  class SafetyPolicy {
  public:
    explicit SafetyPolicy(SafetyLimits limits = SafetyLimits::defaults());

    Verdict evaluate(instruments::InstrumentRole role, Parameter p, const std::string& raw) const;
    Verdict evaluate(instruments::InstrumentRole role, Parameter p, double value) const;

    const SafetyLimits& limits() const { return limits_; }

  private:
    SafetyLimits limits_;
  };

} // namespace dcbench::core
