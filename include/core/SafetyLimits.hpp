#pragma once
/** @file  SafetyLimits.hpp
 *  @brief Per-role, per-parameter ceilings consulted by the safety interlock.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <utility>

// dcbench headers
#include "instruments/InstrumentRole.hpp"

namespace dcbench {
  namespace core {

    /**
 * @enum Parameter
 * @brief Strong-typed keys for every value a sequence step can carry.
 */
    enum class Parameter {
      Amplitude, ///< oscilloscope source amplitude, V
      Frequency, ///< oscilloscope source frequency, Hz
      Voltage,   ///< supply setpoint, V
      Current,   ///< supply current limit, A
      Channel,   ///< supply channel number (1-based)
    };

    inline const char* toString(Parameter p) {
      switch (p) {
      case Parameter::Amplitude:
        return "amplitude";
      case Parameter::Frequency:
        return "frequency";
      case Parameter::Voltage:
        return "voltage";
      case Parameter::Current:
        return "current";
      case Parameter::Channel:
        return "channel";
      default:
        return "unknown";
      }
    }

    inline const char* unitOf(Parameter p) {
      switch (p) {
      case Parameter::Amplitude:
      case Parameter::Voltage:
        return "V";
      case Parameter::Frequency:
        return "Hz";
      case Parameter::Current:
        return "A";
      default:
        return "";
      }
    }

    inline constexpr double kDefaultAmplitudeLimitV = 20.0;
    inline constexpr double kDefaultSupplyVoltageLimitV = 32.0;

    /** @class SafetyLimits
 *  @brief Map of <(role, Parameter) → ceiling>. A missing entry means "no ceiling".
 *
 *  * Plain value type: copied into SafetyPolicy, overridden from BenchConfig.
 */
    class SafetyLimits {

    public:
      /// Oscilloscope amplitude ≤ 20 V, supply voltage ≤ 32 V.
      static SafetyLimits defaults();

      void setCeiling(instruments::InstrumentRole role, Parameter p, double ceiling);
      void clearCeiling(instruments::InstrumentRole role, Parameter p);

      /// Ceiling for \p p on \p role, or nullopt if unbounded.
      std::optional<double> ceiling(instruments::InstrumentRole role, Parameter p) const;

    private:
      std::map<std::pair<instruments::InstrumentRole, Parameter>, double> ceilings_;
    };

  } // namespace core
} // namespace dcbench
