#pragma once
/** @file  BenchConfig.hpp
 *  @brief Validated bench settings (instrument addresses, limits, export targets).
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

// dcbench headers
#include "core/SafetyLimits.hpp"
#include "protocols/SequenceStep.hpp"

namespace dcbench::core {

  struct BenchConfig {
    std::string oscilloscopeAddress{};
    std::string powerSupplyAddress{};
    int powerSupplyChannels{ 3 };
    bool simulation{ false }; ///< default connect mode offered by the front panel
    std::string workbookPath{ "DCDC_Master_Log.csv" };
    std::string exportDirectory{ "." };
    std::string defaultSequence{ "waveform" };
    std::chrono::milliseconds previewInterval{ 50 };
    SafetyLimits limits{ SafetyLimits::defaults() };
    protocols::ParameterValues defaults{ { Parameter::Amplitude, "5.0" },
                                         { Parameter::Frequency, "50000" },
                                         { Parameter::Voltage, "12.0" },
                                         { Parameter::Current, "1.0" },
                                         { Parameter::Channel, "1" } };

    /// `limits` plus the supply channel count as the ceiling for Parameter::Channel.
    SafetyLimits effectiveLimits() const;

    /**
     * @brief Map the parsed JSON onto a config, keeping defaults for absent keys.
     *
     * @throws std::invalid_argument on a present key with a wrong type or range.
     */
    static BenchConfig fromJson(const nlohmann::json& j);
  };

} // namespace dcbench::core
