#pragma once
/** @file  SequenceStep.hpp
 *  @brief One instrument action of a test sequence plus the values it needs.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <map>
#include <string>
#include <vector>

// dcbench headers
#include "core/SafetyLimits.hpp"
#include "instruments/InstrumentRole.hpp"

namespace dcbench {
  namespace protocols {

    enum class Operation {
      Reset,         ///< oscilloscope
      SetAmplitude,  ///< oscilloscope
      SetFrequency,  ///< oscilloscope
      EnableOutput,  ///< oscilloscope
      SetChannel,    ///< supply: voltage, current, channel
      EnableChannel, ///< supply
      DisableChannel ///< supply
    };

    inline const char* toString(Operation op) {
      switch (op) {
      case Operation::Reset:
        return "reset";
      case Operation::SetAmplitude:
        return "set amplitude";
      case Operation::SetFrequency:
        return "set frequency";
      case Operation::EnableOutput:
        return "enable output";
      case Operation::SetChannel:
        return "set channel";
      case Operation::EnableChannel:
        return "enable output";
      case Operation::DisableChannel:
        return "disable output";
      default:
        return "unknown";
      }
    }

    /// Raw form-field text per parameter, e.g. {Amplitude → "5.0"}.
    using ParameterValues = std::map<core::Parameter, std::string>;

    struct StepParameter {
      core::Parameter name;
      std::string value; ///< unparsed; the safety policy decides if it is a number
    };

    /**
 * @struct SequenceStep
 * @brief Parameters are kept as text so that bad input is caught by the
 *        interlock (as "invalid input") instead of at construction.
 */
    struct SequenceStep {
      instruments::InstrumentRole role;
      Operation op;
      std::vector<StepParameter> params{};

      //---oscilloscope steps-------------------------------------------
      static SequenceStep reset();
      static SequenceStep setAmplitude(const std::string& volts);
      static SequenceStep setAmplitude(double volts);
      static SequenceStep setFrequency(const std::string& hz);
      static SequenceStep setFrequency(double hz);
      static SequenceStep enableOutput();

      //---supply steps-------------------------------------------------
      static SequenceStep setChannel(const std::string& volts, const std::string& amps,
                                     const std::string& channel);
      static SequenceStep setChannel(double volts, double amps, int channel);
      static SequenceStep enableChannel(const std::string& channel);
      static SequenceStep enableChannel(int channel);
      static SequenceStep disableChannel(const std::string& channel);
      static SequenceStep disableChannel(int channel);
    };

  } // namespace protocols
} // namespace dcbench
