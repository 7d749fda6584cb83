/* @file SequenceStep.cpp
 * @brief step builders
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "protocols/SequenceStep.hpp"

#include "core/Format.hpp"

using namespace dcbench::protocols;
using dcbench::core::formatNumber;
using dcbench::core::Parameter;
using dcbench::instruments::InstrumentRole;

SequenceStep SequenceStep::reset() { return { InstrumentRole::Oscilloscope, Operation::Reset }; }

SequenceStep SequenceStep::setAmplitude(const std::string& volts) {
  return { InstrumentRole::Oscilloscope, Operation::SetAmplitude, { { Parameter::Amplitude, volts } } };
}

SequenceStep SequenceStep::setAmplitude(double volts) { return setAmplitude(formatNumber(volts)); }

SequenceStep SequenceStep::setFrequency(const std::string& hz) {
  return { InstrumentRole::Oscilloscope, Operation::SetFrequency, { { Parameter::Frequency, hz } } };
}

SequenceStep SequenceStep::setFrequency(double hz) { return setFrequency(formatNumber(hz)); }

SequenceStep SequenceStep::enableOutput() {
  return { InstrumentRole::Oscilloscope, Operation::EnableOutput };
}

SequenceStep SequenceStep::setChannel(const std::string& volts, const std::string& amps,
                                      const std::string& channel) {
  return { InstrumentRole::PowerSupply,
           Operation::SetChannel,
           { { Parameter::Voltage, volts },
             { Parameter::Current, amps },
             { Parameter::Channel, channel } } };
}

SequenceStep SequenceStep::setChannel(double volts, double amps, int channel) {
  return setChannel(formatNumber(volts), formatNumber(amps), std::to_string(channel));
}

SequenceStep SequenceStep::enableChannel(const std::string& channel) {
  return { InstrumentRole::PowerSupply, Operation::EnableChannel, { { Parameter::Channel, channel } } };
}

SequenceStep SequenceStep::enableChannel(int channel) { return enableChannel(std::to_string(channel)); }

SequenceStep SequenceStep::disableChannel(const std::string& channel) {
  return { InstrumentRole::PowerSupply, Operation::DisableChannel, { { Parameter::Channel, channel } } };
}

SequenceStep SequenceStep::disableChannel(int channel) {
  return disableChannel(std::to_string(channel));
}
