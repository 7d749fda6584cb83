/* @file StandardSequences.cpp
 * @brief built-in bench sequences
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <memory>

// dcbench headers
#include "core/SequenceFactory.hpp"
#include "protocols/StandardSequences.hpp"

using namespace dcbench::protocols;
using dcbench::core::Parameter;

namespace {

  std::string valueOf(const ParameterValues& values, Parameter p) {
    auto it = values.find(p);
    return it == values.end() ? std::string{} : it->second;
  }

} // namespace

std::vector<SequenceStep> WaveformSequence::build(const ParameterValues& values) const {
  return { SequenceStep::setAmplitude(valueOf(values, Parameter::Amplitude)),
           SequenceStep::setFrequency(valueOf(values, Parameter::Frequency)),
           SequenceStep::enableOutput() };
}

std::vector<SequenceStep> SupplySequence::build(const ParameterValues& values) const {
  const std::string channel = valueOf(values, Parameter::Channel);
  return { SequenceStep::setChannel(valueOf(values, Parameter::Voltage),
                                    valueOf(values, Parameter::Current), channel),
           SequenceStep::enableChannel(channel) };
}

std::vector<SequenceStep> ConverterSequence::build(const ParameterValues& values) const {
  // converter must be powered before it is stimulated
  auto steps = SupplySequence{}.build(values);
  auto waveform = WaveformSequence{}.build(values);
  steps.insert(steps.end(), waveform.begin(), waveform.end());
  return steps;
}

std::vector<SequenceStep> ShutdownSequence::build(const ParameterValues& values) const {
  return { SequenceStep::reset(),
           SequenceStep::disableChannel(valueOf(values, Parameter::Channel)) };
}

int dcbench::protocols::registerStandardSequences(core::SequenceFactory& factory) {
  int added = 0;
  added += factory.registerSequence("waveform", [] { return std::make_unique<WaveformSequence>(); });
  added += factory.registerSequence("supply", [] { return std::make_unique<SupplySequence>(); });
  added += factory.registerSequence("converter", [] { return std::make_unique<ConverterSequence>(); });
  added += factory.registerSequence("shutdown", [] { return std::make_unique<ShutdownSequence>(); });
  return added;
}
