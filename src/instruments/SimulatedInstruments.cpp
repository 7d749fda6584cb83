/* @file SimulatedInstruments.cpp
 * @brief rehearsal instruments - record and echo, never touch the network
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "instruments/SimulatedInstruments.hpp"

#include "core/Format.hpp"

using namespace dcbench::instruments;
using dcbench::core::formatNumber;

//---SimulatedOscilloscope-------------------------------------------------

SimulatedOscilloscope::SimulatedOscilloscope(std::string address, std::ostream* echo)
    : OscilloscopeHandle(std::move(address)), echo_(echo) {}

bool SimulatedOscilloscope::open() {
  identity_ = "SIMULATED,DS1000Z," + address_ + ",0.0";
  if (echo_)
    *echo_ << "[SIM] Connected to virtual scope at " << address_ << "\n";
  return true;
}

void SimulatedOscilloscope::record(const std::string& scpi) {
  history_.push_back(scpi);
  if (echo_)
    *echo_ << "[SIM] " << address_ << " > " << scpi << "\n";
}

void SimulatedOscilloscope::reset() {
  ++calls_.reset;
  amplitude_ = 0.0;
  frequency_ = 0.0;
  outputOn_ = false;
  record("*RST");
}

void SimulatedOscilloscope::setAmplitude(double volts) {
  ++calls_.setAmplitude;
  amplitude_ = volts;
  record(":SOUR:VOLT " + formatNumber(volts));
}

void SimulatedOscilloscope::setFrequency(double hz) {
  ++calls_.setFrequency;
  frequency_ = hz;
  record(":SOUR:FREQ " + formatNumber(hz));
}

void SimulatedOscilloscope::enableOutput() {
  ++calls_.enableOutput;
  outputOn_ = true;
  record(":OUTP ON");
}

//---SimulatedPowerSupply--------------------------------------------------

SimulatedPowerSupply::SimulatedPowerSupply(std::string address, int channels, std::ostream* echo)
    : PowerSupplyHandle(std::move(address)), echo_(echo), channels_(channels) {}

bool SimulatedPowerSupply::open() {
  identity_ = "SIMULATED,DP800," + address_ + ",0.0";
  if (echo_)
    *echo_ << "[SIM] Connected to virtual supply at " << address_ << "\n";
  return true;
}

void SimulatedPowerSupply::record(const std::string& scpi) {
  history_.push_back(scpi);
  if (echo_)
    *echo_ << "[SIM] " << address_ << " > " << scpi << "\n";
}

SimulatedPowerSupply::ChannelState& SimulatedPowerSupply::slot(int channel) {
  return state_[channel];
}

SimulatedPowerSupply::ChannelState SimulatedPowerSupply::channel(int channel) const {
  auto it = state_.find(channel);
  return it == state_.end() ? ChannelState{} : it->second;
}

void SimulatedPowerSupply::setChannel(double volts, double amps, int channel) {
  ++calls_.setChannel;
  auto& ch = slot(channel);
  ch.volts = volts;
  ch.amps = amps;
  record(":APPL CH" + std::to_string(channel) + "," + formatNumber(volts) + "," +
         formatNumber(amps));
}

void SimulatedPowerSupply::enableOutput(int channel) {
  ++calls_.enableOutput;
  slot(channel).enabled = true;
  record(":OUTP CH" + std::to_string(channel) + ",ON");
}

void SimulatedPowerSupply::disableOutput(int channel) {
  ++calls_.disableOutput;
  slot(channel).enabled = false;
  record(":OUTP CH" + std::to_string(channel) + ",OFF");
}
