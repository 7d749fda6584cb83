/* @file ScpiOscilloscope.cpp
 * @brief built-in source of a DS1000Z-class scope
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "instruments/ScpiOscilloscope.hpp"

using namespace dcbench::instruments;
using dcbench::protocols::Command;

ScpiOscilloscope::ScpiOscilloscope(std::string address, std::unique_ptr<io::SocketChannel> channel)
    : OscilloscopeHandle(std::move(address)), link_(std::move(channel)) {}

bool ScpiOscilloscope::open() {
  if (!link_.open(address_)) {
    lastError_ = link_.lastError();
    return false;
  }
  identity_ = link_.identity();
  return true;
}

void ScpiOscilloscope::close() { link_.close(); }

void ScpiOscilloscope::reset() { link_.execute(Command{ "*RST" }); }

void ScpiOscilloscope::setAmplitude(double volts) {
  link_.execute(Command::withValue(":SOUR:VOLT", volts));
}

void ScpiOscilloscope::setFrequency(double hz) {
  link_.execute(Command::withValue(":SOUR:FREQ", hz));
}

void ScpiOscilloscope::enableOutput() { link_.execute(Command{ ":OUTP ON" }); }
