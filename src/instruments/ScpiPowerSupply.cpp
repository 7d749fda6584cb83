/* @file ScpiPowerSupply.cpp
 * @brief DP800-class supply: APPLy + OUTPut per channel
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "instruments/ScpiPowerSupply.hpp"

#include "core/Format.hpp"

using namespace dcbench::instruments;
using dcbench::core::formatNumber;
using dcbench::protocols::Command;

namespace {
  std::string chName(int channel) { return "CH" + std::to_string(channel); }
} // namespace

ScpiPowerSupply::ScpiPowerSupply(std::string address, int channels,
                                 std::unique_ptr<io::SocketChannel> channel)
    : PowerSupplyHandle(std::move(address)), link_(std::move(channel)), channels_(channels) {}

bool ScpiPowerSupply::open() {
  if (!link_.open(address_)) {
    lastError_ = link_.lastError();
    return false;
  }
  identity_ = link_.identity();
  return true;
}

void ScpiPowerSupply::close() { link_.close(); }

void ScpiPowerSupply::checkChannel(int channel) const {
  if (channel < 1 || channel > channels_)
    throw DriverError("channel " + std::to_string(channel) + " does not exist on " + address_);
}

void ScpiPowerSupply::setChannel(double volts, double amps, int channel) {
  checkChannel(channel);
  link_.execute(Command{ ":APPL " + chName(channel) + "," + formatNumber(volts) + "," +
                         formatNumber(amps) });
}

void ScpiPowerSupply::enableOutput(int channel) {
  checkChannel(channel);
  link_.execute(Command{ ":OUTP " + chName(channel) + ",ON" });
}

void ScpiPowerSupply::disableOutput(int channel) {
  checkChannel(channel);
  link_.execute(Command{ ":OUTP " + chName(channel) + ",OFF" });
}
