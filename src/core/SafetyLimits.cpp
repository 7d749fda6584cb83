/* @file SafetyLimits.cpp
 * @brief ceiling table for the safety interlock
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include "core/SafetyLimits.hpp"

using namespace dcbench::core;
using dcbench::instruments::InstrumentRole;

SafetyLimits SafetyLimits::defaults() {
  SafetyLimits limits;
  limits.setCeiling(InstrumentRole::Oscilloscope, Parameter::Amplitude, kDefaultAmplitudeLimitV);
  limits.setCeiling(InstrumentRole::PowerSupply, Parameter::Voltage, kDefaultSupplyVoltageLimitV);
  return limits;
}

void SafetyLimits::setCeiling(InstrumentRole role, Parameter p, double ceiling) {
  ceilings_[{ role, p }] = ceiling;
}

void SafetyLimits::clearCeiling(InstrumentRole role, Parameter p) { ceilings_.erase({ role, p }); }

std::optional<double> SafetyLimits::ceiling(InstrumentRole role, Parameter p) const {
  auto it = ceilings_.find({ role, p });
  if (it == ceilings_.end())
    return std::nullopt;
  return it->second;
}
