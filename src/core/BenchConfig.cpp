/* @file BenchConfig.cpp
 * @brief config.json schema mapping
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>

// dcbench headers
#include "core/BenchConfig.hpp"
#include "core/Format.hpp"

using namespace dcbench::core;
using dcbench::instruments::InstrumentRole;
using nlohmann::json;

namespace {

  template <typename T> void readKey(const json& j, const char* key, T& out) {
    if (!j.contains(key) || j.at(key).is_null())
      return;
    try {
      out = j.at(key).get<T>();
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
  }

  void readLimit(const json& section, const char* key, InstrumentRole role, Parameter p,
                 SafetyLimits& limits) {
    if (!section.contains(key))
      return;
    const auto& node = section.at(key);
    if (!node.is_number())
      throw std::invalid_argument(std::string("safety limit '") + key + "' must be a number");
    limits.setCeiling(role, p, node.get<double>());
  }

  // "defaults" accepts either form-style strings or plain numbers
  void readDefault(const json& section, const char* key, Parameter p,
                   dcbench::protocols::ParameterValues& out) {
    if (!section.contains(key))
      return;
    const auto& node = section.at(key);
    if (node.is_string())
      out[p] = node.get<std::string>();
    else if (node.is_number())
      out[p] = formatNumber(node.get<double>());
    else
      throw std::invalid_argument(std::string("default '") + key + "' must be a string or number");
  }

} // namespace

SafetyLimits BenchConfig::effectiveLimits() const {
  SafetyLimits out = limits;
  out.setCeiling(InstrumentRole::PowerSupply, Parameter::Channel, powerSupplyChannels);
  return out;
}

BenchConfig BenchConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw std::invalid_argument("config root must be a JSON object");

  BenchConfig cfg;
  readKey(j, "oscilloscope_ip", cfg.oscilloscopeAddress);
  readKey(j, "power_supply_ip", cfg.powerSupplyAddress);
  readKey(j, "power_supply_channels", cfg.powerSupplyChannels);
  readKey(j, "simulation", cfg.simulation);
  readKey(j, "workbook_path", cfg.workbookPath);
  readKey(j, "export_directory", cfg.exportDirectory);
  readKey(j, "default_sequence", cfg.defaultSequence);

  int intervalMs = static_cast<int>(cfg.previewInterval.count());
  readKey(j, "preview_interval_ms", intervalMs);
  if (intervalMs <= 0)
    throw std::invalid_argument("preview_interval_ms must be positive");
  cfg.previewInterval = std::chrono::milliseconds{ intervalMs };

  if (cfg.powerSupplyChannels < 1)
    throw std::invalid_argument("power_supply_channels must be at least 1");

  if (j.contains("safety_limits")) {
    const auto& limits = j.at("safety_limits");
    if (limits.contains("oscilloscope"))
      readLimit(limits.at("oscilloscope"), "amplitude", InstrumentRole::Oscilloscope,
                Parameter::Amplitude, cfg.limits);
    if (limits.contains("power_supply")) {
      const auto& psu = limits.at("power_supply");
      readLimit(psu, "voltage", InstrumentRole::PowerSupply, Parameter::Voltage, cfg.limits);
      readLimit(psu, "current", InstrumentRole::PowerSupply, Parameter::Current, cfg.limits);
    }
  }

  if (j.contains("defaults")) {
    const auto& d = j.at("defaults");
    readDefault(d, "amplitude", Parameter::Amplitude, cfg.defaults);
    readDefault(d, "frequency", Parameter::Frequency, cfg.defaults);
    readDefault(d, "voltage", Parameter::Voltage, cfg.defaults);
    readDefault(d, "current", Parameter::Current, cfg.defaults);
    readDefault(d, "channel", Parameter::Channel, cfg.defaults);
  }
  return cfg;
}
