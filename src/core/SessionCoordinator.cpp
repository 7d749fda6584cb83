/* @file SessionCoordinator.cpp
 * @brief one technician session from config load through export
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <filesystem>

// third-party headers
#include <nlohmann/json.hpp>

// dcbench headers
#include "core/ConfigLoader.hpp"
#include "core/Format.hpp"
#include "core/SessionCoordinator.hpp"
#include "io/TextExporter.hpp"
#include "io/WorkbookExporter.hpp"
#include "protocols/StandardSequences.hpp"
#include "protocols/TestSequence.hpp"

using namespace dcbench::core;
using dcbench::instruments::ConnectionError;
using dcbench::instruments::InstrumentRole;

SessionCoordinator::SessionCoordinator(std::shared_ptr<ErrorMonitor> errMonitor,
                                       ConnectionManager::HandleFactory factory,
                                       SessionLog::Clock clock)
    : errorMonitor_(std::move(errMonitor)),
      clock_(clock ? std::move(clock)
                   : SessionLog::Clock([] { return std::chrono::system_clock::now(); })),
      log_(clock_),
      connections_(errorMonitor_,
                   factory ? std::move(factory)
                           : ConnectionManager::HandleFactory(
                                 // channel count comes from whatever config is current at connect time
                                 [this](InstrumentRole role, const std::string& address, bool simulated) {
                                   return ConnectionManager::defaultFactory(
                                       config_.powerSupplyChannels)(role, address, simulated);
                                 })),
      controller_(SafetyPolicy(config_.effectiveLimits()), errorMonitor_) {
  assert(errorMonitor_ && "[SessionCoordinator] error monitor is nullptr");
  protocols::registerStandardSequences(sequences_);
  metadata_.parameters = config_.defaults;
}

bool SessionCoordinator::fail(const std::string& reason) {
  lastError_ = reason;
  return false;
}

bool SessionCoordinator::initialize(const std::string& configPath) {
  ConfigLoader loader(configPath);
  const std::string name = std::filesystem::path(configPath).filename().string();

  if (!loader.exists()) {
    applyConfig(BenchConfig{});
    log_.append("System Alert: " + name + " not found.");
    return fail(name + " not found");
  }

  try {
    applyConfig(BenchConfig::fromJson(loader.load()));
  } catch (const std::exception& e) {
    applyConfig(BenchConfig{});
    log_.append("System Alert: " + name + " is invalid (" + e.what() + "). Using defaults.");
    return fail(e.what());
  }
  log_.append("System Initialized. Configuration loaded.");
  return true;
}

void SessionCoordinator::applyConfig(const BenchConfig& cfg) {
  config_ = cfg;
  controller_.setPolicy(SafetyPolicy(config_.effectiveLimits()));
  metadata_.addresses[InstrumentRole::Oscilloscope] = config_.oscilloscopeAddress;
  metadata_.addresses[InstrumentRole::PowerSupply] = config_.powerSupplyAddress;
  metadata_.parameters = config_.defaults;
}

void SessionCoordinator::setAddress(InstrumentRole role, const std::string& address) {
  metadata_.addresses[role] = address;
}

bool SessionCoordinator::connect(InstrumentRole role, bool simulated) {
  auto it = metadata_.addresses.find(role);
  return connect(role, it == metadata_.addresses.end() ? std::string{} : it->second, simulated);
}

bool SessionCoordinator::connect(InstrumentRole role, const std::string& address, bool simulated) {
  const std::string mode = simulated ? "SIMULATION" : "HARDWARE";
  metadata_.addresses[role] = address;
  log_.append("Initiating " + mode + " handshake with " + instruments::toString(role) + " at " +
              address + "...");

  // a real scope starts every session from a known state; checked before it replaces the old one
  ConnectionManager::Preparer prepare;
  if (!simulated && role == InstrumentRole::Oscilloscope) {
    prepare = [](instruments::InstrumentHandle& fresh) {
      dynamic_cast<instruments::OscilloscopeHandle&>(fresh).reset();
    };
  }

  try {
    auto& handle = connections_.connect(role, address, simulated, prepare);
    log_.append("Connection established (" + mode + "). Ready. " + handle.identity());
  } catch (const ConnectionError& e) {
    log_.append(std::string("Handshake Failed: ") + e.what());
    return fail(e.what());
  }
  return true;
}

void SessionCoordinator::disconnect(InstrumentRole role) {
  if (connections_.handle(role) == nullptr)
    return;
  connections_.disconnect(role);
  log_.append(std::string(instruments::toString(role)) + " disconnected.");
}

void SessionCoordinator::disconnectAll() {
  if (!connections_.anyConnected())
    return;
  connections_.disconnectAll();
  log_.append("All instruments disconnected.");
}

std::optional<SequenceResult> SessionCoordinator::runSequence(const std::string& name) {
  if (!metadata_.hasTechnician()) {
    log_.append("Compliance Error: Technician name is required.");
    fail("technician name is required");
    return std::nullopt;
  }
  if (!sequences_.contains(name)) {
    log_.append("Unknown sequence '" + name + "'.");
    fail("unknown sequence '" + name + "'");
    return std::nullopt;
  }

  if (bannerTechnician_.empty() ||
      !SessionMetadata::sameTechnician(bannerTechnician_, metadata_.technician)) {
    log_.append("--- SESSION STARTED: " + metadata_.bannerName() + " ---");
    bannerTechnician_ = metadata_.trimmedTechnician();
  }

  auto sequence = sequences_.create(name);
  log_.append("Running '" + name + "' with " + metadata_.parameterSummary());
  SequenceResult result = controller_.run(sequence->build(metadata_.parameters), connections_, log_);
  if (!result.ok())
    fail(result.describe());
  return result;
}

bool SessionCoordinator::emergencyStop() {
  if (controller_.emergencyStop(connections_, log_))
    return true;
  return fail("emergency stop did not reach every instrument");
}

dcbench::io::SessionRecord SessionCoordinator::record() const {
  io::SessionRecord rec;
  rec.timestamp = formatTime(clock_(), "%Y-%m-%d %H:%M:%S");
  rec.technician = metadata_.hasTechnician() ? metadata_.trimmedTechnician() : "Unknown";
  rec.addresses = metadata_.addressSummary();
  rec.parameters = metadata_.parameterSummary();
  rec.transcript = log_.transcript();
  return rec;
}

bool SessionCoordinator::saveToWorkbook() {
  try {
    io::WorkbookExporter(config_.workbookPath).append(record());
  } catch (const io::ExportError& e) {
    log_.append(std::string("Save Failed: ") + e.what());
    return fail(e.what());
  }
  log_.append("Data appended to " + config_.workbookPath);
  return true;
}

std::optional<std::string> SessionCoordinator::exportText() {
  try {
    std::string path = io::TextExporter(config_.exportDirectory).write(record(), clock_());
    log_.append("Session exported to " + path);
    return path;
  } catch (const io::ExportError& e) {
    log_.append(std::string("Export Failed: ") + e.what());
    fail(e.what());
    return std::nullopt;
  }
}
