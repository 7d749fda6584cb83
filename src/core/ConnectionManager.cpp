/* @file ConnectionManager.cpp
 * @brief brings instrument handles up/down and keeps one per role
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <iostream>
#include <string>

// dcbench headers
#include "core/ConnectionManager.hpp"
#include "instruments/ScpiOscilloscope.hpp"
#include "instruments/ScpiPowerSupply.hpp"
#include "instruments/SimulatedInstruments.hpp"

using namespace dcbench::core;
using namespace dcbench::instruments;

ConnectionManager::HandleFactory ConnectionManager::defaultFactory(int supplyChannels) {
  return [supplyChannels](InstrumentRole role, const std::string& address,
                          bool simulated) -> std::unique_ptr<InstrumentHandle> {
    switch (role) {
    case InstrumentRole::Oscilloscope:
      if (simulated)
        return std::make_unique<SimulatedOscilloscope>(address, &std::clog);
      return std::make_unique<ScpiOscilloscope>(address);
    case InstrumentRole::PowerSupply:
      if (simulated)
        return std::make_unique<SimulatedPowerSupply>(address, supplyChannels, &std::clog);
      return std::make_unique<ScpiPowerSupply>(address, supplyChannels);
    default:
      return nullptr;
    }
  };
}

ConnectionManager::ConnectionManager(std::shared_ptr<ErrorMonitor> errMonitor, HandleFactory factory)
    : errorMonitor_(std::move(errMonitor)), factory_(std::move(factory)) {
  assert(errorMonitor_ && "[ConnectionManager] error monitor is nullptr");
  assert(factory_ && "[ConnectionManager] handle factory is empty");
}

InstrumentHandle& ConnectionManager::connect(InstrumentRole role, const std::string& address,
                                             bool simulated, const Preparer& prepare) {
  auto refuse = [&](const std::string& cause) -> ConnectionError {
    std::string errMsg = std::string("[ConnectionManager] ") + toString(role) + " at '" + address +
                         "': " + cause;
    errorMonitor_->notifyFailure(errMsg);
    return ConnectionError(cause);
  };

  if (!simulated && address.find_first_not_of(" \t") == std::string::npos)
    throw refuse("no instrument address given");

  auto fresh = factory_(role, address, simulated);
  if (!fresh || fresh->role() != role)
    throw refuse("no driver for this role");

  if (!fresh->open()) {
    std::string cause = fresh->lastError().empty() ? "instrument did not answer" : fresh->lastError();
    throw refuse(cause);
  }
  if (prepare) {
    try {
      prepare(*fresh);
    } catch (const DriverError& e) {
      fresh->close();
      throw refuse(std::string("preparation failed: ") + e.what());
    }
  }
  fresh->setStatus(LinkStatus::Live);

  auto& slot = handles_[role];
  if (slot) {
    // the old link is released; no command is sent to the old instrument
    std::cerr << "[ConnectionManager] replacing " << toString(role) << " at '" << slot->address()
              << "' with '" << address << "'\n";
    slot->close();
  }
  slot = std::move(fresh);
  return *slot;
}

void ConnectionManager::disconnect(InstrumentRole role) {
  auto it = handles_.find(role);
  if (it == handles_.end())
    return;
  it->second->close();
  handles_.erase(it);
}

void ConnectionManager::disconnectAll() {
  for (auto& [role, handle] : handles_)
    handle->close();
  handles_.clear();
}

InstrumentHandle* ConnectionManager::handle(InstrumentRole role) const {
  auto it = handles_.find(role);
  return it == handles_.end() ? nullptr : it->second.get();
}

OscilloscopeHandle* ConnectionManager::oscilloscope() const {
  return dynamic_cast<OscilloscopeHandle*>(handle(InstrumentRole::Oscilloscope));
}

PowerSupplyHandle* ConnectionManager::powerSupply() const {
  return dynamic_cast<PowerSupplyHandle*>(handle(InstrumentRole::PowerSupply));
}

LinkStatus ConnectionManager::status(InstrumentRole role) const {
  auto* h = handle(role);
  return h ? h->status() : LinkStatus::Offline;
}

std::vector<InstrumentRole> ConnectionManager::connectedRoles() const {
  std::vector<InstrumentRole> roles;
  for (const auto& [role, handle] : handles_)
    roles.push_back(role);
  return roles;
}
