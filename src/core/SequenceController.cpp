/* @file SequenceController.cpp
 * @brief interlocked, abort-on-first-failure execution of bench sequences
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <map>
#include <stdexcept>
#include <string>

// dcbench headers
#include "core/ConnectionManager.hpp"
#include "core/Format.hpp"
#include "core/SequenceController.hpp"

using namespace dcbench::core;
using dcbench::instruments::DriverError;
using dcbench::instruments::InstrumentHandle;
using dcbench::instruments::InstrumentRole;
using dcbench::instruments::LinkStatus;
using dcbench::instruments::OscilloscopeHandle;
using dcbench::instruments::PowerSupplyHandle;
using dcbench::protocols::Operation;
using dcbench::protocols::SequenceStep;

namespace {

  using RunState = SequenceController::RunState;
  using Values = std::map<Parameter, double>;

  // One instance per run(); never shared between runs.
  class RunMachine {
  public:
    void transitionTo(RunState next) {
      if (!SequenceController::canTransition(state_, next))
        throw std::logic_error(std::string("[SequenceController] illegal transition ") +
                               toString(state_) + " -> " + toString(next));
      state_ = next;
    }

  private:
    RunState state_{ RunState::Idle };
  };

  std::vector<Parameter> requiredParameters(Operation op) {
    switch (op) {
    case Operation::SetAmplitude:
      return { Parameter::Amplitude };
    case Operation::SetFrequency:
      return { Parameter::Frequency };
    case Operation::SetChannel:
      return { Parameter::Voltage, Parameter::Current, Parameter::Channel };
    case Operation::EnableChannel:
    case Operation::DisableChannel:
      return { Parameter::Channel };
    default:
      return {};
    }
  }

  std::string withUnit(Parameter p, double value) {
    if (p == Parameter::Channel)
      return "CH" + formatNumber(value);
    std::string text = formatNumber(value);
    if (*unitOf(p) != '\0')
      text += std::string(" ") + unitOf(p);
    return text;
  }

  std::string describeStep(const SequenceStep& step, const Values& values) {
    std::string text = std::string(dcbench::instruments::toString(step.role)) + ": " +
                       dcbench::protocols::toString(step.op);
    for (auto p : requiredParameters(step.op)) {
      auto it = values.find(p);
      if (it != values.end())
        text += " " + withUnit(p, it->second);
    }
    return text;
  }

  template <typename Capability> Capability& capability(InstrumentHandle& handle, Operation op) {
    auto* typed = dynamic_cast<Capability*>(&handle);
    if (!typed)
      throw DriverError("instrument at '" + handle.address() + "' does not support " +
                        dcbench::protocols::toString(op));
    return *typed;
  }

  void dispatch(const SequenceStep& step, InstrumentHandle& handle, const Values& v) {
    switch (step.op) {
    case Operation::Reset:
      capability<OscilloscopeHandle>(handle, step.op).reset();
      break;
    case Operation::SetAmplitude:
      capability<OscilloscopeHandle>(handle, step.op).setAmplitude(v.at(Parameter::Amplitude));
      break;
    case Operation::SetFrequency:
      capability<OscilloscopeHandle>(handle, step.op).setFrequency(v.at(Parameter::Frequency));
      break;
    case Operation::EnableOutput:
      capability<OscilloscopeHandle>(handle, step.op).enableOutput();
      break;
    case Operation::SetChannel:
      capability<PowerSupplyHandle>(handle, step.op)
          .setChannel(v.at(Parameter::Voltage), v.at(Parameter::Current),
                      static_cast<int>(v.at(Parameter::Channel)));
      break;
    case Operation::EnableChannel:
      capability<PowerSupplyHandle>(handle, step.op)
          .enableOutput(static_cast<int>(v.at(Parameter::Channel)));
      break;
    case Operation::DisableChannel:
      capability<PowerSupplyHandle>(handle, step.op)
          .disableOutput(static_cast<int>(v.at(Parameter::Channel)));
      break;
    }
  }

} // namespace

const char* dcbench::core::toString(SequenceController::RunState s) {
  switch (s) {
  case RunState::Idle:
    return "Idle";
  case RunState::Running:
    return "Running";
  case RunState::Completed:
    return "Completed";
  case RunState::Rejected:
    return "Rejected";
  case RunState::Failed:
    return "Failed";
  case RunState::Aborted:
    return "Aborted";
  default:
    return "Unknown";
  }
}

SequenceController::SequenceController(SafetyPolicy policy, std::shared_ptr<ErrorMonitor> errMonitor)
    : policy_(std::move(policy)), errorMonitor_(std::move(errMonitor)) {
  assert(errorMonitor_ && "[SequenceController] error monitor is nullptr");
}

bool SequenceController::canTransition(RunState from, RunState to) {
  switch (from) {
  case RunState::Idle:
    return to == RunState::Running;
  case RunState::Running:
    return to == RunState::Completed || to == RunState::Rejected || to == RunState::Failed ||
           to == RunState::Aborted;
  default:
    return false; // terminal
  }
}

SequenceResult SequenceController::run(const std::vector<SequenceStep>& steps,
                                       const ConnectionManager& connections, SessionLog& log) const {
  return run(steps, [&connections](InstrumentRole role) { return connections.handle(role); }, log);
}

SequenceResult SequenceController::run(const std::vector<SequenceStep>& steps,
                                       const HandleResolver& handles, SessionLog& log) const {
  RunMachine machine;
  machine.transitionTo(RunState::Running);

  // 1. every role must be present before anything is touched
  std::vector<InstrumentRole> missing;
  for (const auto& step : steps) {
    if ((!handles || !handles(step.role)) &&
        std::find(missing.begin(), missing.end(), step.role) == missing.end())
      missing.push_back(step.role);
  }
  if (!missing.empty()) {
    std::string names;
    for (auto role : missing)
      names += (names.empty() ? "" : ", ") + std::string(instruments::toString(role));
    std::string reason = "no " + names + " connected";
    log.append("Sequence aborted: " + reason);
    machine.transitionTo(RunState::Aborted);
    return SequenceResult::noInstrument(missing.front(), reason);
  }

  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& step = steps[i];
    const std::string where = "step " + std::to_string(i) + " (" +
                              instruments::toString(step.role) + " " +
                              protocols::toString(step.op) + ")";

    // 2. interlock: every carried value, then every value the operation needs
    Values values;
    for (const auto& param : step.params) {
      Verdict verdict = policy_.evaluate(step.role, param.name, param.value);
      if (!verdict) {
        log.append("SAFETY INTERLOCK at " + where + ": " + toString(param.name) + " '" +
                   param.value + "' rejected, " + verdict.reason);
        machine.transitionTo(RunState::Rejected);
        return SequenceResult::rejectedAt(i, verdict.reason);
      }
      values[param.name] = verdict.value;
    }
    for (auto required : requiredParameters(step.op)) {
      if (values.count(required) == 0) {
        log.append("SAFETY INTERLOCK at " + where + ": " + toString(required) +
                   " missing, invalid input");
        machine.transitionTo(RunState::Rejected);
        return SequenceResult::rejectedAt(i, "invalid input");
      }
    }

    // 3. hardware; no retry on failure
    InstrumentHandle* handle = handles(step.role);
    try {
      dispatch(step, *handle, values);
    } catch (const std::exception& e) {
      handle->setStatus(LinkStatus::Error);
      log.append("Command Error at " + where + ": " + e.what());
      errorMonitor_->notifyFailure(std::string("[SequenceController] ") + where + ": " + e.what());
      machine.transitionTo(RunState::Failed);
      return SequenceResult::failedAt(i, e.what());
    }
    handle->setStatus(LinkStatus::Live);
    log.append("[step " + std::to_string(i) + "] " + describeStep(step, values) + " - OK");
  }

  // 4.
  log.append(kCompleteBanner);
  machine.transitionTo(RunState::Completed);
  return SequenceResult::completed(steps.size());
}

bool SequenceController::emergencyStop(const ConnectionManager& connections, SessionLog& log) const {
  const auto roles = connections.connectedRoles();
  if (roles.empty()) {
    log.append("SAFETY STOP: no instruments connected");
    return true;
  }

  bool allStopped = true;
  auto attempt = [&](InstrumentHandle& handle, const std::string& what, auto&& command) {
    try {
      command();
    } catch (const std::exception& e) {
      allStopped = false;
      handle.setStatus(LinkStatus::Error);
      log.append(std::string("Stop Failed on ") + instruments::toString(handle.role()) + " (" +
                 what + "): " + e.what());
      errorMonitor_->notifyFailure(std::string("[SequenceController] emergency stop: ") +
                                   instruments::toString(handle.role()) + " " + what + ": " +
                                   e.what());
    }
  };

  for (auto role : roles) {
    InstrumentHandle* handle = connections.handle(role);
    if (auto* scope = dynamic_cast<OscilloscopeHandle*>(handle)) {
      attempt(*handle, "reset", [scope] { scope->reset(); });
    } else if (auto* supply = dynamic_cast<PowerSupplyHandle*>(handle)) {
      // every channel gets its own attempt; one stuck channel must not keep the others on
      for (int ch = 1; ch <= supply->channelCount(); ++ch)
        attempt(*handle, "CH" + std::to_string(ch) + " off", [supply, ch] { supply->disableOutput(ch); });
    }
  }

  log.append(allStopped ? "SAFETY STOP: Output disabled / Instrument Reset."
                        : "SAFETY STOP: issued with failures, check instruments manually.");
  return allStopped;
}
