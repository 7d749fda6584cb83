/* @file ConsolePanel.cpp
 * @brief text front panel: command parsing and result rendering
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <thread>

// dcbench headers
#include "core/PeriodicTask.hpp"
#include "core/SessionCoordinator.hpp"
#include "protocols/TestSequence.hpp"
#include "ui/ConsolePanel.hpp"
#include "ui/WaveformPreview.hpp"

using namespace dcbench::ui;
using dcbench::core::Parameter;
using dcbench::instruments::InstrumentRole;

namespace {

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  std::optional<InstrumentRole> parseRole(const std::string& word) {
    const std::string w = lower(word);
    if (w == "scope" || w == "oscilloscope")
      return InstrumentRole::Oscilloscope;
    if (w == "psu" || w == "supply" || w == "power_supply")
      return InstrumentRole::PowerSupply;
    return std::nullopt;
  }

  std::optional<Parameter> parseParameter(const std::string& word) {
    const std::string w = lower(word);
    for (auto p : { Parameter::Amplitude, Parameter::Frequency, Parameter::Voltage,
                    Parameter::Current, Parameter::Channel })
      if (w == dcbench::core::toString(p))
        return p;
    return std::nullopt;
  }

  std::string restOf(std::istream& args) {
    std::string rest;
    std::getline(args >> std::ws, rest);
    return rest;
  }

  std::chrono::milliseconds monotonicNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
  }

} // namespace

ConsolePanel::ConsolePanel(core::SessionCoordinator& session, std::istream& in, std::ostream& out)
    : session_(session), in_(in), out_(out) {
  session_.log().setListener([this](const core::LogEntry& e) { out_ << e.formatted() << "\n"; });
  session_.errorMonitor().registerEscalation(
      [this](const std::string& msg) { out_ << "!! FAULT: " << msg << "\n"; });
}

ConsolePanel::~ConsolePanel() {
  shutdownPreview();
  session_.log().setListener(nullptr);
  session_.errorMonitor().registerEscalation(nullptr);
}

int ConsolePanel::run() {
  out_ << "DC/DC Converter Diagnostic Tool - type 'help' for commands\n";
  std::string line;
  while (true) {
    out_ << "> " << std::flush;
    if (!std::getline(in_, line))
      break;
    if (!handleLine(line))
      break;
  }
  shutdownPreview();
  return 0;
}

bool ConsolePanel::handleLine(const std::string& line) {
  std::istringstream args(line);
  std::string cmd;
  if (!(args >> cmd))
    return true;
  cmd = lower(cmd);

  if (cmd == "quit" || cmd == "exit") {
    shutdownPreview();
    return false;
  }
  if (cmd == "help") {
    printHelp();
  } else if (cmd == "tech") {
    session_.setTechnician(restOf(args));
    out_ << "Technician: " << session_.metadata().trimmedTechnician() << "\n";
  } else if (cmd == "set") {
    cmdSet(args);
  } else if (cmd == "connect") {
    cmdConnect(args);
  } else if (cmd == "disconnect") {
    cmdDisconnect(args);
  } else if (cmd == "run") {
    cmdRun(args);
  } else if (cmd == "stop") {
    if (!session_.emergencyStop())
      out_ << "Emergency stop incomplete: " << session_.lastError() << "\n";
  } else if (cmd == "save") {
    if (session_.saveToWorkbook())
      out_ << "Session saved to " << session_.config().workbookPath << "\n";
    else
      out_ << "Save Failed: " << session_.lastError() << "\n";
  } else if (cmd == "export") {
    if (auto path = session_.exportText())
      out_ << "Session exported to " << *path << "\n";
    else
      out_ << "Export Failed: " << session_.lastError() << "\n";
  } else if (cmd == "status") {
    printStatus();
  } else if (cmd == "sequences") {
    printSequences();
  } else if (cmd == "log") {
    out_ << session_.log().transcript() << "\n";
  } else if (cmd == "preview") {
    cmdPreview(args);
  } else {
    out_ << "Unknown command '" << cmd << "'. Type 'help'.\n";
  }
  return true;
}

void ConsolePanel::printHelp() {
  out_ << "  tech <name>                       technician (required to run)\n"
          "  set <amplitude|frequency|voltage|current|channel> <value>\n"
          "  connect <scope|psu> [address] [sim|hw]\n"
          "  disconnect [scope|psu|all]\n"
          "  run [sequence]                    default: "
       << session_.config().defaultSequence
       << "\n"
          "  stop                              EMERGENCY STOP\n"
          "  save                              append session to the master workbook\n"
          "  export                            write a timestamped text file\n"
          "  status | sequences | log | preview [frames] | quit\n";
}

void ConsolePanel::printStatus() {
  const auto& conns = session_.connections();
  for (auto role : instruments::kAllRoles) {
    out_ << "  " << instruments::toString(role) << ": " << instruments::toString(conns.status(role));
    if (auto* h = conns.handle(role))
      out_ << " " << h->address() << (h->simulated() ? " (SIMULATED)" : "");
    out_ << "\n";
  }
  out_ << "  Technician: "
       << (session_.metadata().hasTechnician() ? session_.metadata().trimmedTechnician() : "-")
       << "\n  Parameters: " << session_.metadata().parameterSummary() << "\n";
}

void ConsolePanel::printSequences() {
  for (const auto& name : session_.sequences().names())
    out_ << "  " << name << " - " << session_.sequences().create(name)->summary() << "\n";
}

void ConsolePanel::cmdSet(std::istream& args) {
  std::string name, value;
  args >> name;
  value = restOf(args);
  auto p = parseParameter(name);
  if (!p) {
    out_ << "Unknown parameter '" << name << "'.\n";
    return;
  }
  // stored as typed; the interlock judges it when a sequence runs
  session_.setParameter(*p, value);
  out_ << core::toString(*p) << " = " << value << "\n";
}

void ConsolePanel::cmdConnect(std::istream& args) {
  std::string roleWord;
  args >> roleWord;
  auto role = parseRole(roleWord);
  if (!role) {
    out_ << "Usage: connect <scope|psu> [address] [sim|hw]\n";
    return;
  }

  bool simulated = session_.config().simulation;
  std::optional<std::string> address;
  std::string word;
  while (args >> word) {
    const std::string w = lower(word);
    if (w == "sim" || w == "--sim")
      simulated = true;
    else if (w == "hw" || w == "--hw")
      simulated = false;
    else
      address = word;
  }

  bool ok = address ? session_.connect(*role, *address, simulated) : session_.connect(*role, simulated);
  out_ << instruments::toString(*role) << ": "
       << (ok ? (simulated ? "SIMULATED" : "CONNECTED") : "DISCONNECTED") << "\n";
}

void ConsolePanel::cmdDisconnect(std::istream& args) {
  std::string word;
  if (!(args >> word) || lower(word) == "all") {
    session_.disconnectAll();
    return;
  }
  if (auto role = parseRole(word))
    session_.disconnect(*role);
  else
    out_ << "Usage: disconnect [scope|psu|all]\n";
}

void ConsolePanel::cmdRun(std::istream& args) {
  std::string name;
  if (!(args >> name))
    name = session_.config().defaultSequence;

  auto result = session_.runSequence(name);
  if (!result)
    out_ << "Run refused: " << session_.lastError() << "\n";
  else
    out_ << "Result: " << result->describe() << "\n";
}

void ConsolePanel::cmdPreview(std::istream& args) {
  int frames = 10;
  if (!(args >> frames) || frames < 1)
    frames = 10;

  double amplitude = 5.0;
  auto it = session_.metadata().parameters.find(Parameter::Amplitude);
  if (it != session_.metadata().parameters.end())
    amplitude = WaveformPreview::amplitudeFor(it->second, amplitude);

  WaveformPreview::Settings settings;
  settings.amplitude = amplitude;
  WaveformPreview trace(settings);
  const double fullScale = amplitude * 1.25;

  shutdownPreview();
  preview_ = std::make_unique<core::PeriodicTask>(
      session_.config().previewInterval, [this, &trace, fullScale](std::chrono::milliseconds) {
        out_ << WaveformPreview::render(trace.nextFrame(), fullScale, 9, 64) << "\n";
      });

  preview_->start(monotonicNow());
  const auto nap = std::max(std::chrono::milliseconds{ 1 }, preview_->interval() / 4);
  while (preview_->running()) {
    preview_->poll(monotonicNow());
    if (preview_->ticks() >= static_cast<std::size_t>(frames))
      preview_->stop();
    else
      std::this_thread::sleep_for(nap);
  }
  preview_.reset(); // callback refers to `trace`, which dies with this frame
}

void ConsolePanel::shutdownPreview() {
  if (preview_)
    preview_->stop();
}
