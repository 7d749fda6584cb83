/* @file main.cpp
 * @brief dcbench_panel entry point: console front panel over one bench session
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <memory>
#include <string>

// dcbench headers
#include "core/ErrorMonitor.hpp"
#include "core/SessionCoordinator.hpp"
#include "ui/ConsolePanel.hpp"

int main(int argc, char* argv[]) {
  std::string configPath = "config.json";
  if (argc > 1) {
    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
      std::cout << "usage: " << argv[0] << " [config.json]\n";
      return 0;
    }
    configPath = arg;
  }

  auto errorMonitor = std::make_shared<dcbench::core::ErrorMonitor>();
  dcbench::core::SessionCoordinator session(errorMonitor);
  dcbench::ui::ConsolePanel panel(session, std::cin, std::cout);

  // after the panel so the load message is shown
  if (!session.initialize(configPath))
    std::cerr << "[main] running on default settings: " << session.lastError() << "\n";
  int rc = panel.run();
  session.disconnectAll();
  return rc;
}
