#pragma once
/** @file  ConsolePanel.hpp
 *  @brief Line-oriented front panel for a bench session (stdin/stdout or any stream pair).
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace dcbench {
  namespace core { // forward decls so we don’t pull core headers in
    class SessionCoordinator;
    class PeriodicTask;
  } // namespace core

  namespace ui {

    /**
 * @class ConsolePanel
 * @brief Turns typed commands into SessionCoordinator calls and renders the
 *        results plus the scrolling operations log.
 *
 * * Mirrors every SessionLog entry as it is appended; detaches on destruction.
 * * The waveform preview tick is owned here and stopped for good on `quit`
 *   and on destruction.
 */
    class ConsolePanel {

    public:
      ConsolePanel(core::SessionCoordinator& session, std::istream& in, std::ostream& out);
      ~ConsolePanel();

      // ---- public API ----------------------------------------------------------
      /// Read and execute commands until `quit` or end of input. Returns the exit code.
      int run();

      /// Execute one command line. @returns false when the panel should close.
      bool handleLine(const std::string& line);

      ConsolePanel(const ConsolePanel&) = delete;
      ConsolePanel& operator=(const ConsolePanel&) = delete;

    private:
      // command handlers, implemented in .cpp
      void printHelp();
      void printStatus();
      void printSequences();
      void cmdSet(std::istream& args);
      void cmdConnect(std::istream& args);
      void cmdDisconnect(std::istream& args);
      void cmdRun(std::istream& args);
      void cmdPreview(std::istream& args);
      void shutdownPreview();

      core::SessionCoordinator& session_;
      std::istream& in_;
      std::ostream& out_;
      std::unique_ptr<core::PeriodicTask> preview_{};
    };

  } // namespace ui
} // namespace dcbench
