#pragma once

/** @file  SessionCoordinator.hpp
 *  @brief Public API of one bench session: config, connections, runs, stop, export.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>

// dcbench headers
#include "core/BenchConfig.hpp"
#include "core/ConnectionManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/SequenceController.hpp"
#include "core/SequenceFactory.hpp"
#include "core/SequenceResult.hpp"
#include "core/SessionLog.hpp"
#include "core/SessionMetadata.hpp"
#include "io/SessionRecord.hpp"

namespace dcbench {
  namespace core {

    /**
 * @class SessionCoordinator
 * @brief What a front panel talks to. Owns the session's log, metadata and
 *        connections; renders nothing itself.
 *
 *  * Every user-visible event lands in the SessionLog.
 *  * Methods report failure by return value; the reason is also in lastError().
 */
    class SessionCoordinator {

    public:
      /// @param factory  Handle factory; empty → SCPI / simulated handles sized from the config.
      explicit SessionCoordinator(std::shared_ptr<ErrorMonitor> errMonitor,
                                  ConnectionManager::HandleFactory factory = {},
                                  SessionLog::Clock clock = {});
      ~SessionCoordinator() = default;

      // ---- lifecycle -----------------------------------------------------------
      /** Load \p configPath; a missing or malformed file is logged and defaults are used.
          @returns true if the file was loaded. */
      bool initialize(const std::string& configPath);
      void applyConfig(const BenchConfig& cfg);

      // ---- form fields ---------------------------------------------------------
      void setTechnician(const std::string& name) { metadata_.technician = name; }
      void setAddress(instruments::InstrumentRole role, const std::string& address);
      void setParameter(Parameter p, const std::string& raw) { metadata_.parameters[p] = raw; }

      // ---- instruments ---------------------------------------------------------
      bool connect(instruments::InstrumentRole role, bool simulated); ///< uses the stored address
      bool connect(instruments::InstrumentRole role, const std::string& address, bool simulated);
      void disconnect(instruments::InstrumentRole role);
      void disconnectAll();

      /** nullopt when the run was refused before reaching the controller
          (no technician / unknown sequence). */
      std::optional<SequenceResult> runSequence(const std::string& name);
      bool emergencyStop(); ///< "Emergency stop"

      // ---- export --------------------------------------------------------------
      io::SessionRecord record() const;
      bool saveToWorkbook();                  ///< append to config().workbookPath
      std::optional<std::string> exportText(); ///< path written, under config().exportDirectory

      // ---- accessors -----------------------------------------------------------
      SessionLog& log() { return log_; }
      const SessionLog& log() const { return log_; }
      const SessionMetadata& metadata() const { return metadata_; }
      const BenchConfig& config() const { return config_; }
      const ConnectionManager& connections() const { return connections_; }
      SequenceFactory& sequences() { return sequences_; }
      const SequenceFactory& sequences() const { return sequences_; }
      ErrorMonitor& errorMonitor() { return *errorMonitor_; }
      const std::string& lastError() const { return lastError_; }

    private:
      bool fail(const std::string& reason); ///< sets lastError_, returns false

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      BenchConfig config_{};
      SessionLog::Clock clock_;
      SessionLog log_;
      ConnectionManager connections_;
      SequenceController controller_;
      SequenceFactory sequences_{};
      SessionMetadata metadata_{};
      std::string bannerTechnician_{}; ///< technician of the last SESSION STARTED banner
      std::string lastError_{};
    };

  } // namespace core
} // namespace dcbench
