#pragma once
/** @file  SequenceController.hpp
 *  @brief Runs a test sequence step by step behind the safety interlock.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <vector>

// dcbench headers
#include "core/ErrorMonitor.hpp"
#include "core/SafetyPolicy.hpp"
#include "core/SequenceResult.hpp"
#include "core/SessionLog.hpp"
#include "instruments/InstrumentHandle.hpp"
#include "protocols/SequenceStep.hpp"

namespace dcbench {
  namespace core {

    class ConnectionManager;

    /**
 * @class SequenceController
 * @brief Executes steps strictly in order; the first rejection or driver
 *        failure ends the run. Failed commands are never retried.
 *
 *  Log contract for a run:
 *  * missing instrument → exactly one abort entry, nothing executed;
 *  * one entry per executed step (success, rejection or failure);
 *  * a completion banner only when every step succeeded.
 *
 *  Holds no per-run state: each run() drives its own Idle → Running → terminal
 *  state machine.
 */
    class SequenceController {

    public:
      enum class RunState { Idle, Running, Completed, Rejected, Failed, Aborted };

      using HandleResolver =
          std::function<instruments::InstrumentHandle*(instruments::InstrumentRole)>;

      static constexpr const char* kCompleteBanner = "--- SEQUENCE COMPLETE ---";

      SequenceController(SafetyPolicy policy, std::shared_ptr<ErrorMonitor> errMonitor);

      // ---- public API ----------------------------------------------------------
      SequenceResult run(const std::vector<protocols::SequenceStep>& steps,
                         const HandleResolver& handles, SessionLog& log) const;
      SequenceResult run(const std::vector<protocols::SequenceStep>& steps,
                         const ConnectionManager& connections, SessionLog& log) const;

      /**
       * @brief Reset every scope and switch off every supply channel, best effort.
       *
       * Usable at any time, independent of any run. Failures are logged and
       * escalated, never thrown. Always ends with one "SAFETY STOP" entry.
       *
       * @returns true if every stop command went through.
       */
      bool emergencyStop(const ConnectionManager& connections, SessionLog& log) const;

      /// Legal edges of the per-run state machine.
      static bool canTransition(RunState from, RunState to);

      const SafetyPolicy& policy() const { return policy_; }
      void setPolicy(SafetyPolicy policy) { policy_ = std::move(policy); }

    private:
      SafetyPolicy policy_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

    const char* toString(SequenceController::RunState s);

  } // namespace core
} // namespace dcbench
