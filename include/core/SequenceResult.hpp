#pragma once
/** @file  SequenceResult.hpp
 *  @brief Terminal outcome of one sequence run.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>

// dcbench headers
#include "instruments/InstrumentRole.hpp"

namespace dcbench::core {

  /**
 * @class SequenceResult
 * @brief Completed | RejectedAtStep(i, reason) | FailedAtStep(i, cause) | Aborted(NoInstrument).
 *
 *  Immutable once built; step indices are 0-based.
 */
  class SequenceResult {
  public:
    enum class Outcome { Completed, Rejected, Failed, Aborted };

    static SequenceResult completed(std::size_t stepCount) {
      return SequenceResult(Outcome::Completed, stepCount, {}, std::nullopt);
    }
    static SequenceResult rejectedAt(std::size_t index, std::string reason) {
      return SequenceResult(Outcome::Rejected, index, std::move(reason), std::nullopt);
    }
    static SequenceResult failedAt(std::size_t index, std::string cause) {
      return SequenceResult(Outcome::Failed, index, std::move(cause), std::nullopt);
    }
    static SequenceResult noInstrument(instruments::InstrumentRole missing, std::string reason) {
      return SequenceResult(Outcome::Aborted, 0, std::move(reason), missing);
    }

    Outcome outcome() const { return outcome_; }
    bool ok() const { return outcome_ == Outcome::Completed; }

    /// Failing step for Rejected / Failed, step count for Completed, 0 for Aborted.
    std::size_t stepIndex() const { return index_; }
    const std::string& reason() const { return reason_; }
    std::optional<instruments::InstrumentRole> missingRole() const { return missing_; }

    /// One-line rendering for a status bar, e.g. `REJECTED at step 0: invalid input`.
    std::string describe() const;

    bool operator==(const SequenceResult&) const = default;

  private:
    SequenceResult(Outcome o, std::size_t index, std::string reason,
                   std::optional<instruments::InstrumentRole> missing)
        : outcome_(o), index_(index), reason_(std::move(reason)), missing_(missing) {}

    Outcome outcome_;
    std::size_t index_;
    std::string reason_;
    std::optional<instruments::InstrumentRole> missing_;
  };

  inline const char* toString(SequenceResult::Outcome o) {
    switch (o) {
    case SequenceResult::Outcome::Completed:
      return "COMPLETED";
    case SequenceResult::Outcome::Rejected:
      return "REJECTED";
    case SequenceResult::Outcome::Failed:
      return "FAILED";
    case SequenceResult::Outcome::Aborted:
      return "ABORTED";
    default:
      return "Unknown";
    }
  }

  inline std::string SequenceResult::describe() const {
    switch (outcome_) {
    case Outcome::Completed:
      return std::string(toString(outcome_)) + " (" + std::to_string(index_) + " steps)";
    case Outcome::Aborted:
      return std::string(toString(outcome_)) + ": " + reason_;
    default:
      return std::string(toString(outcome_)) + " at step " + std::to_string(index_) + ": " + reason_;
    }
  }

} // namespace dcbench::core
