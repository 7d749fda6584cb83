#pragma once
/** @file  SessionMetadata.hpp
 *  @brief Who ran the session, against which instruments, with which values.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <map>
#include <string>

// dcbench headers
#include "instruments/InstrumentRole.hpp"
#include "protocols/SequenceStep.hpp"

namespace dcbench::core {

  struct SessionMetadata {
    std::string technician{};
    std::map<instruments::InstrumentRole, std::string> addresses{};
    protocols::ParameterValues parameters{};

    /// Technician with surrounding blanks removed.
    std::string trimmedTechnician() const;
    bool hasTechnician() const { return !trimmedTechnician().empty(); }

    /// Upper-cased technician for the "SESSION STARTED" banner.
    std::string bannerName() const;

    /// "Oscilloscope=...; PowerSupply=..." (roles without an address omitted).
    std::string addressSummary() const;

    /// "amplitude=5.0 V; frequency=50000 Hz; ..." in Parameter order.
    std::string parameterSummary() const;

    /// Case-insensitive, blank-insensitive technician comparison.
    static bool sameTechnician(const std::string& a, const std::string& b);
  };

} // namespace dcbench::core
