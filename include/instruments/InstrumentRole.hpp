#pragma once
/** @file  InstrumentRole.hpp
 *  @brief Instrument roles known to the bench and their link status.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>

namespace dcbench {
  namespace instruments {

    enum class InstrumentRole : std::uint8_t { Oscilloscope, PowerSupply, Count };
    static_assert(static_cast<std::uint8_t>(InstrumentRole::Count) == 2,
                  "Role count changed please update code that depends on it");

    inline constexpr InstrumentRole kAllRoles[] = { InstrumentRole::Oscilloscope,
                                                    InstrumentRole::PowerSupply };

    inline const char* toString(InstrumentRole r) {
      switch (r) {
      case InstrumentRole::Oscilloscope:
        return "Oscilloscope";
      case InstrumentRole::PowerSupply:
        return "PowerSupply";
      default:
        return "Unknown";
      }
    }

    enum class LinkStatus : std::uint8_t { Offline, Live, Error };

    inline const char* toString(LinkStatus s) {
      switch (s) {
      case LinkStatus::Offline:
        return "OFFLINE";
      case LinkStatus::Live:
        return "LIVE";
      case LinkStatus::Error:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

  } // namespace instruments
} // namespace dcbench
