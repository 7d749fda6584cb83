#pragma once
/** @file  Command.hpp
 *  @brief One SCPI program message with toWire.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <string>

// dcbench headers
#include "core/Format.hpp"

namespace dcbench {
  namespace protocols {
    struct Command {
      std::string payload;

      std::string toWire() const { return payload + "\n"; }
      bool isQuery() const { return !payload.empty() && payload.back() == '?'; }

      /// `<header> <value>`, e.g. `:SOUR:VOLT 5`.
      static Command withValue(const std::string& header, double value) {
        return Command{ header + " " + core::formatNumber(value) };
      }
    };

  } // namespace protocols
} // namespace dcbench
