#pragma once
/** @file  Response.hpp
 *  @brief One SCPI reply line with fromWire and error-queue decoding.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

namespace dcbench {
  namespace protocols {

    /// Decoded `:SYST:ERR?` entry, e.g. `-113,"Undefined header"`.
    struct ErrorQueueEntry {
      int code{ 0 };
      std::string message;

      bool ok() const { return code == 0; }
    };

    struct Response {
      std::string payload;

      /// Strip line terminators / surrounding blanks; nullopt for an empty line.
      static std::optional<Response> fromWire(const std::string& line);

      /// Interpret the payload as an error-queue entry; nullopt if it is not one.
      std::optional<ErrorQueueEntry> asErrorEntry() const;
    };
  } // namespace protocols
} // namespace dcbench
