#pragma once
/** @file  SessionRecord.hpp
 *  @brief Flattened, export-ready view of one session + ExportError.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

namespace dcbench {
  namespace io {

    /// Raised when a session cannot be written; the caller still holds the log.
    class ExportError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    struct SessionRecord {
      std::string timestamp;   ///< "YYYY-mm-dd HH:MM:SS"
      std::string technician;
      std::string addresses;   ///< "Oscilloscope=...; PowerSupply=..."
      std::string parameters;  ///< "amplitude=5.0 V; frequency=50000 Hz; ..."
      std::string transcript;  ///< SessionLog::transcript()

      /// Column order of the workbook.
      std::vector<std::string> toRow() const {
        return { timestamp, technician, addresses, parameters, transcript };
      }
    };

  } // namespace io
} // namespace dcbench
