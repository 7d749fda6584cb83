#pragma once
/** @file  TextExporter.hpp
 *  @brief Flat, timestamped text dump of one session.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

// dcbench headers
#include "io/SessionRecord.hpp"

namespace dcbench::io {

  class TextExporter {
  public:
    explicit TextExporter(std::string directory);

    /// `session_YYYYmmdd_HHMMSS.txt` for \p when (local time).
    static std::string fileNameFor(std::chrono::system_clock::time_point when);

    /**
     * @brief Write \p record to `<directory>/<fileNameFor(when)>`, replacing any
     *        file of that name.
     * @returns the path written.
     * @throws ExportError
     */
    std::string write(const SessionRecord& record, std::chrono::system_clock::time_point when) const;

  private:
    std::string directory_;
  };

} // namespace dcbench::io
