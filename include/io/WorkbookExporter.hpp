#pragma once
/** @file  WorkbookExporter.hpp
 *  @brief Master test-history workbook kept as a CSV file, one row per session.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// dcbench headers
#include "io/SessionRecord.hpp"

namespace dcbench {
  namespace io {

    /**
 * @class WorkbookExporter
 * @brief Appends session rows to a persistent workbook.
 *
 *  * Creates the file with the header row when it does not exist (or is empty).
 *  * Appends in place: rows already in the file are never rewritten.
 *  * RFC 4180 quoting, so the multi-line transcript survives a reload.
 */
    class WorkbookExporter {
    public:
      using Row = std::vector<std::string>;

      explicit WorkbookExporter(std::string path);

      static const Row& header();

      /// @throws ExportError if the file cannot be read, has a foreign header, or cannot be written.
      void append(const SessionRecord& record) const;

      /// Every row including the header. @throws ExportError
      std::vector<Row> readRows() const;

      const std::string& path() const { return path_; }

      //---CSV codec-------------------------------------------------------
      static std::string encodeRow(const Row& row); ///< with trailing "\r\n"
      static std::vector<Row> parse(const std::string& text);

    private:
      std::string path_;
    };

  } // namespace io
} // namespace dcbench
