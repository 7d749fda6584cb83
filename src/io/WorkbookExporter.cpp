/* @file WorkbookExporter.cpp
 * @brief CSV master log append + reload
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <sstream>

// dcbench headers
#include "io/FileLogger.hpp"
#include "io/WorkbookExporter.hpp"

using namespace dcbench::io;

WorkbookExporter::WorkbookExporter(std::string path) : path_(std::move(path)) {}

const WorkbookExporter::Row& WorkbookExporter::header() {
  static const Row kHeader{ "Timestamp", "Technician", "Address(es)", "Parameter values",
                            "Log transcript" };
  return kHeader;
}

std::string WorkbookExporter::encodeRow(const Row& row) {
  std::string out;
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i)
      out += ',';
    const std::string& field = row[i];
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
      out += field;
      continue;
    }
    out += '"';
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
  }
  out += "\r\n";
  return out;
}

std::vector<WorkbookExporter::Row> WorkbookExporter::parse(const std::string& text) {
  std::vector<Row> rows;
  Row row;
  std::string field;
  bool quoted = false;
  bool rowOpen = false;

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
      continue;
    }
    switch (c) {
    case '"':
      quoted = true;
      rowOpen = true;
      break;
    case ',':
      row.push_back(std::move(field));
      field.clear();
      rowOpen = true;
      break;
    case '\r':
      break; // CRLF and bare LF both end a row
    case '\n':
      row.push_back(std::move(field));
      field.clear();
      rows.push_back(std::move(row));
      row.clear();
      rowOpen = false;
      break;
    default:
      field += c;
      rowOpen = true;
      break;
    }
  }
  if (rowOpen) {
    row.push_back(std::move(field));
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<WorkbookExporter::Row> WorkbookExporter::readRows() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in)
    throw ExportError("could not load workbook " + path_);
  std::ostringstream text;
  text << in.rdbuf();
  return parse(text.str());
}

void WorkbookExporter::append(const SessionRecord& record) const {
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

  if (!fresh) {
    auto rows = readRows();
    if (rows.empty() || rows.front() != header())
      throw ExportError(path_ + " is not a session workbook (unexpected header row)");
  }

  FileLogger out;
  if (!out.open(path_, FileLogger::Mode::Append))
    throw ExportError("could not save to " + path_ + ": " + out.lastError() +
                      " (is the file open in another program?)");
  if (fresh)
    out.write(encodeRow(header()));
  out.write(encodeRow(record.toRow()));
  if (!out.close())
    throw ExportError("could not save to " + path_ + ": " + out.lastError());
}
