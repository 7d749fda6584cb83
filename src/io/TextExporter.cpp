/* @file TextExporter.cpp
 * @brief plain-text session export
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <filesystem>

#include "core/Format.hpp"
#include "io/FileLogger.hpp"
#include "io/TextExporter.hpp"

using namespace dcbench::io;

TextExporter::TextExporter(std::string directory) : directory_(std::move(directory)) {}

std::string TextExporter::fileNameFor(std::chrono::system_clock::time_point when) {
  return "session_" + core::formatTime(when, "%Y%m%d_%H%M%S") + ".txt";
}

std::string TextExporter::write(const SessionRecord& record,
                                std::chrono::system_clock::time_point when) const {
  const std::string path = (std::filesystem::path(directory_) / fileNameFor(when)).string();

  FileLogger out;
  if (!out.open(path))
    throw ExportError("could not export session: " + out.lastError());

  out.write("DC/DC Converter Test Session\n");
  out.write("Timestamp:  " + record.timestamp + "\n");
  out.write("Technician: " + record.technician + "\n");
  out.write("Addresses:  " + record.addresses + "\n");
  out.write("Parameters: " + record.parameters + "\n");
  out.write("\n--- Operations Log ---\n");
  out.write(record.transcript);
  out.write("\n");

  if (!out.close())
    throw ExportError("could not export session: " + out.lastError());
  return path;
}
