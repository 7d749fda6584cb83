/* @file FileLogger.cpp
 * @brief buffered fwrite wrapper
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <cerrno>
#include <cstring>
#include <utility>

#include "io/FileLogger.hpp"

using namespace dcbench::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)), lastError_(std::move(other.lastError_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path, Mode mode) {
  close();
  lastError_.clear();
  fp_ = std::fopen(path.c_str(), mode == Mode::Append ? "ab" : "wb");
  if (!fp_) {
    lastError_ = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  path_ = path;
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& text) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), text.begin(), text.end());
  if (buffer_.size() >= kChunk)
    flush();
}

bool FileLogger::flush() {
  if (!fp_) {
    if (lastError_.empty())
      lastError_ = "file not open";
    return false;
  }
  if (!buffer_.empty()) {
    std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      lastError_ = "write to " + path_ + " failed: " + std::strerror(errno);
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  if (std::fflush(fp_) != 0) {
    lastError_ = "flush of " + path_ + " failed: " + std::strerror(errno);
    return false;
  }
  return true;
}

bool FileLogger::close() {
  if (!fp_)
    return true;
  bool ok = flush();
  if (std::fclose(fp_) != 0 && ok) {
    lastError_ = "close of " + path_ + " failed: " + std::strerror(errno);
    ok = false;
  }
  fp_ = nullptr;
  buffer_.clear();
  return ok;
}
