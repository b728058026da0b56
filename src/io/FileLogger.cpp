/* @file FileLogger.cpp
 * @brief chunked fwrite writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <utility>

#include <spdlog/spdlog.h>

using namespace benchguard::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  path_ = path;
  buffer_.reserve(kChunk);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const auto written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    const bool complete = written == buffer_.size();
    buffer_.clear();
    if (!complete)
      return false;
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    spdlog::warn("[FileLogger] flush failed on close: {}", path_);
  std::fclose(fp_);
  fp_ = nullptr;
}
