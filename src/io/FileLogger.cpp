/* @file FileLogger.cpp
 * @brief buffered fwrite wrapper
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

using namespace ivseq::io;

FileLogger::~FileLogger() { close(); }

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
    path_ = std::move(other.path_);
    initialSize_ = other.initialSize_;
  }
  return *this;
}

bool FileLogger::open(const std::string& path, Mode mode) {
  close();
  fp_ = std::fopen(path.c_str(), mode == Mode::Append ? "ab" : "wb");
  if (!fp_) {
    std::cerr << "[FileLogger] cannot open " << path << ": " << std::strerror(errno) << '\n';
    return false;
  }
  path_ = path;
  initialSize_ = 0;
  if (mode == Mode::Append && std::fseek(fp_, 0, SEEK_END) == 0)
    initialSize_ = std::ftell(fp_);
  buffer_.clear();
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
    const auto n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    const bool complete = n == buffer_.size();
    buffer_.clear();
    if (!complete) {
      std::cerr << "[FileLogger] short write to " << path_ << '\n';
      return false;
    }
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] data lost while closing " << path_ << '\n';
  std::fclose(fp_);
  fp_ = nullptr;
}
