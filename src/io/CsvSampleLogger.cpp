/* @file CsvSampleLogger.cpp
 * @brief CSV sink for the sample channel
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <system_error>

// ivseq headers
#include "io/CsvSampleLogger.hpp"

using namespace ivseq::io;
using ivseq::core::FileDecision;

namespace {

  std::string formatTime(std::time_t when, const char* fmt) {
    std::tm tm{};
    localtime_r(&when, &tm);
    char buf[32];
    const auto n = std::strftime(buf, sizeof buf, fmt, &tm);
    return std::string(buf, n);
  }

  /// Quotes a metadata field if it would break the row.
  std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos)
      return s;
    std::string out = "\"";
    for (char c : s) {
      if (c == '"')
        out += '"';
      out += c;
    }
    return out + '"';
  }

} // namespace

CsvSampleLogger::CsvSampleLogger(std::string path, core::RunMetadata metadata)
    : path_(std::move(path)), metadata_(std::move(metadata)) {
  if (path_.empty())
    throw std::invalid_argument("[CsvSampleLogger] output path is empty");
}

FileDecision CsvSampleLogger::decide(const std::string& path, FileDecision ifExists) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size == 0)
    return FileDecision::Overwrite;
  return ifExists;
}

std::string CsvSampleLogger::slug(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos)
    return {};
  const auto last = text.find_last_not_of(" \t\r\n\f\v");

  // runs of anything outside [A-Za-z0-9_-] collapse to one '-'
  std::string out;
  bool inRun = false;
  for (std::size_t k = first; k <= last; ++k) {
    const auto c = static_cast<unsigned char>(text[k]);
    if (std::isalnum(c) || c == '_' || c == '-') {
      out += static_cast<char>(c);
      inRun = false;
    } else if (!inRun) {
      out += '-';
      inRun = true;
    }
  }

  const auto b = out.find_first_not_of("-_");
  if (b == std::string::npos)
    return {};
  out = out.substr(b, out.find_last_not_of("-_") - b + 1);
  if (out.size() > 40)
    out.resize(40);
  return out;
}

std::string CsvSampleLogger::defaultFileName(const core::RunMetadata& metadata, std::time_t when) {
  std::string name = "iv";
  for (const auto* part : { &metadata.sampleName, &metadata.operatorName }) {
    const auto s = slug(*part);
    if (!s.empty())
      name += "_" + s;
  }
  return name + "_" + formatTime(when, "%Y%m%d_%H%M%S") + ".csv";
}

const char* CsvSampleLogger::header() {
  return "index,elapsed_s,cycle,phase,voltage_v,current_a,timestamp,sample_name,operator,notes\n";
}

void CsvSampleLogger::onRunStarted(const core::RunInfo& info) {
  if (info.fileDecision == FileDecision::Abort)
    throw std::logic_error("[CsvSampleLogger] run started although logging said abort");

  const auto mode =
      info.fileDecision == FileDecision::Append ? FileLogger::Mode::Append : FileLogger::Mode::Truncate;
  if (!file_.open(path_, mode))
    throw std::runtime_error("[CsvSampleLogger] cannot open " + path_ + " for writing");

  timestamp_ = formatTime(std::time(nullptr), "%Y-%m-%dT%H:%M:%S");
  rows_ = 0;
  if (file_.initialSize() == 0 && !file_.write(header()))
    throw std::runtime_error("[CsvSampleLogger] failed writing header to " + path_);

  std::cerr << "[CsvSampleLogger] " << (mode == FileLogger::Mode::Append ? "appending to " : "writing ")
            << path_ << '\n';
}

void CsvSampleLogger::onSample(const core::Sample& sample) {
  if (!file_.write(formatRow(sample)))
    throw std::runtime_error("[CsvSampleLogger] write to " + path_ + " failed");
  ++rows_;
}

void CsvSampleLogger::onRunCompleted(const core::RunStatus& status) {
  const bool ok = file_.flush();
  file_.close();
  std::cerr << "[CsvSampleLogger] " << rows_ << " rows saved to " << path_ << " ("
            << core::toString(status.outcome) << ")\n";
  if (!ok)
    throw std::runtime_error("[CsvSampleLogger] final flush of " + path_ + " failed");
}

std::string CsvSampleLogger::formatRow(const core::Sample& s) const {
  char nums[160];
  std::snprintf(nums, sizeof nums, "%zu,%.6f,%d,%s,%.6g,%.6e,", s.index, s.elapsedTime, s.cycle,
                protocols::toString(s.phase), s.voltage, s.current);
  return nums + timestamp_ + ',' + csvField(metadata_.sampleName) + ',' +
         csvField(metadata_.operatorName) + ',' + csvField(metadata_.notes) + '\n';
}
