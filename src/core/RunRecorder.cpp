/* @file RunRecorder.cpp
 * @brief in-memory sample sink
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

#include "core/RunRecorder.hpp"

using namespace ivseq::core;

void RunRecorder::onRunStarted(const RunInfo& info) {
  std::lock_guard<std::mutex> lock(mtx_);
  samples_.clear();
  samples_.reserve(info.expectedSamples);
  info_ = info;
  status_.reset();
}

void RunRecorder::onSample(const Sample& sample) {
  std::lock_guard<std::mutex> lock(mtx_);
  samples_.push_back(sample);
}

void RunRecorder::onRunCompleted(const RunStatus& status) {
  std::lock_guard<std::mutex> lock(mtx_);
  status_ = status;
}

std::vector<Sample> RunRecorder::samples() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return samples_;
}

std::optional<RunInfo> RunRecorder::info() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return info_;
}

std::optional<RunStatus> RunRecorder::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return status_;
}
