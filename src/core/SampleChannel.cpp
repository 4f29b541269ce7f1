/* @file SampleChannel.cpp
 * @brief ring-buffered sample fan-out on a dedicated worker thread
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

// ivseq headers
#include "core/ErrorMonitor.hpp"
#include "core/RingBuffer.hpp"
#include "core/SampleChannel.hpp"

using namespace ivseq::core;

SampleChannel::SampleChannel(std::shared_ptr<ErrorMonitor> errMonitor)
    : errorMonitor_(std::move(errMonitor)) {}

SampleChannel::~SampleChannel() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void SampleChannel::subscribe(std::shared_ptr<SampleSink> sink) {
  if (!sink)
    throw std::invalid_argument("[SampleChannel] sink is nullptr");
  std::lock_guard<std::mutex> lock(mtx_);
  if (running_)
    throw std::logic_error("[SampleChannel] cannot subscribe while a run is streaming");
  sinks_.push_back(std::move(sink));
}

void SampleChannel::startNewRun(const RunInfo& info, std::size_t capacity) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_)
      throw std::logic_error("[SampleChannel] previous run not finished");
    buffer_ = std::make_unique<RingBuffer<Sample>>(std::max<std::size_t>(capacity, 1));
    dropped_ = 0;
    stopping_ = false;
  }

  // sinks get the boundary signal before the worker exists, so ordering is trivial
  for (auto& sink : sinks_)
    sink->onRunStarted(info);

  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = true;
  }
  worker_ = std::thread([this] { workerLoop(); });
}

void SampleChannel::publish(const Sample& sample) {
  bool lost = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_ || !buffer_)
      throw std::logic_error("[SampleChannel] publish outside of a run");
    lost = !buffer_->push(sample);
    if (lost)
      ++dropped_;
  }
  cv_.notify_one();

  if (lost) {
    const std::string msg = "[SampleChannel] consumer too slow, dropped oldest sample (capacity " +
                            std::to_string(buffer_->capacity()) + ")";
    std::cerr << msg << '\n';
    if (errorMonitor_)
      errorMonitor_->notifyFailure(msg);
  }
}

void SampleChannel::finishRun(const RunStatus& status) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();

  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = false;
    if (dropped_ > 0)
      std::cerr << "[SampleChannel] run finished with " << dropped_ << " dropped samples\n";
  }

  for (auto& sink : sinks_) {
    try {
      sink->onRunCompleted(status);
    } catch (const std::exception& e) {
      const std::string msg = std::string("[SampleChannel] sink failed at run end: ") + e.what();
      std::cerr << msg << '\n';
      if (errorMonitor_)
        errorMonitor_->notifyFailure(msg);
    }
  }
}

bool SampleChannel::running() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return running_;
}

std::size_t SampleChannel::dropped() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return dropped_;
}

void SampleChannel::workerLoop() {
  std::unique_lock<std::mutex> lock(mtx_);
  for (;;) {
    cv_.wait(lock, [this] { return stopping_ || !buffer_->empty(); });

    while (auto s = buffer_->pop()) {
      lock.unlock();
      deliver(*s);
      lock.lock();
    }

    if (stopping_ && buffer_->empty())
      return;
  }
}

void SampleChannel::deliver(const Sample& s) {
  for (auto& sink : sinks_) {
    try {
      sink->onSample(s);
    } catch (const std::exception& e) {
      const std::string msg = std::string("[SampleChannel] sink rejected sample: ") + e.what();
      std::cerr << msg << '\n';
      if (errorMonitor_)
        errorMonitor_->notifyFailure(msg);
    }
  }
}
