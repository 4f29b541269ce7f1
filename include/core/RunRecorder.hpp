#pragma once
/** @file  RunRecorder.hpp
 *  @brief Keeps the full sample sequence of the latest run for plotting.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <vector>

#include "core/SampleChannel.hpp"

namespace ivseq::core {

  class RunRecorder : public SampleSink {
  public:
    void onRunStarted(const RunInfo& info) override;
    void onSample(const Sample& sample) override;
    void onRunCompleted(const RunStatus& status) override;

    /// Copy of what has arrived so far (a partial trace while running).
    std::vector<Sample> samples() const;
    std::optional<RunInfo> info() const;
    /// Set once the run has ended.
    std::optional<RunStatus> status() const;

  private:
    mutable std::mutex mtx_;
    std::vector<Sample> samples_;
    std::optional<RunInfo> info_;
    std::optional<RunStatus> status_;
  };

} // namespace ivseq::core
