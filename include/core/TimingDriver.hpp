#pragma once
/** @file  TimingDriver.hpp
 *  @brief Executes a SegmentPlan against the instrument, host-paced or device-paced.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <functional>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>

// ivseq headers
#include "core/EngineConfig.hpp"
#include "core/InstrumentTransport.hpp"
#include "core/RunTypes.hpp"
#include "protocols/SegmentPlan.hpp"

namespace ivseq {
  namespace core {

    using SampleEmitter = std::function<void(const Sample&)>;

    struct DriveResult {
      std::size_t samples{ 0 };
      bool cancelled{ false };
      double lastAppliedVoltage{ 0.0 };
    };

    /// Sleeps up to \p d; returns false as soon as \p token is stopped.
    bool waitFor(const std::stop_token& token, std::chrono::duration<double> d);

    /**
 * @class HostPacedDriver
 * @brief Host loop: apply, then read on the step's ReadSchedule; one sample per read.
 *
 *  * Cancellation is observed at every wait, never mid-read.
 *  * Settle and gap waits are raised to `minDelay`.
 *  * Single use: a second `execute()` throws std::logic_error.
 */
    class HostPacedDriver {
    public:
      explicit HostPacedDriver(double minDelay) : minDelay_{ minDelay } {}

      DriveResult execute(const protocols::SegmentPlan& plan, InstrumentTransport& instrument,
                          const std::stop_token& token, const SampleEmitter& emit);

    private:
      double minDelay_;
      bool used_{ false };
    };

    /**
 * @class DevicePacedDriver
 * @brief Compiles the plan to TSP, one runScript + one fetchBuffer.
 *
 *  * Two cancellation checkpoints: before dispatch, before fetch. A running
 *    device script is never interrupted.
 *  * Single use.
 */
    class DevicePacedDriver {
    public:
      DevicePacedDriver(double minDelay, std::string channel)
          : minDelay_{ minDelay }, channel_{ std::move(channel) } {}

      DriveResult execute(const protocols::SegmentPlan& plan, InstrumentTransport& instrument,
                          const std::stop_token& token, const SampleEmitter& emit);

    private:
      double minDelay_;
      std::string channel_;
      bool used_{ false };
    };

    using TimingDriver = std::variant<HostPacedDriver, DevicePacedDriver>;

    TimingDriver makeTimingDriver(TimingMode mode, const TimingSettings& timing,
                                  const std::string& channel);

    /// Runs \p driver to completion or cancellation. Communication failures force the
    /// output to zero (best-effort) and surface as InstrumentCommunicationError.
    DriveResult execute(TimingDriver& driver, const protocols::SegmentPlan& plan,
                        InstrumentTransport& instrument, const std::stop_token& token,
                        const SampleEmitter& emit);

  } // namespace core
} // namespace ivseq
