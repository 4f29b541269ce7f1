/* @file TimingDriver.cpp
 * @brief host-paced loop and device-paced (TSP) bulk execution
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>

// ivseq headers
#include "core/Errors.hpp"
#include "core/TimingDriver.hpp"
#include "protocols/Response.hpp"
#include "protocols/TspScript.hpp"

using namespace ivseq::core;
using ivseq::protocols::SegmentPlan;
using ivseq::protocols::TspScript;

namespace {

  using Clock = std::chrono::steady_clock;

  double secondsSince(Clock::time_point t0) {
    return std::chrono::duration<double>(Clock::now() - t0).count();
  }

  /// Best-effort zero, then the terminal error for this run.
  [[noreturn]] void abortRun(InstrumentTransport& instrument, double lastApplied,
                             const std::string& reason) {
    try {
      instrument.forceZero();
    } catch (const TransportError& e) {
      std::cerr << "[TimingDriver] force zero after failure also failed: " << e.what() << '\n';
    }
    throw InstrumentCommunicationError(lastApplied, reason);
  }

  void markUsed(bool& used) {
    if (used)
      throw std::logic_error("[TimingDriver] driver already executed; build a new plan to re-run");
    used = true;
  }

} // namespace

bool ivseq::core::waitFor(const std::stop_token& token, std::chrono::duration<double> d) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(m);
  return !cv.wait_for(lock, token, d, [&token] { return token.stop_requested(); });
}

DriveResult HostPacedDriver::execute(const SegmentPlan& plan, InstrumentTransport& instrument,
                                     const std::stop_token& token, const SampleEmitter& emit) {
  markUsed(used_);

  DriveResult result;
  const auto t0 = Clock::now();
  double lastTime = 0.0;
  bool warnedFloor = false;

  for (const auto& step : plan) {
    if (token.stop_requested()) {
      result.cancelled = true;
      return result;
    }

    try {
      instrument.applyVoltage(step.targetVoltage);
    } catch (const TransportError& e) {
      abortRun(instrument, result.lastAppliedVoltage, e.what());
    }
    result.lastAppliedVoltage = step.targetVoltage;

    const auto sched = protocols::readSchedule(step, minDelay_);
    if (!warnedFloor && sched.raised) {
      std::cerr << "[HostPacedDriver] delays below " << minDelay_ << " s raised to the settling floor\n";
      warnedFloor = true;
    }

    for (std::size_t r = 0; r < sched.reads; ++r) {
      const double wait = r == 0 ? sched.settle : sched.gap;
      if (wait > 0.0 && !waitFor(token, std::chrono::duration<double>(wait))) {
        result.cancelled = true;
        return result;
      }

      double current = 0.0;
      try {
        current = instrument.readCurrent();
      } catch (const TransportError& e) {
        abortRun(instrument, result.lastAppliedVoltage, e.what());
      }

      lastTime = std::max(lastTime, secondsSince(t0));
      emit(Sample{ result.samples, lastTime, step.targetVoltage, current, step.cycle, step.phase });
      ++result.samples;
    }

    // hold the level for the rest of the phase
    if (sched.tail > 0.0 && !waitFor(token, std::chrono::duration<double>(sched.tail))) {
      result.cancelled = true;
      return result;
    }
  }
  return result;
}

DriveResult DevicePacedDriver::execute(const SegmentPlan& plan, InstrumentTransport& instrument,
                                       const std::stop_token& token, const SampleEmitter& emit) {
  markUsed(used_);

  DriveResult result;
  // checkpoint 1: nothing has touched the instrument yet
  if (token.stop_requested()) {
    result.cancelled = true;
    return result;
  }

  const auto script = TspScript::compile(plan, minDelay_, channel_);
  try {
    instrument.runScript(script);
  } catch (const TransportError& e) {
    // the device may have stopped anywhere inside the plan
    abortRun(instrument, result.lastAppliedVoltage, e.what());
  }
  result.lastAppliedVoltage = plan.steps().back().targetVoltage;

  // checkpoint 2: the script ran to completion, results are discarded
  if (token.stop_requested()) {
    result.cancelled = true;
    return result;
  }

  std::vector<protocols::BufferPoint> points;
  try {
    points = instrument.fetchBuffer();
  } catch (const TransportError& e) {
    abortRun(instrument, result.lastAppliedVoltage, e.what());
  }
  if (points.size() != script.expectedPoints)
    abortRun(instrument, result.lastAppliedVoltage,
             "[DevicePacedDriver] device returned " + std::to_string(points.size()) + " of " +
                 std::to_string(script.expectedPoints) + " points");

  std::size_t overflow = 0;
  double lastTime = 0.0;
  auto p = points.begin();
  for (const auto& step : plan) {
    for (std::size_t r = protocols::readsPerStep(step); r > 0; --r, ++p) {
      if (protocols::Response::isOverflow(p->i))
        ++overflow;
      lastTime = std::max(lastTime, p->t); // device timer is monotonic; guard anyway
      emit(Sample{ result.samples, lastTime, p->v, p->i, step.cycle, step.phase });
      ++result.samples;
    }
  }
  if (overflow > 0)
    std::cerr << "[DevicePacedDriver] " << overflow
              << " readings hit the overrange/compliance marker\n";
  return result;
}

TimingDriver ivseq::core::makeTimingDriver(TimingMode mode, const TimingSettings& timing,
                                           const std::string& channel) {
  if (mode == TimingMode::DeviceTSP)
    return DevicePacedDriver{ timing.deviceFloor(), channel };
  return HostPacedDriver{ timing.hostMinDelay };
}

DriveResult ivseq::core::execute(TimingDriver& driver, const SegmentPlan& plan,
                                 InstrumentTransport& instrument, const std::stop_token& token,
                                 const SampleEmitter& emit) {
  if (plan.empty())
    throw std::invalid_argument("[TimingDriver] empty plan");
  return std::visit([&](auto& d) { return d.execute(plan, instrument, token, emit); }, driver);
}
