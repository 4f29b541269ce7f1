/* @file SegmentBuilder.cpp
 * @brief protocol → plan compiler (sweeps, custom ramps, WRER holds)
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstddef>
#include <string>
#include <type_traits>

// ivseq headers
#include "core/Errors.hpp"
#include "core/SegmentBuilder.hpp"

using namespace ivseq::core;
using ivseq::protocols::CustomSequence;
using ivseq::protocols::Phase;
using ivseq::protocols::Protocol;
using ivseq::protocols::SegmentPlan;
using ivseq::protocols::StandardSweep;
using ivseq::protocols::Step;
using ivseq::protocols::SweepMode;
using ivseq::protocols::Wrer;
using ivseq::protocols::kMaxPlanPoints;
using ivseq::protocols::readsPerStep;

namespace {

  [[noreturn]] void reject(const std::string& why) {
    throw SequenceError(Fault::InvalidProtocolParameters, "[SegmentBuilder] " + why);
  }

  void requireFinite(double v, const char* name) {
    if (!std::isfinite(v))
      reject(std::string(name) + " must be a finite number");
  }

  void requirePositive(double v, const char* name) {
    requireFinite(v, name);
    if (v <= 0.0)
      reject(std::string(name) + " must be > 0");
  }

  void requireCycles(int cycles) {
    if (cycles < 1)
      reject("cycles must be >= 1");
  }

  /// \p count is computed in double so huge products cannot wrap.
  void requireWithinPlanLimit(double count, const std::string& what) {
    if (count > static_cast<double>(kMaxPlanPoints))
      reject(what + " exceeds the " + std::to_string(kMaxPlanPoints) + " point plan limit");
  }

  // strips float noise such as 0.30000000000000004
  double tidy(double v) { return std::round(v * 1e12) / 1e12; }

  /// Appends one ramp's points; the first point is skipped when it repeats the previous step.
  void appendRamp(std::vector<Step>& out, const std::vector<double>& volts, double delay,
                  int cycle) {
    for (std::size_t i = 0; i < volts.size(); ++i) {
      if (i == 0 && !out.empty() && out.back().targetVoltage == volts[i])
        continue;
      out.push_back(Step{ volts[i], delay, delay, cycle, Phase::Sweep });
    }
  }

  /// Repeats \p single for cycles 2..N, merging the junction point between repetitions.
  std::vector<Step> repeatCycles(const std::vector<Step>& single, int cycles) {
    requireWithinPlanLimit(static_cast<double>(single.size()) * static_cast<double>(cycles),
                           std::to_string(cycles) + " cycles of " + std::to_string(single.size()) +
                               " steps");
    std::vector<Step> all = single;
    all.reserve(single.size() * static_cast<std::size_t>(cycles));
    for (int c = 2; c <= cycles; ++c) {
      for (std::size_t i = 0; i < single.size(); ++i) {
        if (i == 0 && all.back().targetVoltage == single[i].targetVoltage)
          continue;
        Step s = single[i];
        s.cycle = c;
        all.push_back(s);
      }
    }
    return all;
  }

} // namespace

std::vector<double> SegmentBuilder::ramp(double from, double to, double stepMag) {
  stepMag = std::fabs(stepMag);
  if (from == to)
    return { tidy(from) };
  if (stepMag == 0.0)
    reject("step cannot be zero");

  const double span = std::fabs(to - from);
  const double ratio = span / stepMag;
  const double intervals = std::ceil(ratio - 1e-9 * ratio);
  if (intervals + 1 > static_cast<double>(kMaxPlanPoints))
    reject("ramp " + std::to_string(from) + " -> " + std::to_string(to) +
           " needs too many points for step " + std::to_string(stepMag));

  const auto n = static_cast<std::size_t>(intervals);
  const double signedStep = to > from ? stepMag : -stepMag;

  std::vector<double> out;
  out.reserve(n + 1);
  for (std::size_t k = 0; k < n; ++k)
    out.push_back(tidy(from + static_cast<double>(k) * signedStep));
  out.push_back(to); // exact end, never past it
  return out;
}

SegmentPlan SegmentBuilder::build(const Protocol& protocol) {
  return std::visit(
      [](const auto& p) -> SegmentPlan {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StandardSweep>)
          return buildSweep(p);
        else if constexpr (std::is_same_v<T, CustomSequence>)
          return buildCustom(p);
        else
          return buildWrer(p);
      },
      protocol);
}

SegmentPlan SegmentBuilder::buildSweep(const StandardSweep& p) {
  requireFinite(p.step, "step");
  requirePositive(p.delay, "delay");
  if (p.step == 0.0)
    reject("sweep step cannot be zero");

  std::vector<Step> steps;

  if (p.mode == SweepMode::OneWay) {
    requireFinite(p.start, "start");
    requireFinite(p.stop, "stop");
    if (p.start == p.stop)
      reject("one-way sweep needs stop != start");
    appendRamp(steps, ramp(p.start, p.stop, p.step), p.delay, 1);
    return SegmentPlan{ std::move(steps) };
  }

  requireFinite(p.cyclePeak, "cycle peak");
  requireCycles(p.cycles);
  if (p.cyclePeak < 0.0)
    reject("cycle peak must be >= 0");

  const double peak = p.cyclePeak;
  if (peak == 0.0) {
    steps.push_back(Step{ 0.0, p.delay, p.delay, 1, Phase::Sweep });
    return SegmentPlan{ std::move(steps) };
  }

  // 0 -> +P -> 0 -> -P -> 0
  appendRamp(steps, ramp(0.0, peak, p.step), p.delay, 1);
  appendRamp(steps, ramp(peak, 0.0, p.step), p.delay, 1);
  appendRamp(steps, ramp(0.0, -peak, p.step), p.delay, 1);
  appendRamp(steps, ramp(-peak, 0.0, p.step), p.delay, 1);

  return SegmentPlan{ repeatCycles(steps, p.cycles) };
}

SegmentPlan SegmentBuilder::buildCustom(const CustomSequence& p) {
  requirePositive(p.delay, "delay");
  requireFinite(p.step, "step");
  requireCycles(p.cycles);
  if (p.segments.empty())
    reject("custom sequence needs at least one segment");

  double step = std::fabs(p.step);
  std::vector<Step> single;

  for (std::size_t i = 0; i < p.segments.size(); ++i) {
    const auto& seg = p.segments[i];
    requireFinite(seg.startV, "segment start");
    requireFinite(seg.endV, "segment end");
    if (seg.step) {
      requireFinite(*seg.step, "segment step");
      step = std::fabs(*seg.step);
    }
    if (step == 0.0 && seg.startV != seg.endV)
      reject("segment " + std::to_string(i + 1) + " has a zero step");
    appendRamp(single, ramp(seg.startV, seg.endV, step), p.delay, 1);
  }

  return SegmentPlan{ repeatCycles(single, p.cycles) };
}

SegmentPlan SegmentBuilder::buildWrer(const Wrer& p) {
  requireFinite(p.writeV, "write voltage");
  requireFinite(p.readV, "read voltage");
  requireFinite(p.eraseV, "erase voltage");
  requirePositive(p.writeTime, "write time");
  requirePositive(p.readTime, "read time");
  requirePositive(p.eraseTime, "erase time");
  requirePositive(p.samplingInterval, "sampling interval");
  requireCycles(p.cycles);

  const double dt = p.samplingInterval;
  const std::vector<Step> cycle{ Step{ p.writeV, p.writeTime, dt, 1, Phase::Write },
                                 Step{ p.readV, p.readTime, dt, 1, Phase::Read },
                                 Step{ p.eraseV, p.eraseTime, dt, 1, Phase::Erase },
                                 Step{ p.readV, p.readTime, dt, 1, Phase::Read } };

  double perCycle = 0.0;
  for (const auto& s : cycle) {
    const auto reads = readsPerStep(s);
    requireWithinPlanLimit(static_cast<double>(reads),
                           std::string(protocols::toString(s.phase)) + " phase sample count");
    perCycle += static_cast<double>(reads);
  }
  requireWithinPlanLimit(perCycle * static_cast<double>(p.cycles),
                         "WRER sample count over " + std::to_string(p.cycles) + " cycles");

  std::vector<Step> steps;
  steps.reserve(static_cast<std::size_t>(p.cycles) * cycle.size());
  for (int c = 1; c <= p.cycles; ++c) {
    for (Step s : cycle) {
      s.cycle = c;
      steps.push_back(s);
    }
  }
  return SegmentPlan{ std::move(steps) };
}
