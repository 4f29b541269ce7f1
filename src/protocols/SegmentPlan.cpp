/* @file SegmentPlan.cpp
 * @brief sample-count helpers for compiled plans
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// ivseq headers
#include "protocols/SegmentPlan.hpp"

using namespace ivseq::protocols;

std::size_t ivseq::protocols::readsPerStep(const Step& step) {
  if (step.sampleEvery <= 0.0 || step.holdDuration <= step.sampleEvery)
    return 1;
  // relative slack keeps 0.3 / 0.1 from rounding up to 4
  const double ratio = step.holdDuration / step.sampleEvery;
  const double reads = std::ceil(ratio - 1e-9 * ratio);
  if (!(reads <= static_cast<double>(kMaxPlanPoints)))
    return kMaxPlanPoints + 1;
  return std::max<std::size_t>(static_cast<std::size_t>(reads), 1);
}

ReadSchedule ivseq::protocols::readSchedule(const Step& step, double minDelay) {
  ReadSchedule s;
  s.reads = readsPerStep(step);
  if (step.phase == Phase::Sweep) {
    const double raw = s.reads > 1 ? step.sampleEvery : step.holdDuration;
    s.settle = std::max(raw, minDelay);
    s.gap = s.settle;
    s.raised = raw < minDelay;
    return s;
  }
  s.gap = std::max(step.sampleEvery, minDelay);
  s.raised = s.reads > 1 && step.sampleEvery < minDelay;
  s.tail = std::max(step.holdDuration - s.gap * static_cast<double>(s.reads - 1), 0.0);
  return s;
}

std::size_t SegmentPlan::expectedSampleCount() const {
  std::size_t total = 0;
  for (const auto& s : steps_)
    total += readsPerStep(s);
  return total;
}

double SegmentPlan::nominalDuration() const {
  double total = 0.0;
  for (const auto& s : steps_)
    total += s.holdDuration;
  return total;
}
