/* @file SafetyInterlock.cpp
 * @brief compliance / limit / high-voltage checks
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

// ivseq headers
#include "core/SafetyInterlock.hpp"

using namespace ivseq::core;

namespace {
  std::string volts(double v) {
    std::ostringstream os;
    os << v << " V";
    return os.str();
  }
} // namespace

SafetyInterlock::SafetyInterlock(SafetyLimits limits) : limits_{ limits } {
  state_.maxVoltageLimit = limits_.maxAbsVoltage;
}

Validation SafetyInterlock::evaluate(const InterlockState& st, const SafetyLimits& limits,
                                     const std::vector<double>& targets, bool confirmed) {
  double peak = 0.0;
  for (double v : targets) {
    if (!std::isfinite(v))
      return { Verdict::VoltageExceedsLimit, "[SafetyInterlock] target voltage is not finite" };
    peak = std::max(peak, std::fabs(v));
  }

  if (peak > 0.0 && !st.complianceSet)
    return { Verdict::ComplianceNotSet,
             "[SafetyInterlock] apply a current compliance before sourcing " + volts(peak) };

  if (peak > st.maxVoltageLimit)
    return { Verdict::VoltageExceedsLimit, "[SafetyInterlock] " + volts(peak) +
                                               " exceeds the +/-" + volts(st.maxVoltageLimit) +
                                               " limit" };

  if (!confirmed && peak > limits.highVoltageThreshold)
    return { Verdict::ConfirmationRequired, "[SafetyInterlock] protocol reaches " + volts(peak) +
                                                ", above the " +
                                                volts(limits.highVoltageThreshold) +
                                                " safety threshold" };

  return {};
}

Validation SafetyInterlock::validate(const protocols::Protocol& protocol, bool confirmed) const {
  const auto targets = protocols::targetExtrema(protocol);
  std::lock_guard<std::mutex> lock(mtx_);
  return evaluate(state_, limits_, targets, confirmed);
}

Validation SafetyInterlock::validateVoltage(double v, bool confirmed) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return evaluate(state_, limits_, { v }, confirmed);
}

void SafetyInterlock::checkCompliance(double uA) const {
  if (!std::isfinite(uA))
    throw std::invalid_argument("[SafetyInterlock] compliance must be a finite number");
  if (uA <= 0.0)
    throw std::invalid_argument("[SafetyInterlock] compliance must be greater than 0 uA");
  if (uA > limits_.maxComplianceUA) {
    std::ostringstream os;
    os << "[SafetyInterlock] compliance exceeds allowed range (" << limits_.maxComplianceUA
       << " uA max)";
    throw std::invalid_argument(os.str());
  }
}

void SafetyInterlock::recordCompliance(double uA) {
  checkCompliance(uA);
  std::lock_guard<std::mutex> lock(mtx_);
  state_.complianceSet = true;
  state_.complianceValueUA = uA;
}

void SafetyInterlock::recordVoltage(double v) {
  std::lock_guard<std::mutex> lock(mtx_);
  state_.lastAppliedVoltage = v;
}

InterlockState SafetyInterlock::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}
