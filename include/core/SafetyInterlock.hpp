#pragma once
/** @file  SafetyInterlock.hpp
 *  @brief Compliance / voltage gate consulted before any hazardous instrument action.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <mutex>
#include <string>
#include <vector>

// ivseq headers
#include "protocols/Protocol.hpp"

namespace ivseq {
  namespace core {

    struct InterlockState {
      bool complianceSet{ false };
      double complianceValueUA{ 0.0 };
      double maxVoltageLimit{ 210.0 };
      double lastAppliedVoltage{ 0.0 };
    };

    struct SafetyLimits {
      double maxAbsVoltage{ 210.0 };
      double maxComplianceUA{ 1'000'000.0 };
      double highVoltageThreshold{ 5.0 }; ///< |V| above this needs operator confirmation
    };

    enum class Verdict { Ok, ComplianceNotSet, VoltageExceedsLimit, ConfirmationRequired };

    inline const char* toString(Verdict v) {
      switch (v) {
      case Verdict::Ok:
        return "Ok";
      case Verdict::ComplianceNotSet:
        return "ComplianceNotSet";
      case Verdict::VoltageExceedsLimit:
        return "VoltageExceedsLimit";
      case Verdict::ConfirmationRequired:
        return "ConfirmationRequired";
      default:
        return "Unknown";
      }
    }

    struct Validation {
      Verdict verdict{ Verdict::Ok };
      std::string reason{}; ///< operator-facing explanation, empty for Ok

      bool ok() const { return verdict == Verdict::Ok; }
      bool hardFailure() const {
        return verdict == Verdict::ComplianceNotSet || verdict == Verdict::VoltageExceedsLimit;
      }
    };

    /**
 * @class SafetyInterlock
 * @brief Owns the InterlockState and evaluates protocols against it.
 *
 *  * `validate()` is read-only; state changes only through `recordCompliance()`
 *    and `recordVoltage()`.
 *  * Thread-safe (the GUI thread records, the controller validates).
 */
    class SafetyInterlock {
    public:
      explicit SafetyInterlock(SafetyLimits limits = {});

      /// Hard failures first (compliance, limit), then the advisory high-voltage gate.
      /// \p confirmed skips the advisory gate once the operator has accepted it.
      Validation validate(const protocols::Protocol& protocol, bool confirmed = false) const;

      /// Same rules, for a single manual set-point.
      Validation validateVoltage(double volts, bool confirmed = false) const;

      /// Throws `std::invalid_argument` unless 0 < uA <= maxComplianceUA.
      void checkCompliance(double uA) const;

      void recordCompliance(double uA);
      void recordVoltage(double volts);

      InterlockState state() const;
      const SafetyLimits& limits() const { return limits_; }

    private:
      static Validation evaluate(const InterlockState& st, const SafetyLimits& limits,
                                 const std::vector<double>& targets, bool confirmed);

      SafetyLimits limits_;
      InterlockState state_;
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace ivseq
