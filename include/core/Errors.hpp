#pragma once
/** @file  Errors.hpp
 *  @brief Fault taxonomy shared by the sequencing engine and its collaborators.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ivseq::core {

  enum class Fault : std::uint8_t {
    InvalidProtocolParameters,
    ComplianceNotSet,
    VoltageExceedsLimit,
    RunAlreadyInProgress,
    TimingModeUnavailable,
    InstrumentCommunicationError,
  };

  inline const char* toString(Fault f) {
    switch (f) {
    case Fault::InvalidProtocolParameters:
      return "InvalidProtocolParameters";
    case Fault::ComplianceNotSet:
      return "ComplianceNotSet";
    case Fault::VoltageExceedsLimit:
      return "VoltageExceedsLimit";
    case Fault::RunAlreadyInProgress:
      return "RunAlreadyInProgress";
    case Fault::TimingModeUnavailable:
      return "TimingModeUnavailable";
    case Fault::InstrumentCommunicationError:
      return "InstrumentCommunicationError";
    default:
      return "Unknown";
    }
  }

  /// Any engine-level failure; `fault()` names the taxonomy entry, `what()` the operator-facing reason.
  class SequenceError : public std::runtime_error {
  public:
    SequenceError(Fault fault, const std::string& reason)
        : std::runtime_error(reason), fault_{ fault } {}

    Fault fault() const noexcept { return fault_; }

  private:
    Fault fault_;
  };

  /// Mid-run transport failure. Terminal for the run.
  class InstrumentCommunicationError : public SequenceError {
  public:
    InstrumentCommunicationError(double lastAppliedVoltage, const std::string& reason)
        : SequenceError(Fault::InstrumentCommunicationError, reason),
          lastAppliedVoltage_{ lastAppliedVoltage } {}

    double lastAppliedVoltage() const noexcept { return lastAppliedVoltage_; }

  private:
    double lastAppliedVoltage_;
  };

  /// Raised by InstrumentTransport implementations on I/O or instrument-reported errors.
  class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace ivseq::core
