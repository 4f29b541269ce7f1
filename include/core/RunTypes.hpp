#pragma once
/** @file  RunTypes.hpp
 *  @brief Value types that cross the engine boundary (samples, run info, final status).
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <string>

// ivseq headers
#include "protocols/SegmentPlan.hpp"

namespace ivseq::core {

  enum class TimingMode : std::uint8_t { Host, DeviceTSP };

  /// Logging collaborator's answer for an existing output file.
  enum class FileDecision : std::uint8_t { Append, Overwrite, Abort };

  inline const char* toString(TimingMode m) {
    return m == TimingMode::Host ? "host-paced" : "device-paced";
  }

  inline const char* toString(FileDecision d) {
    switch (d) {
    case FileDecision::Append:
      return "append";
    case FileDecision::Overwrite:
      return "overwrite";
    case FileDecision::Abort:
      return "abort";
    default:
      return "unknown";
    }
  }

  struct Sample {
    std::size_t index{ 0 };
    double elapsedTime{ 0.0 }; ///< seconds since run start
    double voltage{ 0.0 };
    double current{ 0.0 };
    int cycle{ 1 };
    protocols::Phase phase{ protocols::Phase::Sweep };
  };

  struct RunInfo {
    std::string protocol;
    TimingMode timing{ TimingMode::Host };
    FileDecision fileDecision{ FileDecision::Overwrite };
    std::size_t expectedSamples{ 0 };
  };

  enum class RunOutcome : std::uint8_t { Completed, Aborted, Failed };

  inline const char* toString(RunOutcome o) {
    switch (o) {
    case RunOutcome::Completed:
      return "Completed";
    case RunOutcome::Aborted:
      return "Aborted";
    case RunOutcome::Failed:
      return "Failed";
    default:
      return "Unknown";
    }
  }

  struct RunStatus {
    RunOutcome outcome{ RunOutcome::Completed };
    std::string reason{};       ///< set for Failed
    std::size_t samples{ 0 };   ///< samples emitted before the run ended
    double lastAppliedVoltage{ 0.0 };
  };

} // namespace ivseq::core
