#pragma once
/** @file  Protocol.hpp
 *  @brief Tagged union over the three supported run kinds.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ivseq {
  namespace protocols {

    enum class SweepMode { OneWay, SimpleCycle };

    /// Classic I-V sweep. `start`/`stop` are used by OneWay, `cyclePeak`/`cycles` by SimpleCycle.
    struct StandardSweep {
      double start{ 0.0 };
      double stop{ 1.0 };
      double step{ 0.1 };
      double delay{ 0.1 }; ///< seconds per point
      SweepMode mode{ SweepMode::OneWay };
      double cyclePeak{ 1.0 };
      int cycles{ 1 };
    };

    struct CustomSegment {
      double startV{ 0.0 };
      double endV{ 0.0 };
      std::optional<double> step{}; ///< overrides the shared step from here on
    };

    struct CustomSequence {
      std::vector<CustomSegment> segments;
      double step{ 0.1 };
      double delay{ 0.1 };
      int cycles{ 1 };
    };

    /// Write-Read-Erase-Read endurance cycle. `step` is carried only so all kinds share a form.
    struct Wrer {
      double writeV{ 1.0 };
      double writeTime{ 0.1 };
      double readV{ 0.1 };
      double readTime{ 0.1 };
      double eraseV{ -1.0 };
      double eraseTime{ 0.1 };
      int cycles{ 1 };
      double samplingInterval{ 0.1 };
      double step{ 0.0 };
    };

    using Protocol = std::variant<StandardSweep, CustomSequence, Wrer>;

    /// Every voltage the protocol can command (ramp end points, cycle peaks, phase levels).
    std::vector<double> targetExtrema(const Protocol& protocol);

    /// Short label for logs ("one-way sweep", "WRER", ...).
    std::string describe(const Protocol& protocol);

  } // namespace protocols
} // namespace ivseq
