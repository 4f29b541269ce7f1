#pragma once
/** @file  SegmentPlan.hpp
 *  @brief Compiled, immutable list of primitive voltage steps for one run.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <utility>
#include <vector>

namespace ivseq {
  namespace protocols {

    /// WRER phase a step belongs to; sweeps use `Sweep`.
    enum class Phase { Sweep, Write, Read, Erase };

    inline const char* toString(Phase p) {
      switch (p) {
      case Phase::Sweep:
        return "sweep";
      case Phase::Write:
        return "write";
      case Phase::Read:
        return "read";
      case Phase::Erase:
        return "erase";
      default:
        return "unknown";
      }
    }

    struct Step {
      double targetVoltage{ 0.0 };
      double holdDuration{ 0.0 }; ///< seconds
      double sampleEvery{ 0.0 };  ///< seconds between reads inside the hold
      int cycle{ 1 };             ///< 1-based
      Phase phase{ Phase::Sweep };
    };

    /// Upper bound on the steps of a plan and on the samples it may emit.
    inline constexpr std::size_t kMaxPlanPoints = 1'000'000;

    /// Reads taken while holding `step`: ⌈hold / sampleEvery⌉, never fewer than one.
    /// Saturates at `kMaxPlanPoints + 1` so oversized holds stay detectable.
    std::size_t readsPerStep(const Step& step);

    /// Waits around the reads of one step, in seconds.
    struct ReadSchedule {
      std::size_t reads{ 1 };
      double settle{ 0.0 }; ///< after the level is applied, before the first read
      double gap{ 0.0 };    ///< between consecutive reads
      double tail{ 0.0 };   ///< after the last read, before the next step
      bool raised{ false }; ///< a wait was lengthened to the settling floor

      double duration() const { return settle + gap * static_cast<double>(reads - 1) + tail; }
    };

    /**
     * Sweep steps settle for the whole hold, then read.
     * WRER phases read at offsets 0, Δ, 2Δ... and wait out the remainder of the
     * hold, so the last read lands at or before the phase time.
     * Settle and gap are raised to \p minDelay.
     */
    ReadSchedule readSchedule(const Step& step, double minDelay);

    /**
 * @class SegmentPlan
 * @brief Ordered, non-empty sequence of Steps produced once per run.
 *
 *  * Constructed only by SegmentBuilder; read-only afterwards.
 */
    class SegmentPlan {
    public:
      explicit SegmentPlan(std::vector<Step> steps) : steps_{ std::move(steps) } {}

      const std::vector<Step>& steps() const { return steps_; }
      std::size_t size() const { return steps_.size(); }
      bool empty() const { return steps_.empty(); }
      const Step& operator[](std::size_t i) const { return steps_[i]; }

      auto begin() const { return steps_.begin(); }
      auto end() const { return steps_.end(); }

      /// Total samples a full execution emits.
      std::size_t expectedSampleCount() const;

      /// Nominal run length in seconds (sum of hold durations).
      double nominalDuration() const;

    private:
      std::vector<Step> steps_;
    };

  } // namespace protocols
} // namespace ivseq
