#pragma once
/** @file  SegmentBuilder.hpp
 *  @brief Compiles a Protocol into a SegmentPlan.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <vector>

// ivseq headers
#include "protocols/Protocol.hpp"
#include "protocols/SegmentPlan.hpp"

namespace ivseq::core {

  /**
 * @class SegmentBuilder
 * @brief Pure protocol → plan compiler; no I/O, no instrument contact.
 *
 *  * Throws `SequenceError{InvalidProtocolParameters}` on degenerate input.
 *  * Ramps never overshoot: the last point of every ramp is its end voltage.
 *  * A junction shared by two consecutive ramps (or cycles) is emitted once.
 *  * Plans never exceed `protocols::kMaxPlanPoints` steps or samples.
 */
  class SegmentBuilder {
  public:
    static protocols::SegmentPlan build(const protocols::Protocol& protocol);

    /// Voltages from \p from to \p to inclusive, spaced |stepMag| apart, last point exactly \p to.
    static std::vector<double> ramp(double from, double to, double stepMag);

  private:
    static protocols::SegmentPlan buildSweep(const protocols::StandardSweep& p);
    static protocols::SegmentPlan buildCustom(const protocols::CustomSequence& p);
    static protocols::SegmentPlan buildWrer(const protocols::Wrer& p);
  };

} // namespace ivseq::core
