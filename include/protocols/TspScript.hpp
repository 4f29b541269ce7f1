#pragma once
/** @file  TspScript.hpp
 *  @brief Compiles a SegmentPlan into a 2600-series TSP script that records (t, v, i) on the device.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// ivseq headers
#include "protocols/SegmentPlan.hpp"

namespace ivseq::protocols {

  /// Compiled device-side program, sent line by line by the transport.
  struct DeviceScript {
    std::vector<std::string> lines;
    std::size_t expectedPoints{ 0 };
    std::chrono::milliseconds timeout{ 20000 }; ///< bound on the blocking run
    std::string source() const;                 ///< lines joined with '\n'
  };

  /**
 * @class TspScript
 * @brief Plan data is uploaded as `ivseq_push{v,settle,gap,n,tail,...}` rows, then a named
 *        script loops over it. The script prints `kDoneMarker` when finished;
 *        results stay in `ivseq_buf` until fetched.
 */
  class TspScript {
  public:
    static constexpr const char* kDoneMarker = "IVSEQ_DONE";
    static constexpr const char* kEndMarker = "IVSEQ_END";
    static constexpr std::size_t kStepsPerRow = 64;

    /// Reads follow readSchedule(); \p minDelay is the device settling floor.
    static DeviceScript compile(const SegmentPlan& plan, double minDelay,
                                const std::string& channel = "smua");

    /// Commands that print one "t,v,i" line per stored point followed by `kEndMarker`.
    static std::string fetchCommand();

    /// Host-side timeout for a run lasting \p runtime seconds: 8x, within [20 s, 300 s],
    /// but never below 1.5x + 5 s.
    static std::chrono::milliseconds timeoutFor(double runtime);
  };

} // namespace ivseq::protocols
