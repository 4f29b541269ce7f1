/* @file Protocol.cpp
 * @brief extrema + labels for the protocol variant
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <type_traits>

// ivseq headers
#include "protocols/Protocol.hpp"

namespace ivseq::protocols {

  namespace {
    template <class> inline constexpr bool kAlwaysFalse = false;
  } // namespace

  std::vector<double> targetExtrema(const Protocol& protocol) {
    return std::visit(
        [](const auto& p) -> std::vector<double> {
          using T = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<T, StandardSweep>) {
            if (p.mode == SweepMode::SimpleCycle) {
              const double peak = std::fabs(p.cyclePeak);
              return { 0.0, peak, -peak };
            }
            return { p.start, p.stop };
          } else if constexpr (std::is_same_v<T, CustomSequence>) {
            std::vector<double> out;
            out.reserve(p.segments.size() * 2);
            for (const auto& seg : p.segments) {
              out.push_back(seg.startV);
              out.push_back(seg.endV);
            }
            return out;
          } else if constexpr (std::is_same_v<T, Wrer>) {
            return { p.writeV, p.readV, p.eraseV };
          } else {
            static_assert(kAlwaysFalse<T>, "unhandled protocol kind");
          }
        },
        protocol);
  }

  std::string describe(const Protocol& protocol) {
    return std::visit(
        [](const auto& p) -> std::string {
          using T = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<T, StandardSweep>) {
            return p.mode == SweepMode::SimpleCycle ? "simple-cycle sweep" : "one-way sweep";
          } else if constexpr (std::is_same_v<T, CustomSequence>) {
            return "custom sequence (" + std::to_string(p.segments.size()) + " segments)";
          } else if constexpr (std::is_same_v<T, Wrer>) {
            return "WRER";
          } else {
            static_assert(kAlwaysFalse<T>, "unhandled protocol kind");
          }
        },
        protocol);
  }

} // namespace ivseq::protocols
