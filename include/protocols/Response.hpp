#pragma once
/** @file  Response.hpp
 *  @brief Parsed instrument reply line.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

namespace ivseq {
  namespace protocols {

    /// One (t, v, i) point of a device-side result buffer.
    struct BufferPoint {
      double t{ 0.0 };
      double v{ 0.0 };
      double i{ 0.0 };
    };

    struct Response {
      std::string text; ///< trimmed reply, no terminator

      /// Trims whitespace/CR/LF; std::nullopt for an empty line.
      static std::optional<Response> fromWire(const std::string& line);

      /// First number in the first comma-separated field (SCPI replies may carry several).
      std::optional<double> firstNumber() const;

      /// "t,v,i" as emitted by the device-paced script.
      std::optional<BufferPoint> asBufferPoint() const;

      /// SCPI `SYST:ERR?` reply that reports an empty queue ("0,..." / "+0,...").
      bool isNoError() const;

      /// Keithley reports overrange / compliance as ±9.9e37.
      static bool isOverflow(double value);
    };

  } // namespace protocols
} // namespace ivseq
