#pragma once
/** @file  Command.hpp
 *  @brief SMU command vocabulary for the SCPI (24xx) and TSP (26xx) dialects.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ivseq {
  namespace protocols {

    enum class Dialect : std::uint8_t { Scpi, Tsp };

    inline const char* toString(Dialect d) { return d == Dialect::Tsp ? "TSP" : "SCPI"; }

    struct Command {
      std::string payload;
      bool expectsReply{ false };
      std::string toWire(std::string_view terminator = "\n") const {
        return payload + std::string(terminator);
      }
    };

    /**
 * @class CommandSet
 * @brief Builds dialect-correct commands for one source-measure channel.
 *
 *  * SCPI targets the 2400 family, TSP the 2600 family (`smua` / `smub`).
 *  * Numbers are printed with 12 significant digits.
 */
    class CommandSet {
    public:
      explicit CommandSet(Dialect dialect = Dialect::Scpi, std::string channel = "smua");

      Dialect dialect() const { return dialect_; }
      const std::string& channel() const { return channel_; }

      static Command identify() { return { "*IDN?", true }; }
      static Command tspModel() { return { "print(localnode.model)", true }; }

      std::vector<Command> defaults() const; ///< output off, 0 V, auto-range, 1 uA limit
      Command setLevel(double volts) const;
      Command outputOn() const;
      Command outputOff() const;
      Command setCurrentLimit(double amps) const;
      Command measureCurrent() const;

      // error queue
      Command errorQuery() const;     ///< SCPI: next error; TSP: queue depth
      static Command tspNextError();  ///< TSP only: "code|msg|severity|node"

    private:
      Dialect dialect_;
      std::string channel_;
    };

    std::string formatNumber(double v);

  } // namespace protocols
} // namespace ivseq
