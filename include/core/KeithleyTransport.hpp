#pragma once
/** @file  KeithleyTransport.hpp
 *  @brief Line-oriented SCPI/TSP transport to a Keithley SMU.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ivseq headers
#include "core/EngineConfig.hpp"
#include "core/ErrorMonitor.hpp"         // KeithleyTransport is a client to the error monitor
#include "core/InstrumentTransport.hpp"
#include "io/SerialChannel.hpp"          // owns the channel, needs the full type
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace ivseq {
  namespace core {

    /**
 * @class KeithleyTransport
 * @brief InstrumentTransport over one SerialChannel.
 *
 *  * `connect()` identifies the unit and picks the dialect (26xx → TSP).
 *  * Every setting command is followed by an error-queue check.
 *  * All failures are reported to the ErrorMonitor and thrown as TransportError.
 */
    class KeithleyTransport : public InstrumentTransport {
    public:
      KeithleyTransport(std::unique_ptr<io::SerialChannel> channel,
                        std::shared_ptr<ErrorMonitor> errMonitor, InstrumentSettings settings);
      ~KeithleyTransport() override;

      //---public APIs------------------------------------------------------
      std::string connect(); ///< open + *IDN? + defaults; returns the identity string
      void disconnect();     ///< zero output (best-effort) + close

      void applyVoltage(double volts) override;
      double readCurrent() override;
      void setCompliance(double microAmps) override;

      bool supportsScripts() const override;
      void runScript(const protocols::DeviceScript& script) override;
      std::vector<protocols::BufferPoint> fetchBuffer() override;

      void forceZero() override;

      bool connected() const { return connected_; }
      protocols::Dialect dialect() const { return commands_.dialect(); }
      const std::string& identity() const { return idn_; }

      /// "2602" style 26xx models speak TSP, everything else SCPI.
      static protocols::Dialect dialectFor(const std::string& idn);

    private:
      void sendCommand(const protocols::Command& cmd);
      protocols::Response awaitResponse(std::chrono::milliseconds timeout);
      protocols::Response query(const protocols::Command& cmd);
      std::optional<protocols::Response> tryQuery(const protocols::Command& cmd); ///< no escalation
      std::string queryIdentity();
      void enableOutput();
      void checkInstrumentErrors();
      void requireConnection() const;
      [[noreturn]] void fail(const std::string& msg);

      std::unique_ptr<io::SerialChannel> channel_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      InstrumentSettings settings_;
      protocols::CommandSet commands_;
      std::string idn_;
      bool connected_{ false };
      bool outputEnabled_{ false };
    };

  } // namespace core
} // namespace ivseq
