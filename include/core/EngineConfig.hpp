#pragma once
/** @file  EngineConfig.hpp
 *  @brief Typed view of the JSON run-time configuration.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/SafetyInterlock.hpp"

namespace ivseq::core {

  struct InstrumentSettings {
    std::string device{ "/dev/ttyUSB0" };
    int baud{ 115200 };
    std::string terminator{ "\n" };
    std::chrono::milliseconds timeout{ 5000 };
    std::string channel{ "smua" }; ///< TSP channel name
  };

  struct TimingSettings {
    double hostMinDelay{ 0.01 };          ///< seconds, host-paced settling floor
    double deviceMinDelay{ 0.001 };       ///< seconds, device-paced floor
    double deviceFastMinDelay{ 500e-9 };  ///< used when `fastLimit` is on
    bool fastLimit{ false };

    double deviceFloor() const { return fastLimit ? deviceFastMinDelay : deviceMinDelay; }
  };

  struct RunMetadata {
    std::string sampleName;
    std::string operatorName;
    std::string notes;
  };

  struct LoggingSettings {
    std::string outputDir{ "." };
    RunMetadata metadata;
  };

  struct EngineConfig {
    InstrumentSettings instrument;
    SafetyLimits safety;
    TimingSettings timing;
    LoggingSettings logging;
  };

  /// Missing keys keep their defaults; wrong types throw nlohmann::json::type_error.
  void from_json(const nlohmann::json& j, InstrumentSettings& s);
  void from_json(const nlohmann::json& j, SafetyLimits& s);
  void from_json(const nlohmann::json& j, TimingSettings& s);
  void from_json(const nlohmann::json& j, LoggingSettings& s);
  void from_json(const nlohmann::json& j, EngineConfig& c);

  /// Rejects values the engine cannot run with (non-positive limits, unknown baud...).
  void validate(const EngineConfig& c);

} // namespace ivseq::core
