/* @file EngineConfig.cpp
 * @brief JSON → EngineConfig mapping and sanity checks
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ivseq headers
#include "core/EngineConfig.hpp"
#include "io/SerialChannel.hpp"

namespace ivseq::core {

  namespace {
    template <typename T> void readIf(const nlohmann::json& j, const char* key, T& out) {
      if (auto it = j.find(key); it != j.end())
        it->get_to(out);
    }
  } // namespace

  void from_json(const nlohmann::json& j, InstrumentSettings& s) {
    readIf(j, "device", s.device);
    readIf(j, "baud", s.baud);
    readIf(j, "terminator", s.terminator);
    readIf(j, "channel", s.channel);
    if (auto it = j.find("timeout_ms"); it != j.end())
      s.timeout = std::chrono::milliseconds{ it->get<long long>() };
  }

  void from_json(const nlohmann::json& j, SafetyLimits& s) {
    readIf(j, "max_abs_voltage", s.maxAbsVoltage);
    readIf(j, "max_compliance_ua", s.maxComplianceUA);
    readIf(j, "high_voltage_threshold", s.highVoltageThreshold);
  }

  void from_json(const nlohmann::json& j, TimingSettings& s) {
    readIf(j, "host_min_delay_s", s.hostMinDelay);
    readIf(j, "device_min_delay_s", s.deviceMinDelay);
    readIf(j, "device_fast_min_delay_s", s.deviceFastMinDelay);
    readIf(j, "fast_limit", s.fastLimit);
  }

  void from_json(const nlohmann::json& j, LoggingSettings& s) {
    readIf(j, "output_dir", s.outputDir);
    readIf(j, "sample_name", s.metadata.sampleName);
    readIf(j, "operator", s.metadata.operatorName);
    readIf(j, "notes", s.metadata.notes);
  }

  void from_json(const nlohmann::json& j, EngineConfig& c) {
    readIf(j, "instrument", c.instrument);
    readIf(j, "safety", c.safety);
    readIf(j, "timing", c.timing);
    readIf(j, "logging", c.logging);
  }

  void validate(const EngineConfig& c) {
    if (c.instrument.device.empty())
      throw std::runtime_error("[EngineConfig] instrument.device is empty");
    if (io::toSpeed(c.instrument.baud) == B0)
      throw std::runtime_error("[EngineConfig] unsupported baud rate " +
                               std::to_string(c.instrument.baud));
    if (c.instrument.terminator.empty())
      throw std::runtime_error("[EngineConfig] instrument.terminator is empty");
    if (c.instrument.timeout.count() <= 0)
      throw std::runtime_error("[EngineConfig] instrument.timeout_ms must be > 0");
    if (c.safety.maxAbsVoltage <= 0.0 || c.safety.maxComplianceUA <= 0.0)
      throw std::runtime_error("[EngineConfig] safety limits must be > 0");
    if (c.safety.highVoltageThreshold < 0.0 ||
        c.safety.highVoltageThreshold > c.safety.maxAbsVoltage)
      throw std::runtime_error("[EngineConfig] high_voltage_threshold must lie in [0, max_abs_voltage]");
    if (c.timing.hostMinDelay <= 0.0 || c.timing.deviceMinDelay <= 0.0 ||
        c.timing.deviceFastMinDelay <= 0.0)
      throw std::runtime_error("[EngineConfig] timing floors must be > 0");
  }

} // namespace ivseq::core
