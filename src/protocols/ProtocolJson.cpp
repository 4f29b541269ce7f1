/* @file ProtocolJson.cpp
 * @brief protocol file → Protocol variant
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ivseq headers
#include "core/Errors.hpp"
#include "protocols/ProtocolJson.hpp"

namespace ivseq::protocols {

  namespace {
    template <typename T> void readIf(const nlohmann::json& j, const char* key, T& out) {
      if (auto it = j.find(key); it != j.end())
        it->get_to(out);
    }

    [[noreturn]] void invalid(const std::string& why) {
      throw core::SequenceError(core::Fault::InvalidProtocolParameters, "[ProtocolJson] " + why);
    }
  } // namespace

  void from_json(const nlohmann::json& j, StandardSweep& p) {
    readIf(j, "start", p.start);
    readIf(j, "stop", p.stop);
    readIf(j, "step", p.step);
    readIf(j, "delay_s", p.delay);
    readIf(j, "cycle_peak", p.cyclePeak);
    readIf(j, "cycles", p.cycles);

    const auto mode = j.value("mode", std::string{ "one_way" });
    if (mode == "one_way")
      p.mode = SweepMode::OneWay;
    else if (mode == "simple_cycle")
      p.mode = SweepMode::SimpleCycle;
    else
      invalid("unknown sweep mode '" + mode + "'");
  }

  void from_json(const nlohmann::json& j, CustomSegment& s) {
    s.startV = j.at("start").get<double>();
    s.endV = j.at("end").get<double>();
    if (auto it = j.find("step"); it != j.end() && !it->is_null())
      s.step = it->get<double>();
  }

  void from_json(const nlohmann::json& j, CustomSequence& p) {
    readIf(j, "segments", p.segments);
    readIf(j, "step", p.step);
    readIf(j, "delay_s", p.delay);
    readIf(j, "cycles", p.cycles);
  }

  void from_json(const nlohmann::json& j, Wrer& p) {
    readIf(j, "write_v", p.writeV);
    readIf(j, "write_time_s", p.writeTime);
    readIf(j, "read_v", p.readV);
    readIf(j, "read_time_s", p.readTime);
    readIf(j, "erase_v", p.eraseV);
    readIf(j, "erase_time_s", p.eraseTime);
    readIf(j, "cycles", p.cycles);
    readIf(j, "sampling_interval_s", p.samplingInterval);
    readIf(j, "step", p.step);
  }

  Protocol protocolFromJson(const nlohmann::json& j) {
    if (!j.is_object())
      invalid("protocol must be a JSON object");
    std::string kind;
    try {
      kind = j.value("kind", std::string{});
      if (kind == "standard")
        return j.get<StandardSweep>();
      if (kind == "custom")
        return j.get<CustomSequence>();
      if (kind == "wrer")
        return j.get<Wrer>();
    } catch (const nlohmann::json::exception& e) {
      invalid(kind + ": " + e.what());
    }
    invalid("unknown protocol kind '" + kind + "' (standard, custom, wrer)");
  }

} // namespace ivseq::protocols
