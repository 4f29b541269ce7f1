#include "core/ConfigLoader.hpp"
#include "core/EngineConfig.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace ivseq::core;

namespace {

  /// Writes \p text to a unique temp file, removed on scope exit.
  class TempFile {
  public:
    explicit TempFile(const std::string& text) {
      char name[] = "/tmp/ivseq_cfg_XXXXXX";
      const int fd = mkstemp(name);
      if (fd < 0)
        throw std::runtime_error("mkstemp failed");
      ::close(fd);
      path_ = name;
      std::ofstream(path_) << text;
    }
    ~TempFile() { std::remove(path_.c_str()); }
    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace

TEST(config_loader, full_document_maps_every_section) {
  TempFile f(R"({
    "instrument": { "device": "/dev/ttyS3", "baud": 9600, "terminator": "\r\n",
                    "channel": "smub", "timeout_ms": 1500 },
    "safety": { "max_abs_voltage": 40, "max_compliance_ua": 1000, "high_voltage_threshold": 10 },
    "timing": { "host_min_delay_s": 0.02, "device_min_delay_s": 0.002, "fast_limit": true },
    "logging": { "output_dir": "/data/runs", "sample_name": "wafer 7", "operator": "jk",
                 "notes": "after anneal" }
  })");

  const auto cfg = ConfigLoader(f.path()).loadEngineConfig();
  EXPECT_EQ(cfg.instrument.device, "/dev/ttyS3");
  EXPECT_EQ(cfg.instrument.baud, 9600);
  EXPECT_EQ(cfg.instrument.terminator, "\r\n");
  EXPECT_EQ(cfg.instrument.channel, "smub");
  EXPECT_EQ(cfg.instrument.timeout, std::chrono::milliseconds{ 1500 });
  EXPECT_DOUBLE_EQ(cfg.safety.maxAbsVoltage, 40.0);
  EXPECT_DOUBLE_EQ(cfg.safety.maxComplianceUA, 1000.0);
  EXPECT_DOUBLE_EQ(cfg.safety.highVoltageThreshold, 10.0);
  EXPECT_DOUBLE_EQ(cfg.timing.hostMinDelay, 0.02);
  EXPECT_TRUE(cfg.timing.fastLimit);
  EXPECT_DOUBLE_EQ(cfg.timing.deviceFloor(), 500e-9);
  EXPECT_EQ(cfg.logging.outputDir, "/data/runs");
  EXPECT_EQ(cfg.logging.metadata.sampleName, "wafer 7");
  EXPECT_EQ(cfg.logging.metadata.operatorName, "jk");
}

TEST(config_loader, empty_object_keeps_defaults) {
  TempFile f("{}");
  const auto cfg = ConfigLoader(f.path()).loadEngineConfig();
  EXPECT_EQ(cfg.instrument.device, "/dev/ttyUSB0");
  EXPECT_EQ(cfg.instrument.baud, 115200);
  EXPECT_DOUBLE_EQ(cfg.safety.maxAbsVoltage, 210.0);
  EXPECT_DOUBLE_EQ(cfg.safety.maxComplianceUA, 1e6);
  EXPECT_DOUBLE_EQ(cfg.safety.highVoltageThreshold, 5.0);
  EXPECT_DOUBLE_EQ(cfg.timing.hostMinDelay, 0.01);
  EXPECT_DOUBLE_EQ(cfg.timing.deviceFloor(), 0.001);
}

TEST(config_loader, missing_file_throws) {
  EXPECT_THROW(ConfigLoader("/nonexistent/ivseq.json").load(), std::runtime_error);
}

TEST(config_loader, malformed_json_throws) {
  TempFile f("{ \"instrument\": ");
  EXPECT_THROW(ConfigLoader(f.path()).load(), std::runtime_error);
}

TEST(config_loader, wrong_types_and_bad_values_throw) {
  TempFile wrongType(R"({ "instrument": { "baud": "fast" } })");
  EXPECT_THROW(ConfigLoader(wrongType.path()).loadEngineConfig(), std::runtime_error);

  TempFile badBaud(R"({ "instrument": { "baud": 12345 } })");
  EXPECT_THROW(ConfigLoader(badBaud.path()).loadEngineConfig(), std::runtime_error);

  TempFile badThreshold(R"({ "safety": { "max_abs_voltage": 10, "high_voltage_threshold": 20 } })");
  EXPECT_THROW(ConfigLoader(badThreshold.path()).loadEngineConfig(), std::runtime_error);

  TempFile badFloor(R"({ "timing": { "host_min_delay_s": 0 } })");
  EXPECT_THROW(ConfigLoader(badFloor.path()).loadEngineConfig(), std::runtime_error);
}
