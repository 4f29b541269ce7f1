// ivseq headers
#include "core/Errors.hpp"
#include "core/SegmentBuilder.hpp"
#include "core/TimingDriver.hpp"

// ivseq fakes
#include "FakeInstrument.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>

namespace ivseq::test {

  using core::DriveResult;
  using core::InstrumentCommunicationError;
  using core::Sample;
  using core::SegmentBuilder;
  using core::TimingSettings;
  using protocols::Phase;

  class TimingDriverTest : public ::testing::Test {
  protected:
    core::SampleEmitter collector() {
      return [this](const Sample& s) { samples.push_back(s); };
    }

    static protocols::SegmentPlan oneWayPlan(double stop = 0.5, double delay = 0.01) {
      protocols::StandardSweep p;
      p.start = 0.0;
      p.stop = stop;
      p.step = 0.1;
      p.delay = delay;
      return SegmentBuilder::build(p);
    }

    static protocols::SegmentPlan wrerPlan() {
      protocols::Wrer w;
      w.writeV = 1.5;
      w.writeTime = 0.2;
      w.readV = 0.1;
      w.readTime = 0.1;
      w.eraseV = -1.5;
      w.eraseTime = 0.2;
      w.samplingInterval = 0.05;
      w.cycles = 1;
      return SegmentBuilder::build(w);
    }

    FakeInstrument instrument;
    std::stop_source stop;
    std::vector<Sample> samples;
    TimingSettings timing;
  };

  TEST_F(TimingDriverTest, host_paced_applies_every_step_and_reads_once_each) {
    const auto plan = oneWayPlan();
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    ASSERT_TRUE(std::holds_alternative<core::HostPacedDriver>(driver));

    const DriveResult r = core::execute(driver, plan, instrument, stop.get_token(), collector());

    EXPECT_FALSE(r.cancelled);
    EXPECT_EQ(r.samples, 6u);
    EXPECT_DOUBLE_EQ(r.lastAppliedVoltage, 0.5);
    ASSERT_EQ(instrument.applied.size(), 6u);
    ASSERT_EQ(samples.size(), 6u);
    for (std::size_t i = 0; i < samples.size(); ++i) {
      EXPECT_EQ(samples[i].index, i);
      EXPECT_DOUBLE_EQ(samples[i].voltage, plan[i].targetVoltage);
      EXPECT_DOUBLE_EQ(samples[i].current, plan[i].targetVoltage / instrument.ohms);
    }
    // the driver never zeroes on success; finalisation belongs to the controller
    EXPECT_EQ(instrument.forceZeroCalls.load(), 0);
  }

  TEST_F(TimingDriverTest, host_paced_wrer_yields_phase_sample_counts) {
    const auto plan = wrerPlan();
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    const auto r = core::execute(driver, plan, instrument, stop.get_token(), collector());

    ASSERT_EQ(r.samples, 12u);
    ASSERT_EQ(samples.size(), 12u);

    const std::vector<std::pair<Phase, std::size_t>> expected{
      { Phase::Write, 4 }, { Phase::Read, 2 }, { Phase::Erase, 4 }, { Phase::Read, 2 }
    };
    std::size_t k = 0;
    for (const auto& [phase, count] : expected) {
      for (std::size_t n = 0; n < count; ++n, ++k)
        EXPECT_EQ(samples[k].phase, phase) << "sample " << k;
    }
    EXPECT_DOUBLE_EQ(samples[0].voltage, 1.5);
    EXPECT_DOUBLE_EQ(samples[4].voltage, 0.1);
    EXPECT_DOUBLE_EQ(samples[6].voltage, -1.5);
    EXPECT_DOUBLE_EQ(samples[11].voltage, 0.1);

    for (std::size_t i = 1; i < samples.size(); ++i)
      EXPECT_GT(samples[i].elapsedTime, samples[i - 1].elapsedTime);
    // four steps, one apply each
    EXPECT_EQ(instrument.applied.size(), 4u);
  }

  TEST_F(TimingDriverTest, host_paced_wrer_reads_every_phase_within_its_hold) {
    protocols::Wrer w;
    w.writeTime = 0.25;
    w.readTime = 0.25;
    w.eraseTime = 0.25;
    w.samplingInterval = 0.1; // 2.5 intervals per phase
    const auto plan = SegmentBuilder::build(w);

    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    const auto r = core::execute(driver, plan, instrument, stop.get_token(), collector());
    ASSERT_EQ(r.samples, 12u);
    ASSERT_EQ(samples.size(), 12u);

    for (std::size_t k = 0; k < 4; ++k) {
      const double phaseStart = 0.25 * static_cast<double>(k);
      const auto& first = samples[3 * k];
      const auto& last = samples[3 * k + 2];
      EXPECT_EQ(first.phase, plan[k].phase);
      // first read at the start of the phase, last one no later than its end
      EXPECT_GE(first.elapsedTime, phaseStart - 1e-3) << "phase " << k;
      EXPECT_LT(first.elapsedTime, phaseStart + 0.04) << "phase " << k;
      EXPECT_LE(last.elapsedTime - first.elapsedTime, 0.25) << "phase " << k;
      EXPECT_LE(last.elapsedTime, phaseStart + 0.25) << "phase " << k;
    }
    EXPECT_LT(samples.back().elapsedTime, plan.nominalDuration());
  }

  TEST_F(TimingDriverTest, device_buffer_times_follow_the_read_schedule) {
    protocols::Wrer w;
    w.writeTime = 0.25;
    w.readTime = 0.25;
    w.eraseTime = 0.25;
    w.samplingInterval = 0.1;
    const auto plan = SegmentBuilder::build(w);
    instrument.scripts = true;
    instrument.buffer = FakeInstrument::bufferFor(plan, timing.deviceFloor());

    auto driver = core::makeTimingDriver(core::TimingMode::DeviceTSP, timing, "smua");
    core::execute(driver, plan, instrument, stop.get_token(), collector());

    // write phase on the device: no settle, 0.1 s gaps, 3 reads, then hold 0.05 s more
    ASSERT_TRUE(instrument.lastScript.has_value());
    EXPECT_NE(instrument.lastScript->source().find("ivseq_push({ 1, 0, 0.1, 3, 0.05, "),
              std::string::npos);

    ASSERT_EQ(samples.size(), 12u);
    EXPECT_NEAR(samples[0].elapsedTime, 0.0, 1e-9);
    EXPECT_NEAR(samples[2].elapsedTime, 0.2, 1e-9);
    EXPECT_NEAR(samples[3].elapsedTime, 0.25, 1e-9);
    EXPECT_NEAR(samples[11].elapsedTime, 0.95, 1e-9);
  }

  TEST_F(TimingDriverTest, host_paced_raises_short_delays_to_the_floor) {
    const auto plan = oneWayPlan(0.5, 0.001);
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    core::execute(driver, plan, instrument, stop.get_token(), collector());

    ASSERT_EQ(samples.size(), 6u);
    EXPECT_GE(samples.back().elapsedTime, 6 * timing.hostMinDelay * 0.9);
  }

  TEST_F(TimingDriverTest, host_paced_stop_before_start_touches_nothing) {
    stop.request_stop();
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    const auto r = core::execute(driver, oneWayPlan(), instrument, stop.get_token(), collector());

    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(r.samples, 0u);
    EXPECT_TRUE(instrument.applied.empty());
  }

  TEST_F(TimingDriverTest, host_paced_stop_mid_run_ends_within_one_interval) {
    instrument.onApply = [this](double) {
      if (instrument.applied.size() == 3)
        stop.request_stop();
    };
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    const auto r =
        core::execute(driver, oneWayPlan(0.5, 0.05), instrument, stop.get_token(), collector());

    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(instrument.applied.size(), 3u);
    EXPECT_EQ(r.samples, 2u); // the third hold was interrupted before its read
    EXPECT_EQ(samples.size(), 2u);
  }

  TEST_F(TimingDriverTest, host_paced_transport_failure_zeroes_and_reports_last_voltage) {
    instrument.failOnApply = 4;
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    try {
      core::execute(driver, oneWayPlan(), instrument, stop.get_token(), collector());
      FAIL() << "expected InstrumentCommunicationError";
    } catch (const InstrumentCommunicationError& e) {
      EXPECT_EQ(e.fault(), core::Fault::InstrumentCommunicationError);
      EXPECT_DOUBLE_EQ(e.lastAppliedVoltage(), 0.2);
    }
    EXPECT_EQ(instrument.forceZeroCalls.load(), 1);
    EXPECT_EQ(samples.size(), 3u);
  }

  TEST_F(TimingDriverTest, host_paced_read_failure_is_terminal) {
    instrument.failOnRead = true;
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    EXPECT_THROW(core::execute(driver, oneWayPlan(), instrument, stop.get_token(), collector()),
                 InstrumentCommunicationError);
    EXPECT_TRUE(samples.empty());
  }

  TEST_F(TimingDriverTest, driver_is_single_use) {
    const auto plan = oneWayPlan(0.1);
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    core::execute(driver, plan, instrument, stop.get_token(), collector());
    EXPECT_THROW(core::execute(driver, plan, instrument, stop.get_token(), collector()),
                 std::logic_error);
  }

  TEST_F(TimingDriverTest, empty_plan_is_rejected) {
    auto driver = core::makeTimingDriver(core::TimingMode::Host, timing, "smua");
    EXPECT_THROW(core::execute(driver, protocols::SegmentPlan{ {} }, instrument, stop.get_token(),
                               collector()),
                 std::invalid_argument);
  }

  TEST_F(TimingDriverTest, device_paced_runs_one_script_and_maps_the_buffer) {
    instrument.scripts = true;
    const auto plan = wrerPlan();
    instrument.buffer = FakeInstrument::bufferFor(plan, 0.05);

    auto driver = core::makeTimingDriver(core::TimingMode::DeviceTSP, timing, "smua");
    ASSERT_TRUE(std::holds_alternative<core::DevicePacedDriver>(driver));
    const auto r = core::execute(driver, plan, instrument, stop.get_token(), collector());

    ASSERT_TRUE(instrument.lastScript.has_value());
    EXPECT_EQ(instrument.lastScript->expectedPoints, 12u);
    EXPECT_EQ(instrument.fetches, 1u);
    EXPECT_TRUE(instrument.applied.empty()); // the device sources the levels itself

    EXPECT_FALSE(r.cancelled);
    EXPECT_EQ(r.samples, 12u);
    EXPECT_DOUBLE_EQ(r.lastAppliedVoltage, 0.1);
    ASSERT_EQ(samples.size(), 12u);
    EXPECT_EQ(samples[0].phase, Phase::Write);
    EXPECT_EQ(samples[6].phase, Phase::Erase);
    EXPECT_DOUBLE_EQ(samples[6].voltage, -1.5);
    // last read of the final 0.1 s read phase sits 0.05 s into it
    EXPECT_NEAR(samples[11].elapsedTime, 0.55, 1e-9);
  }

  TEST_F(TimingDriverTest, device_paced_stop_after_dispatch_discards_results) {
    instrument.scripts = true;
    instrument.onScript = [this] { stop.request_stop(); };

    auto driver = core::makeTimingDriver(core::TimingMode::DeviceTSP, timing, "smua");
    const auto r = core::execute(driver, wrerPlan(), instrument, stop.get_token(), collector());

    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(instrument.fetches, 0u);
    EXPECT_TRUE(samples.empty());
  }

  TEST_F(TimingDriverTest, device_paced_short_buffer_is_a_communication_error) {
    instrument.scripts = true;
    const auto plan = wrerPlan();
    auto points = FakeInstrument::bufferFor(plan, 0.05);
    points.pop_back();
    instrument.buffer = points;

    auto driver = core::makeTimingDriver(core::TimingMode::DeviceTSP, timing, "smua");
    EXPECT_THROW(core::execute(driver, plan, instrument, stop.get_token(), collector()),
                 InstrumentCommunicationError);
    EXPECT_TRUE(samples.empty());
    EXPECT_EQ(instrument.forceZeroCalls.load(), 1);
  }

  TEST_F(TimingDriverTest, device_paced_script_failure_reports_no_confirmed_voltage) {
    instrument.scripts = true;
    instrument.failScript = true;
    auto driver = core::makeTimingDriver(core::TimingMode::DeviceTSP, timing, "smua");
    try {
      core::execute(driver, wrerPlan(), instrument, stop.get_token(), collector());
      FAIL() << "expected InstrumentCommunicationError";
    } catch (const InstrumentCommunicationError& e) {
      EXPECT_DOUBLE_EQ(e.lastAppliedVoltage(), 0.0);
    }
  }

  TEST_F(TimingDriverTest, device_floor_follows_fast_limit) {
    timing.fastLimit = true;
    EXPECT_DOUBLE_EQ(timing.deviceFloor(), 500e-9);
    timing.fastLimit = false;
    EXPECT_DOUBLE_EQ(timing.deviceFloor(), 0.001);
  }

  TEST(wait_for, returns_false_promptly_when_stopped) {
    std::stop_source src;
    src.request_stop();
    EXPECT_FALSE(core::waitFor(src.get_token(), std::chrono::seconds(10)));
  }

  TEST(wait_for, returns_true_after_full_duration) {
    std::stop_source src;
    EXPECT_TRUE(core::waitFor(src.get_token(), std::chrono::milliseconds(5)));
  }

} // namespace ivseq::test
