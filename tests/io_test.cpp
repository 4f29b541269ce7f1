#include "io/CsvSampleLogger.hpp"
#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <pty.h> // openpty
#include <sstream>
#include <unistd.h>

using namespace ivseq::io;
using ivseq::core::FileDecision;
using ivseq::core::RunInfo;
using ivseq::core::RunMetadata;
using ivseq::core::RunStatus;
using ivseq::core::Sample;

namespace {

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::size_t lineCount(const std::string& text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
  }

  /// Unique path under the temp dir, removed on scope exit.
  struct TempPath {
    TempPath() {
      static int n = 0;
      path = (std::filesystem::temp_directory_path() /
              ("ivseq_io_" + std::to_string(::getpid()) + "_" + std::to_string(n++) + ".csv"))
                 .string();
      std::filesystem::remove(path);
    }
    ~TempPath() { std::filesystem::remove(path); }
    std::string path;
  };

  void runOnce(CsvSampleLogger& logger, FileDecision decision, std::size_t samples) {
    RunInfo info;
    info.fileDecision = decision;
    logger.onRunStarted(info);
    for (std::size_t i = 0; i < samples; ++i) {
      Sample s;
      s.index = i;
      s.elapsedTime = 0.5 * static_cast<double>(i);
      s.voltage = 0.1 * static_cast<double>(i);
      s.current = 1e-9;
      logger.onSample(s);
    }
    logger.onRunCompleted(RunStatus{});
  }

} // namespace

TEST(serial_channel, opens_writes_closes) {
  // create a false ttyUSB0 "device"
  int masterFd, slaveFd;
  char slaveName[64];
  ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

  // check that we can open a serial channel to slave dev
  SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, B115200));

  // Writer on master side
  const char* msg = "PING\r\n";
  ASSERT_EQ(write(masterFd, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "PING");

  chan.writeLine("PONG");
  char buf[16] = { 0 };
  ASSERT_GT(read(masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "PONG\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
  ::close(masterFd);
  ::close(slaveFd);
}

TEST(serial_channel, keithley_terminator_and_timeout) {
  int masterFd, slaveFd;
  char slaveName[64];
  ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

  SerialChannel chan("\n");
  ASSERT_TRUE(chan.open(slaveName, toSpeed(115200)));
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }).has_value());

  // two replies in one burst come out as two lines
  const char* burst = "1.0E-9\n0,\"No error\"\n";
  ASSERT_EQ(write(masterFd, burst, strlen(burst)), static_cast<ssize_t>(strlen(burst)));
  EXPECT_EQ(chan.readLine(std::chrono::milliseconds{ 100 }).value_or(""), "1.0E-9");
  EXPECT_EQ(chan.readLine(std::chrono::milliseconds{ 100 }).value_or(""), "0,\"No error\"");

  // moved-from channel no longer owns the fd
  SerialChannel moved(std::move(chan));
  EXPECT_TRUE(moved.isOpen());
  EXPECT_FALSE(chan.isOpen());

  ::close(masterFd);
  ::close(slaveFd);
}

TEST(serial_channel, open_fails_on_missing_device) {
  SerialChannel chan;
  EXPECT_FALSE(chan.open("/dev/ivseq-does-not-exist", B115200));
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, baud_table) {
  EXPECT_EQ(toSpeed(9600), B9600);
  EXPECT_EQ(toSpeed(115200), B115200);
  EXPECT_EQ(toSpeed(12345), B0);
}

TEST(file_logger, buffers_until_flush_and_appends) {
  TempPath tmp;
  {
    FileLogger log;
    ASSERT_TRUE(log.open(tmp.path));
    EXPECT_TRUE(log.write("a,b\n"));
    EXPECT_EQ(slurp(tmp.path), ""); // still buffered
    EXPECT_TRUE(log.flush());
    EXPECT_EQ(slurp(tmp.path), "a,b\n");
  }
  {
    FileLogger log;
    ASSERT_TRUE(log.open(tmp.path, FileLogger::Mode::Append));
    EXPECT_EQ(log.initialSize(), 4);
    log.write("c,d\n");
  } // destructor flushes
  EXPECT_EQ(slurp(tmp.path), "a,b\nc,d\n");
}

TEST(file_logger, large_writes_spill_in_chunks) {
  TempPath tmp;
  FileLogger log;
  ASSERT_TRUE(log.open(tmp.path));
  const std::string row(100, 'x');
  for (int i = 0; i < 50; ++i)
    log.write(row + "\n");
  EXPECT_GE(std::filesystem::file_size(tmp.path), FileLogger::kChunk);
}

TEST(file_logger, unwritable_path_fails_cleanly) {
  FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent-dir/run.csv"));
  EXPECT_FALSE(log.write("x\n"));
  EXPECT_FALSE(log.isOpen());
}

TEST(csv_sample_logger, overwrite_writes_header_and_rows) {
  TempPath tmp;
  CsvSampleLogger logger(tmp.path, RunMetadata{ "wafer, 7", "jk", "post \"anneal\"" });
  runOnce(logger, FileDecision::Overwrite, 3);

  const auto text = slurp(tmp.path);
  EXPECT_EQ(text.rfind(CsvSampleLogger::header(), 0), 0u);
  EXPECT_EQ(lineCount(text), 4u);
  EXPECT_EQ(logger.rowsWritten(), 3u);
  EXPECT_NE(text.find("\n2,1.000000,1,sweep,0.2,1.000000e-09,"), std::string::npos);
  EXPECT_NE(text.find(",\"wafer, 7\",jk,\"post \"\"anneal\"\"\"\n"), std::string::npos);

  // a second overwrite starts from scratch
  runOnce(logger, FileDecision::Overwrite, 1);
  EXPECT_EQ(lineCount(slurp(tmp.path)), 2u);
}

TEST(csv_sample_logger, append_keeps_a_single_header) {
  TempPath tmp;
  CsvSampleLogger logger(tmp.path, RunMetadata{});
  runOnce(logger, FileDecision::Append, 2); // file missing: header written
  runOnce(logger, FileDecision::Append, 2);

  const auto text = slurp(tmp.path);
  EXPECT_EQ(lineCount(text), 5u);
  EXPECT_EQ(text.find("index,elapsed_s"), 0u);
  EXPECT_EQ(text.find("index,elapsed_s", 1), std::string::npos);
}

TEST(csv_sample_logger, abort_decision_never_opens_the_file) {
  TempPath tmp;
  CsvSampleLogger logger(tmp.path, RunMetadata{});
  RunInfo info;
  info.fileDecision = FileDecision::Abort;
  EXPECT_THROW(logger.onRunStarted(info), std::logic_error);
  EXPECT_FALSE(std::filesystem::exists(tmp.path));
}

TEST(csv_sample_logger, decision_depends_on_existing_data) {
  TempPath tmp;
  EXPECT_EQ(CsvSampleLogger::decide(tmp.path, FileDecision::Abort), FileDecision::Overwrite);
  std::ofstream(tmp.path) << "";
  EXPECT_EQ(CsvSampleLogger::decide(tmp.path, FileDecision::Abort), FileDecision::Overwrite);
  std::ofstream(tmp.path) << "index\n";
  EXPECT_EQ(CsvSampleLogger::decide(tmp.path, FileDecision::Append), FileDecision::Append);
  EXPECT_EQ(CsvSampleLogger::decide(tmp.path, FileDecision::Abort), FileDecision::Abort);
}

TEST(csv_sample_logger, default_file_name_is_slugged) {
  EXPECT_EQ(CsvSampleLogger::slug("  Wafer #7 / die B  "), "Wafer-7-die-B");
  EXPECT_EQ(CsvSampleLogger::slug("A. Lee"), "A-Lee");
  EXPECT_EQ(CsvSampleLogger::slug("__run 3!!"), "run-3");
  EXPECT_EQ(CsvSampleLogger::slug(" %% "), "");
  EXPECT_EQ(CsvSampleLogger::slug(""), "");
  EXPECT_EQ(CsvSampleLogger::slug(std::string(60, 'a')).size(), 40u);

  const auto name = CsvSampleLogger::defaultFileName(RunMetadata{ "NiO film", "A. Lee", "" }, 0);
  EXPECT_EQ(name.rfind("iv_NiO-film_A-Lee_", 0), 0u);
  EXPECT_EQ(name.size(), std::string("iv_NiO-film_A-Lee_YYYYmmdd_HHMMSS.csv").size());
}

TEST(csv_sample_logger, default_file_name_skips_empty_parts) {
  const auto anonymous = CsvSampleLogger::defaultFileName(RunMetadata{ "", "  ", "" }, 0);
  EXPECT_EQ(anonymous.rfind("iv_", 0), 0u);
  EXPECT_EQ(anonymous.size(), std::string("iv_YYYYmmdd_HHMMSS.csv").size());

  const auto operatorOnly = CsvSampleLogger::defaultFileName(RunMetadata{ "???", "kim", "" }, 0);
  EXPECT_EQ(operatorOnly.rfind("iv_kim_", 0), 0u);
  EXPECT_EQ(operatorOnly.size(), std::string("iv_kim_YYYYmmdd_HHMMSS.csv").size());
}
