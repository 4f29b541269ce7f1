#pragma once
/** @file  CsvSampleLogger.hpp
 *  @brief Logging collaborator: one CSV row per sample, written off the acquisition thread.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <ctime>
#include <string>

#include "core/EngineConfig.hpp"
#include "core/SampleChannel.hpp"
#include "io/FileLogger.hpp"

namespace ivseq {
  namespace io {

    /**
 * @class CsvSampleLogger
 * @brief SampleSink that streams samples into a CSV data file.
 *
 *  * Overwrite truncates and writes the header.
 *  * Append writes the header only if the file is missing or empty.
 *  * Every row repeats the wall-clock timestamp and run metadata so appended
 *    runs stay self-describing.
 *  * Disk errors are thrown from the sink callbacks; the SampleChannel
 *    reports them to the ErrorMonitor.
 */
    class CsvSampleLogger : public core::SampleSink {
    public:
      CsvSampleLogger(std::string path, core::RunMetadata metadata);

      /// What the operator must be asked before arming: Overwrite if the file is
      /// missing or empty, otherwise \p ifExists.
      static core::FileDecision decide(const std::string& path, core::FileDecision ifExists);

      /// `iv_<sample>_<operator>_<YYYYmmdd_HHMMSS>.csv`; empty parts are left out.
      static std::string defaultFileName(const core::RunMetadata& metadata, std::time_t when);
      /// Trims, maps each run of characters outside [A-Za-z0-9_-] to '-', strips
      /// leading/trailing '-' and '_', then caps at 40 chars. May return "".
      static std::string slug(const std::string& text);

      static const char* header();

      void onRunStarted(const core::RunInfo& info) override;
      void onSample(const core::Sample& sample) override;
      void onRunCompleted(const core::RunStatus& status) override;

      const std::string& path() const { return path_; }
      std::size_t rowsWritten() const { return rows_; }

    private:
      std::string formatRow(const core::Sample& s) const;

      std::string path_;
      core::RunMetadata metadata_;
      FileLogger file_;
      std::string timestamp_; ///< run start, ISO-8601 local time
      std::size_t rows_{ 0 };
    };

  } // namespace io
} // namespace ivseq
