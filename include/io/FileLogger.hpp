#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered text writer for run data files.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace ivseq {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Sized for run logs of 10 kB – 10 MB.
 *  * Writes go to disk through `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      enum class Mode { Truncate, Append };

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path, Mode mode = Mode::Truncate);

      /** Queues one line (caller includes trailing '\n'). @returns false after a write error. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      /// Bytes already in the file when it was opened (0 for Truncate).
      long initialSize() const { return initialSize_; }
      const std::string& path() const { return path_; }

      static constexpr std::size_t kChunk = 4096;

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept
          : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)),
            path_(std::move(other.path_)), initialSize_(other.initialSize_) {}
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
      std::string path_;
      long initialSize_{ 0 };
    };

  } // namespace io
} // namespace ivseq
