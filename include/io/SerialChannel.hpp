#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace ivseq {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor
 *        (USB-serial / GPIB-USB adapter in front of the SMU).
 *
 *  * Frames I/O as ASCII lines; the terminator is per channel
 *    (`\n` for Keithley, `\r\n` default).
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      explicit SerialChannel(std::string terminator = "\r\n") : terminator_{ std::move(terminator) } {}
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      const std::string& terminator() const { return terminator_; }

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string terminator_;  ///< line framing
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };

    /// Maps a numeric baud rate (9600, 115200, ...) to its termios constant; B0 if unsupported.
    speed_t toSpeed(int baud);

  } // namespace io
} // namespace ivseq
