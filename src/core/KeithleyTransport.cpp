/* @file KeithleyTransport.cpp
 * @brief SCPI / TSP conversation with a Keithley SMU over a serial line
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <regex>
#include <string>

// ivseq headers
#include "core/Errors.hpp"
#include "core/KeithleyTransport.hpp"

using namespace ivseq::core;
using ivseq::protocols::BufferPoint;
using ivseq::protocols::Command;
using ivseq::protocols::CommandSet;
using ivseq::protocols::DeviceScript;
using ivseq::protocols::Dialect;
using ivseq::protocols::Response;
using ivseq::protocols::TspScript;

namespace {
  std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
  }
} // namespace

KeithleyTransport::KeithleyTransport(std::unique_ptr<io::SerialChannel> channel,
                                     std::shared_ptr<ErrorMonitor> errorMonitor,
                                     InstrumentSettings settings)
    : channel_(std::move(channel)), errorMonitor_(std::move(errorMonitor)),
      settings_(std::move(settings)), commands_(Dialect::Scpi, settings_.channel) {
  if (!channel_)
    throw std::invalid_argument("[KeithleyTransport] serial channel is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[KeithleyTransport] error monitor is nullptr");
}

KeithleyTransport::~KeithleyTransport() {
  try {
    disconnect();
  } catch (const TransportError& e) {
    std::cerr << "[KeithleyTransport] shutdown: " << e.what() << '\n';
  }
}

Dialect KeithleyTransport::dialectFor(const std::string& idn) {
  static const std::regex k26xx{ R"((^|[^0-9])26[0-9]{2}[AB]?([^0-9]|$))" };
  return std::regex_search(upper(idn), k26xx) ? Dialect::Tsp : Dialect::Scpi;
}

std::string KeithleyTransport::connect() {
  if (connected_)
    return idn_;

  if (!channel_->open(settings_.device, io::toSpeed(settings_.baud)))
    fail("[KeithleyTransport] serial device: " + settings_.device + " open failed");

  idn_ = queryIdentity();
  const auto id = upper(idn_);
  if (id.find("KEITHLEY") == std::string::npos && id.find("TEKTRONIX") == std::string::npos) {
    channel_->close();
    fail("[KeithleyTransport] connected device does not look like a supported Keithley SMU: " + idn_);
  }

  commands_ = CommandSet(dialectFor(idn_), settings_.channel);
  connected_ = true;
  outputEnabled_ = false;

  try {
    for (const auto& cmd : commands_.defaults())
      sendCommand(cmd);
    checkInstrumentErrors();
  } catch (const TransportError&) {
    connected_ = false;
    channel_->close();
    throw;
  }

  std::cerr << "[KeithleyTransport] connected to " << idn_ << " on " << settings_.device
            << " (" << protocols::toString(commands_.dialect()) << ")\n";
  return idn_;
}

void KeithleyTransport::disconnect() {
  if (!connected_)
    return;
  try {
    forceZero();
  } catch (const TransportError& e) {
    std::cerr << "[KeithleyTransport] failed to zero output during close: " << e.what() << '\n';
  }
  channel_->close();
  connected_ = false;
}

void KeithleyTransport::applyVoltage(double volts) {
  requireConnection();
  if (!std::isfinite(volts))
    fail("[KeithleyTransport] voltage must be a finite number");
  if (!outputEnabled_)
    enableOutput();
  sendCommand(commands_.setLevel(volts));
  checkInstrumentErrors();
}

double KeithleyTransport::readCurrent() {
  requireConnection();
  const auto r = query(commands_.measureCurrent());
  const auto value = r.firstNumber();
  if (!value)
    fail("[KeithleyTransport] unexpected current response: " + r.text);
  if (Response::isOverflow(*value))
    fail("[KeithleyTransport] current reading is overrange/compliance; reduce voltage or raise "
         "compliance/range");
  return *value;
}

void KeithleyTransport::setCompliance(double microAmps) {
  requireConnection();
  if (!std::isfinite(microAmps) || microAmps <= 0.0)
    fail("[KeithleyTransport] compliance must be a positive finite number");
  sendCommand(commands_.setCurrentLimit(microAmps * 1e-6));
  checkInstrumentErrors();
}

bool KeithleyTransport::supportsScripts() const {
  return connected_ && commands_.dialect() == Dialect::Tsp;
}

void KeithleyTransport::runScript(const DeviceScript& script) {
  requireConnection();
  if (commands_.dialect() != Dialect::Tsp)
    fail("[KeithleyTransport] device scripts need a TSP (26xx) instrument");

  outputEnabled_ = true; // the script switches the output on itself
  for (const auto& line : script.lines)
    sendCommand(Command{ line });

  const auto deadline = std::chrono::steady_clock::now() + script.timeout;
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      fail("[KeithleyTransport] device script did not finish within " +
           std::to_string(script.timeout.count()) + " ms");
    const auto r = awaitResponse(left);
    if (r.text == TspScript::kDoneMarker)
      break;
    std::cerr << "[KeithleyTransport] script output: " << r.text << '\n';
  }
  checkInstrumentErrors();
}

std::vector<BufferPoint> KeithleyTransport::fetchBuffer() {
  requireConnection();
  sendCommand(Command{ TspScript::fetchCommand(), true });

  std::vector<BufferPoint> out;
  for (;;) {
    const auto r = awaitResponse(settings_.timeout);
    if (r.text == TspScript::kEndMarker)
      break;
    const auto p = r.asBufferPoint();
    if (!p)
      fail("[KeithleyTransport] unparseable buffer line: " + r.text);
    out.push_back(*p);
  }
  return out;
}

void KeithleyTransport::forceZero() {
  if (!connected_)
    return;

  // try both steps even if the first one fails
  std::string firstError;
  for (const auto& cmd : { commands_.setLevel(0.0), commands_.outputOff() }) {
    if (!channel_->writeLine(cmd.toWire(channel_->terminator())) && firstError.empty())
      firstError = "[KeithleyTransport] force zero failed writing: " + cmd.payload;
  }
  outputEnabled_ = false;
  if (!firstError.empty())
    fail(firstError);
}

void KeithleyTransport::sendCommand(const Command& cmd) {
  const auto wire = cmd.toWire(channel_->terminator());
  if (!channel_->writeLine(wire))
    fail("[KeithleyTransport] failed to write to " + settings_.device + ": " + cmd.payload);
}

Response KeithleyTransport::awaitResponse(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      break;
    auto line = channel_->readLine(left);
    if (!line)
      break;
    if (auto r = Response::fromWire(*line))
      return *r; // blank lines are skipped
  }
  fail("[KeithleyTransport] no reply from " + settings_.device + " within " +
       std::to_string(timeout.count()) + " ms");
}

Response KeithleyTransport::query(const Command& cmd) {
  sendCommand(cmd);
  return awaitResponse(settings_.timeout);
}

std::optional<Response> KeithleyTransport::tryQuery(const Command& cmd) {
  if (!channel_->writeLine(cmd.toWire(channel_->terminator())))
    return std::nullopt;
  auto line = channel_->readLine(settings_.timeout);
  if (!line)
    return std::nullopt;
  return Response::fromWire(*line);
}

std::string KeithleyTransport::queryIdentity() {
  if (auto r = tryQuery(CommandSet::identify()))
    return r->text;
  // some 26xx firmware ignores *IDN? in TSP mode
  if (auto r = tryQuery(CommandSet::tspModel()))
    return "KEITHLEY," + r->text + ",TSP";
  return "Unknown instrument";
}

void KeithleyTransport::enableOutput() {
  sendCommand(commands_.outputOn());
  outputEnabled_ = true;
  checkInstrumentErrors();
}

void KeithleyTransport::checkInstrumentErrors() {
  if (commands_.dialect() == Dialect::Scpi) {
    const auto r = query(commands_.errorQuery());
    if (!r.isNoError())
      fail("[KeithleyTransport] instrument error: " + r.text);
    return;
  }

  const auto countReply = query(commands_.errorQuery());
  const auto count = countReply.firstNumber();
  if (!count)
    fail("[KeithleyTransport] unexpected error-queue reply: " + countReply.text);

  std::string errors;
  for (int k = 0; k < static_cast<int>(std::fabs(*count)); ++k) {
    const auto r = query(CommandSet::tspNextError());
    const auto bar = r.text.find('|');
    const auto code = Response{ r.text.substr(0, bar) }.firstNumber().value_or(0.0);
    if (code == 0.0)
      continue;
    std::string msg = bar == std::string::npos ? r.text : r.text.substr(bar + 1);
    msg = msg.substr(0, msg.find('|'));
    if (!errors.empty())
      errors += "; ";
    errors += std::to_string(static_cast<long long>(code)) + ": " + msg;
  }
  if (!errors.empty())
    fail("[KeithleyTransport] instrument error(s): " + errors);
}

void KeithleyTransport::requireConnection() const {
  if (!connected_)
    throw TransportError("[KeithleyTransport] not connected");
}

void KeithleyTransport::fail(const std::string& msg) {
  errorMonitor_->notifyFailure(msg);
  throw TransportError(msg);
}
