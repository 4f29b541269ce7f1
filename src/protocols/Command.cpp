/* @file Command.cpp
 * @brief SCPI / TSP command strings
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <utility>

// ivseq headers
#include "protocols/Command.hpp"

using namespace ivseq::protocols;

std::string ivseq::protocols::formatNumber(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.12g", v);
  return buf;
}

CommandSet::CommandSet(Dialect dialect, std::string channel)
    : dialect_{ dialect }, channel_{ std::move(channel) } {}

std::vector<Command> CommandSet::defaults() const {
  if (dialect_ == Dialect::Tsp) {
    const auto& c = channel_;
    return {
      { c + ".reset()" },
      { c + ".source.func = " + c + ".OUTPUT_DCVOLTS" },
      { c + ".source.levelv = 0" },
      { c + ".source.limiti = 1e-6" },
      { c + ".measure.autorangei = " + c + ".AUTORANGE_ON" },
      { c + ".source.output = " + c + ".OUTPUT_OFF" },
    };
  }
  return {
    { "*CLS" }, { "OUTP OFF" }, { "SOUR:VOLT 0" }, { "SENS:CURR:RANG:AUTO ON" }, { "SENS:CURR:PROT 1E-6" },
  };
}

Command CommandSet::setLevel(double volts) const {
  if (dialect_ == Dialect::Tsp)
    return { channel_ + ".source.levelv = " + formatNumber(volts) };
  return { "SOUR:VOLT " + formatNumber(volts) };
}

Command CommandSet::outputOn() const {
  if (dialect_ == Dialect::Tsp)
    return { channel_ + ".source.output = " + channel_ + ".OUTPUT_ON" };
  return { "OUTP ON" };
}

Command CommandSet::outputOff() const {
  if (dialect_ == Dialect::Tsp)
    return { channel_ + ".source.output = " + channel_ + ".OUTPUT_OFF" };
  return { "OUTP OFF" };
}

Command CommandSet::setCurrentLimit(double amps) const {
  if (dialect_ == Dialect::Tsp)
    return { channel_ + ".source.limiti = " + formatNumber(amps) };
  return { "SENS:CURR:PROT " + formatNumber(amps) };
}

Command CommandSet::measureCurrent() const {
  if (dialect_ == Dialect::Tsp)
    return { "print(" + channel_ + ".measure.i())", true };
  return { "MEAS:CURR?", true };
}

Command CommandSet::errorQuery() const {
  if (dialect_ == Dialect::Tsp)
    return { "print(errorqueue.count)", true };
  return { "SYST:ERR?", true };
}

Command CommandSet::tspNextError() {
  return { "code, msg, sev, node = errorqueue.next(); "
           "print(code .. '|' .. msg .. '|' .. sev .. '|' .. node)",
           true };
}
