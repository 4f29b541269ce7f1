/* @file Response.cpp
 * @brief reply-line parsing (numbers, buffer points, error queue)
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdlib>
#include <regex>

// ivseq headers
#include "protocols/Response.hpp"

using namespace ivseq::protocols;

namespace {
  const char* kWhitespace = " \t\r\n";

  std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos)
      return {};
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
  }

  std::optional<double> parseWhole(const std::string& field) {
    const std::string t = trim(field);
    if (t.empty())
      return std::nullopt;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || !std::isfinite(v))
      return std::nullopt;
    return v;
  }
} // namespace

std::optional<Response> Response::fromWire(const std::string& line) {
  std::string t = trim(line);
  if (t.empty())
    return std::nullopt;
  return Response{ std::move(t) };
}

std::optional<double> Response::firstNumber() const {
  static const std::regex kNumber{ R"([+-]?\d+(?:\.\d+)?(?:[Ee][+-]?\d+)?)" };
  const std::string first = text.substr(0, text.find(','));
  std::smatch m;
  if (!std::regex_search(first, m, kNumber))
    return std::nullopt;
  return std::strtod(m.str(0).c_str(), nullptr);
}

std::optional<BufferPoint> Response::asBufferPoint() const {
  const auto c1 = text.find(',');
  if (c1 == std::string::npos)
    return std::nullopt;
  const auto c2 = text.find(',', c1 + 1);
  if (c2 == std::string::npos || text.find(',', c2 + 1) != std::string::npos)
    return std::nullopt;

  auto t = parseWhole(text.substr(0, c1));
  auto v = parseWhole(text.substr(c1 + 1, c2 - c1 - 1));
  auto i = parseWhole(text.substr(c2 + 1));
  if (!t || !v || !i)
    return std::nullopt;
  return BufferPoint{ *t, *v, *i };
}

bool Response::isNoError() const { return text.rfind("0", 0) == 0 || text.rfind("+0", 0) == 0; }

bool Response::isOverflow(double value) { return std::fabs(value) >= 9.9e37; }
