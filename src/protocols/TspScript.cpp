/* @file TspScript.cpp
 * @brief plan → TSP (Lua 5.0) program generation
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <sstream>

// ivseq headers
#include "protocols/Command.hpp"
#include "protocols/TspScript.hpp"

using namespace ivseq::protocols;

std::string DeviceScript::source() const {
  std::string out;
  for (const auto& l : lines) {
    out += l;
    out += '\n';
  }
  return out;
}

std::chrono::milliseconds TspScript::timeoutFor(double runtime) {
  const double ms = runtime * 1000.0;
  double t = std::clamp(ms * 8.0, 20'000.0, 300'000.0);
  t = std::max(t, ms * 1.5 + 5'000.0);
  return std::chrono::milliseconds{ static_cast<long long>(t) };
}

DeviceScript TspScript::compile(const SegmentPlan& plan, double minDelay, const std::string& channel) {
  DeviceScript script;
  auto& out = script.lines;

  out.push_back("ivseq_lv = {} ivseq_st = {} ivseq_gp = {} ivseq_nr = {} ivseq_tl = {} ivseq_buf = {}");
  out.push_back("function ivseq_push(t) for j = 1, table.getn(t), 5 do "
                "table.insert(ivseq_lv, t[j]) table.insert(ivseq_st, t[j + 1]) "
                "table.insert(ivseq_gp, t[j + 2]) table.insert(ivseq_nr, t[j + 3]) "
                "table.insert(ivseq_tl, t[j + 4]) end end");

  double runtime = 0.0;
  std::ostringstream row;
  std::size_t inRow = 0;
  for (const auto& step : plan) {
    const auto sched = readSchedule(step, minDelay);
    runtime += sched.duration();
    script.expectedPoints += sched.reads;

    // v, settle, gap, reads, tail
    row << (inRow == 0 ? "ivseq_push({ " : ", ") << formatNumber(step.targetVoltage) << ", "
        << formatNumber(sched.settle) << ", " << formatNumber(sched.gap) << ", " << sched.reads
        << ", " << formatNumber(sched.tail);
    if (++inRow == kStepsPerRow) {
      row << " })";
      out.push_back(row.str());
      row.str({});
      inRow = 0;
    }
  }
  if (inRow > 0) {
    row << " })";
    out.push_back(row.str());
  }

  const auto& c = channel;
  out.push_back("loadscript ivseq_run");
  out.push_back(c + ".source.output = " + c + ".OUTPUT_ON");
  out.push_back("timer.reset()");
  out.push_back("for k = 1, table.getn(ivseq_lv) do");
  out.push_back("  " + c + ".source.levelv = ivseq_lv[k]");
  out.push_back("  for r = 1, ivseq_nr[k] do");
  out.push_back("    local d = ivseq_gp[k]");
  out.push_back("    if r == 1 then d = ivseq_st[k] end");
  out.push_back("    if d > 0 then delay(d) end");
  out.push_back("    local i = " + c + ".measure.i()");
  out.push_back("    table.insert(ivseq_buf, string.format('%.9g,%.12g,%.12e', "
                "timer.measure.t(), ivseq_lv[k], i))");
  out.push_back("  end");
  out.push_back("  if ivseq_tl[k] > 0 then delay(ivseq_tl[k]) end");
  out.push_back("end");
  out.push_back(std::string("print('") + kDoneMarker + "')");
  out.push_back("endscript");
  out.push_back("ivseq_run()");

  script.timeout = timeoutFor(runtime);
  return script;
}

std::string TspScript::fetchCommand() {
  return std::string("for k = 1, table.getn(ivseq_buf) do print(ivseq_buf[k]) end print('") +
         kEndMarker + "')";
}
