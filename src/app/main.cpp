/* @file main.cpp
 * @brief ivseq-run: command-line front end for one measurement run
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Linux headers
#include <csignal>
#include <pthread.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ivseq headers
#include "core/ConfigLoader.hpp"
#include "core/EngineConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/KeithleyTransport.hpp"
#include "core/RunRecorder.hpp"
#include "core/SafetyInterlock.hpp"
#include "core/SampleChannel.hpp"
#include "core/SequenceController.hpp"
#include "io/CsvSampleLogger.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/ProtocolJson.hpp"

using namespace ivseq;

namespace {

  struct Options {
    std::string configPath;
    std::string protocolPath;
    core::TimingMode timing{ core::TimingMode::Host };
    std::optional<double> complianceUA;
    std::string output;
    std::optional<core::FileDecision> ifExists;
    bool assumeYes{ false };
  };

  void usage() {
    std::cerr << "usage: ivseq-run --config <engine.json> --protocol <protocol.json>\n"
                 "                 [--timing host|device] [--compliance-ua <uA>]\n"
                 "                 [--output <file.csv>] [--append | --overwrite] [--yes]\n";
  }

  std::optional<Options> parseArgs(int argc, char** argv) {
    Options o;
    for (int k = 1; k < argc; ++k) {
      const std::string arg = argv[k];
      auto next = [&]() -> std::optional<std::string> {
        if (k + 1 >= argc)
          return std::nullopt;
        return std::string(argv[++k]);
      };

      if (arg == "--yes" || arg == "-y") {
        o.assumeYes = true;
      } else if (arg == "--append") {
        o.ifExists = core::FileDecision::Append;
      } else if (arg == "--overwrite") {
        o.ifExists = core::FileDecision::Overwrite;
      } else if (arg == "--help" || arg == "-h") {
        return std::nullopt;
      } else if (auto v = next()) {
        if (arg == "--config")
          o.configPath = *v;
        else if (arg == "--protocol")
          o.protocolPath = *v;
        else if (arg == "--output")
          o.output = *v;
        else if (arg == "--compliance-ua")
          o.complianceUA = std::stod(*v);
        else if (arg == "--timing" && (*v == "host" || *v == "device"))
          o.timing = *v == "device" ? core::TimingMode::DeviceTSP : core::TimingMode::Host;
        else {
          std::cerr << "[ivseq-run] bad option: " << arg << ' ' << *v << '\n';
          return std::nullopt;
        }
      } else {
        std::cerr << "[ivseq-run] missing value for " << arg << '\n';
        return std::nullopt;
      }
    }
    if (o.configPath.empty() || o.protocolPath.empty())
      return std::nullopt;
    return o;
  }

  bool askYesNo(const std::string& prompt) {
    std::cout << prompt << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
      return false;
    return answer == "y" || answer == "Y" || answer == "yes";
  }

  core::FileDecision askFileDecision(const std::string& path) {
    std::cout << path << " already has data. [a]ppend, [o]verwrite or [c]ancel? " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
      return core::FileDecision::Abort;
    if (answer == "a" || answer == "append")
      return core::FileDecision::Append;
    if (answer == "o" || answer == "overwrite")
      return core::FileDecision::Overwrite;
    return core::FileDecision::Abort;
  }

  int exitCodeFor(const core::RunStatus& s) {
    switch (s.outcome) {
    case core::RunOutcome::Completed:
      return EXIT_SUCCESS;
    case core::RunOutcome::Aborted:
      return 130;
    default:
      return EXIT_FAILURE;
    }
  }

  /// Forwards SIGINT/SIGTERM to requestStop(); SIGUSR1 ends the watcher.
  class StopSignalWatcher {
  public:
    explicit StopSignalWatcher(core::SequenceController& controller) {
      sigemptyset(&set_);
      sigaddset(&set_, SIGINT);
      sigaddset(&set_, SIGTERM);
      sigaddset(&set_, SIGUSR1);
      pthread_sigmask(SIG_BLOCK, &set_, nullptr);
      thread_ = std::thread([this, &controller] {
        for (;;) {
          int sig = 0;
          if (sigwait(&set_, &sig) != 0 || sig == SIGUSR1)
            return;
          std::cerr << "\n[ivseq-run] stop requested\n";
          controller.requestStop();
        }
      });
    }
    ~StopSignalWatcher() {
      pthread_kill(thread_.native_handle(), SIGUSR1);
      thread_.join();
    }

    StopSignalWatcher(const StopSignalWatcher&) = delete;
    StopSignalWatcher& operator=(const StopSignalWatcher&) = delete;

  private:
    sigset_t set_{};
    std::thread thread_;
  };

  int run(const Options& opt) {
    const auto cfg = core::ConfigLoader(opt.configPath).loadEngineConfig();
    const auto protocol = protocols::protocolFromJson(core::ConfigLoader(opt.protocolPath).load());

    auto errMonitor = std::make_shared<core::ErrorMonitor>();
    errMonitor->registerEscalation(
        [](const std::string& msg) { std::cerr << "[ivseq-run] FAULT: " << msg << '\n'; });

    auto serial = std::make_unique<io::SerialChannel>(cfg.instrument.terminator);
    core::KeithleyTransport transport(std::move(serial), errMonitor, cfg.instrument);
    std::cout << "Connected: " << transport.connect() << '\n';

    core::SafetyInterlock interlock(cfg.safety);
    core::SampleChannel channel(errMonitor);

    const auto outPath =
        opt.output.empty()
            ? (std::filesystem::path(cfg.logging.outputDir) /
               io::CsvSampleLogger::defaultFileName(cfg.logging.metadata, std::time(nullptr)))
                  .string()
            : opt.output;
    auto decision = io::CsvSampleLogger::decide(outPath, opt.ifExists.value_or(core::FileDecision::Abort));
    if (decision == core::FileDecision::Abort)
      decision = opt.assumeYes ? core::FileDecision::Append : askFileDecision(outPath);

    auto csv = std::make_shared<io::CsvSampleLogger>(outPath, cfg.logging.metadata);
    auto recorder = std::make_shared<core::RunRecorder>();
    channel.subscribe(csv);
    channel.subscribe(recorder);

    core::SequenceController controller(transport, interlock, channel, errMonitor, cfg.timing,
                                        cfg.instrument.channel);
    std::size_t lastDecile = 0;
    controller.onProgress([&lastDecile](std::size_t done, std::size_t total) {
      const auto decile = total ? done * 10 / total : 10;
      if (decile != lastDecile) {
        lastDecile = decile;
        std::cerr << "[ivseq-run] " << done << '/' << total << " samples\n";
      }
    });

    StopSignalWatcher watcher(controller);

    if (opt.complianceUA)
      controller.applyCompliance(*opt.complianceUA);

    auto armed = controller.requestRun({ protocol, opt.timing, decision });
    if (armed == core::ArmOutcome::ConfirmationRequired) {
      const bool yes = opt.assumeYes || askYesNo("Protocol exceeds the high-voltage threshold. Proceed?");
      if (yes) {
        armed = controller.confirm();
      } else {
        controller.decline();
        armed = core::ArmOutcome::Declined;
      }
    }
    if (armed == core::ArmOutcome::Declined) {
      std::cout << "Run cancelled before start.\n";
      return EXIT_FAILURE;
    }

    const auto status = controller.waitForCompletion();
    if (!status)
      return EXIT_FAILURE;

    std::cout << core::toString(status->outcome) << ": " << recorder->samples().size()
              << " samples, last applied " << status->lastAppliedVoltage << " V, data in " << outPath
              << '\n';
    if (!status->reason.empty())
      std::cout << "Reason: " << status->reason << '\n';
    return exitCodeFor(*status);
  }

} // namespace

int main(int argc, char** argv) {
  std::optional<Options> opt;
  try {
    opt = parseArgs(argc, argv);
  } catch (const std::logic_error& e) {
    std::cerr << "[ivseq-run] bad number: " << e.what() << '\n';
  }
  if (!opt) {
    usage();
    return 2;
  }

  try {
    return run(*opt);
  } catch (const core::SequenceError& e) {
    std::cerr << "[ivseq-run] " << core::toString(e.fault()) << ": " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "[ivseq-run] " << e.what() << '\n';
  }
  return EXIT_FAILURE;
}
