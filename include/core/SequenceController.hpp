#pragma once

/** @file  SequenceController.hpp
 *  @brief Run lifecycle state machine: Idle → Armed → Running → Finalizing → Idle.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "core/RunTypes.hpp"
#include "core/SafetyInterlock.hpp"
#include "protocols/Protocol.hpp"
#include "protocols/SegmentPlan.hpp"

namespace ivseq {
  namespace core {

    class ErrorMonitor;
    class InstrumentTransport;
    class SampleChannel;

    enum class ControllerState { Idle, Armed, Running, Finalizing };

    inline const char* toString(ControllerState s) {
      switch (s) {
      case ControllerState::Idle:
        return "Idle";
      case ControllerState::Armed:
        return "Armed";
      case ControllerState::Running:
        return "Running";
      case ControllerState::Finalizing:
        return "Finalizing";
      default:
        return "Unknown";
      }
    }

    struct RunRequest {
      protocols::Protocol protocol;
      TimingMode timing{ TimingMode::Host };
      FileDecision fileDecision{ FileDecision::Overwrite }; ///< decided by the logging side up front
    };

    enum class ArmOutcome {
      Started,              ///< Running; samples are streaming
      ConfirmationRequired, ///< parked in Armed until confirm()/decline()
      Declined,             ///< FileDecision::Abort or operator said no; back to Idle
    };

    class SequenceController {

    public:
      SequenceController(InstrumentTransport& instrument, SafetyInterlock& interlock,
                         SampleChannel& channel, std::shared_ptr<ErrorMonitor> errMonitor,
                         TimingSettings timing, std::string tspChannel = "smua");
      ~SequenceController(); ///< stop + join any active run

      SequenceController(const SequenceController&) = delete;
      SequenceController& operator=(const SequenceController&) = delete;

      // ---- run lifecycle ----------------------------------------------------
      /// Throws SequenceError: RunAlreadyInProgress, ComplianceNotSet, VoltageExceedsLimit,
      /// TimingModeUnavailable, InvalidProtocolParameters.
      ArmOutcome requestRun(RunRequest request);
      ArmOutcome confirm(); ///< operator accepted the high-voltage warning
      void decline();       ///< operator refused; Armed → Idle
      void requestStop();   ///< cooperative cancel (any thread); no-op when Idle

      /// Blocks until the active run (if any) is back in Idle; returns its final status.
      std::optional<RunStatus> waitForCompletion();

      ControllerState state() const;
      std::optional<RunStatus> lastStatus() const;
      std::optional<RunInfo> activeRun() const;

      // ---- manual control (Idle only) --------------------------------------
      void applyCompliance(double microAmps);
      /// @returns Ok when applied, ConfirmationRequired when not applied pending operator consent.
      Verdict applyVoltage(double volts, bool confirmed = false);
      double measureCurrent();

      // ---- observers (register before the first run) ------------------------
      void onStateChange(std::function<void(ControllerState)> cb) { stateCb_ = std::move(cb); }
      void onRunFinished(std::function<void(const RunStatus&)> cb) { finishedCb_ = std::move(cb); }
      void onProgress(std::function<void(std::size_t, std::size_t)> cb) { progressCb_ = std::move(cb); }

    private:
      struct RunContext {
        protocols::Protocol protocol;
        std::optional<protocols::SegmentPlan> plan;
        TimingMode timing{ TimingMode::Host };
        std::stop_source cancel; ///< the only field touched from outside the run
        FileDecision fileDecision{ FileDecision::Overwrite };
      };

      ArmOutcome startRun();  ///< Armed → Running; apiMtx_ held
      void releaseToIdle();   ///< drop the context from Armed; apiMtx_ held
      void runWorker();       ///< Running → Finalizing → Idle on the worker thread
      void transitionTo(ControllerState next);
      void requireIdle(const char* what) const;
      void reapWorker();
      [[noreturn]] void reject(Fault fault, const std::string& reason);

      InstrumentTransport& instrument_;
      SafetyInterlock& interlock_;
      SampleChannel& channel_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      TimingSettings timing_;
      std::string tspChannel_;

      std::function<void(ControllerState)> stateCb_{};
      std::function<void(const RunStatus&)> finishedCb_{};
      std::function<void(std::size_t, std::size_t)> progressCb_{};

      std::mutex apiMtx_; ///< serialises lifecycle + manual calls
      mutable std::mutex mtx_;
      std::condition_variable idleCv_;
      ControllerState currentState_{ ControllerState::Idle };
      std::optional<RunContext> ctx_;
      std::optional<RunStatus> lastStatus_;
      std::thread worker_;
    };

  } // namespace core
} // namespace ivseq
