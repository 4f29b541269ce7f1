/* @file SequenceController.cpp
 * @brief run lifecycle FSM: interlock → plan → timing driver → finalize
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

// ivseq headers
#include "core/ErrorMonitor.hpp"
#include "core/InstrumentTransport.hpp"
#include "core/SampleChannel.hpp"
#include "core/SegmentBuilder.hpp"
#include "core/SequenceController.hpp"
#include "core/TimingDriver.hpp"

using namespace ivseq::core;

SequenceController::SequenceController(InstrumentTransport& instrument, SafetyInterlock& interlock,
                                       SampleChannel& channel,
                                       std::shared_ptr<ErrorMonitor> errorMonitor,
                                       TimingSettings timing, std::string tspChannel)
    : instrument_(instrument), interlock_(interlock), channel_(channel),
      errorMonitor_(std::move(errorMonitor)), timing_(timing), tspChannel_(std::move(tspChannel)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[SequenceController] error monitor is nullptr");
}

SequenceController::~SequenceController() {
  requestStop();
  if (worker_.joinable())
    worker_.join();
}

//---run lifecycle----------------------------------------------------------

ArmOutcome SequenceController::requestRun(RunRequest request) {
  if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id())
    throw std::logic_error("[SequenceController] requestRun from inside a run callback");

  std::lock_guard<std::mutex> api(apiMtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (currentState_ != ControllerState::Idle)
      throw SequenceError(Fault::RunAlreadyInProgress,
                          std::string("[SequenceController] a run is already ") +
                              toString(currentState_));
  }
  reapWorker();

  // Idle → Armed
  const auto verdict = interlock_.validate(request.protocol);
  if (verdict.verdict == Verdict::ComplianceNotSet)
    reject(Fault::ComplianceNotSet, verdict.reason);
  if (verdict.verdict == Verdict::VoltageExceedsLimit)
    reject(Fault::VoltageExceedsLimit, verdict.reason);
  if (request.timing == TimingMode::DeviceTSP && !instrument_.supportsScripts())
    reject(Fault::TimingModeUnavailable,
           "[SequenceController] device-paced timing needs a TSP (26xx) instrument");

  {
    std::lock_guard<std::mutex> lock(mtx_);
    ctx_.emplace(RunContext{ std::move(request.protocol), std::nullopt, request.timing, {},
                             request.fileDecision });
  }
  errorMonitor_->clear();
  transitionTo(ControllerState::Armed);

  if (verdict.verdict == Verdict::ConfirmationRequired) {
    std::cerr << verdict.reason << " - waiting for operator confirmation\n";
    return ArmOutcome::ConfirmationRequired;
  }
  return startRun();
}

ArmOutcome SequenceController::confirm() {
  std::lock_guard<std::mutex> api(apiMtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (currentState_ != ControllerState::Armed)
      throw std::logic_error("[SequenceController] nothing is waiting for confirmation");
  }

  // interlock state may have changed while we waited
  const auto verdict = interlock_.validate(ctx_->protocol, /*confirmed=*/true);
  if (verdict.hardFailure()) {
    releaseToIdle();
    reject(verdict.verdict == Verdict::ComplianceNotSet ? Fault::ComplianceNotSet
                                                        : Fault::VoltageExceedsLimit,
           verdict.reason);
  }
  return startRun();
}

void SequenceController::decline() {
  std::lock_guard<std::mutex> api(apiMtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (currentState_ == ControllerState::Running && ctx_) {
      // a confirm() won the race; treat the refusal as a stop
      ctx_->cancel.request_stop();
      return;
    }
    if (currentState_ != ControllerState::Armed)
      return;
  }
  std::cerr << "[SequenceController] run declined by operator\n";
  releaseToIdle();
}

void SequenceController::requestStop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (currentState_ == ControllerState::Running && ctx_) {
      ctx_->cancel.request_stop();
      return;
    }
    if (currentState_ != ControllerState::Armed)
      return;
  }
  decline();
}

std::optional<RunStatus> SequenceController::waitForCompletion() {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    idleCv_.wait(lock, [this] {
      return currentState_ == ControllerState::Idle || currentState_ == ControllerState::Armed;
    });
  }
  std::lock_guard<std::mutex> api(apiMtx_);
  reapWorker();
  return lastStatus();
}

ControllerState SequenceController::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return currentState_;
}

std::optional<RunStatus> SequenceController::lastStatus() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastStatus_;
}

std::optional<RunInfo> SequenceController::activeRun() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!ctx_)
    return std::nullopt;
  return RunInfo{ protocols::describe(ctx_->protocol), ctx_->timing, ctx_->fileDecision,
                  ctx_->plan ? ctx_->plan->expectedSampleCount() : 0 };
}

//---manual control---------------------------------------------------------

void SequenceController::applyCompliance(double microAmps) {
  std::lock_guard<std::mutex> api(apiMtx_);
  requireIdle("apply compliance");
  interlock_.checkCompliance(microAmps);
  instrument_.setCompliance(microAmps);
  interlock_.recordCompliance(microAmps);
  std::cerr << "[SequenceController] compliance set to " << microAmps << " uA\n";
}

Verdict SequenceController::applyVoltage(double volts, bool confirmed) {
  std::lock_guard<std::mutex> api(apiMtx_);
  requireIdle("apply voltage");
  const auto v = interlock_.validateVoltage(volts, confirmed);
  if (v.verdict == Verdict::ComplianceNotSet)
    reject(Fault::ComplianceNotSet, v.reason);
  if (v.verdict == Verdict::VoltageExceedsLimit)
    reject(Fault::VoltageExceedsLimit, v.reason);
  if (v.verdict == Verdict::ConfirmationRequired)
    return v.verdict;

  instrument_.applyVoltage(volts);
  interlock_.recordVoltage(volts);
  return Verdict::Ok;
}

double SequenceController::measureCurrent() {
  std::lock_guard<std::mutex> api(apiMtx_);
  requireIdle("measure current");
  return instrument_.readCurrent();
}

//---internals--------------------------------------------------------------

ArmOutcome SequenceController::startRun() {
  if (ctx_->fileDecision == FileDecision::Abort) {
    std::cerr << "[SequenceController] logging collaborator aborted the run\n";
    releaseToIdle();
    return ArmOutcome::Declined;
  }

  // Armed → Running
  try {
    ctx_->plan.emplace(SegmentBuilder::build(ctx_->protocol));
  } catch (const SequenceError& e) {
    releaseToIdle();
    reject(e.fault(), e.what());
  } catch (const std::exception& e) {
    releaseToIdle();
    reject(Fault::InvalidProtocolParameters,
           std::string("[SequenceController] could not build the plan: ") + e.what());
  }

  const RunInfo info{ protocols::describe(ctx_->protocol), ctx_->timing, ctx_->fileDecision,
                      ctx_->plan->expectedSampleCount() };
  try {
    channel_.startNewRun(info, info.expectedSamples);
  } catch (const std::exception& e) {
    // sinks refused the run (e.g. output file not writable): nothing touched the instrument
    std::cerr << "[SequenceController] sample channel refused run: " << e.what() << '\n';
    releaseToIdle();
    throw;
  }
  transitionTo(ControllerState::Running);
  std::cerr << "[SequenceController] " << info.protocol << ", " << ctx_->plan->size() << " steps, "
            << info.expectedSamples << " samples, " << toString(info.timing) << '\n';

  worker_ = std::thread([this] { runWorker(); });
  return ArmOutcome::Started;
}

void SequenceController::releaseToIdle() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ctx_.reset();
  }
  transitionTo(ControllerState::Idle);
}

void SequenceController::runWorker() {
  RunStatus status;
  const auto& plan = *ctx_->plan;
  const auto total = plan.expectedSampleCount();
  const auto token = ctx_->cancel.get_token();

  try {
    auto driver = makeTimingDriver(ctx_->timing, timing_, tspChannel_);
    const auto result = execute(driver, plan, instrument_, token, [&](const Sample& s) {
      channel_.publish(s);
      if (progressCb_)
        progressCb_(s.index + 1, total);
    });
    status.outcome = result.cancelled ? RunOutcome::Aborted : RunOutcome::Completed;
    status.samples = result.samples;
    status.lastAppliedVoltage = result.lastAppliedVoltage;
  } catch (const InstrumentCommunicationError& e) {
    status.outcome = RunOutcome::Failed;
    status.reason = e.what();
    status.lastAppliedVoltage = e.lastAppliedVoltage();
    errorMonitor_->notifyFailure(std::string("[SequenceController] run failed: ") + e.what());
  } catch (const std::exception& e) {
    status.outcome = RunOutcome::Failed;
    status.reason = e.what();
    errorMonitor_->notifyFailure(std::string("[SequenceController] run failed: ") + e.what());
  }

  // Running → Finalizing: the run no longer owns the instrument
  transitionTo(ControllerState::Finalizing);
  try {
    instrument_.forceZero();
    interlock_.recordVoltage(0.0);
  } catch (const TransportError& e) {
    std::cerr << "[SequenceController] force zero during finalize failed: " << e.what() << '\n';
  }
  channel_.finishRun(status);

  std::cerr << "[SequenceController] run " << toString(status.outcome) << " after " << status.samples
            << " samples" << (status.reason.empty() ? "" : ": " + status.reason) << '\n';

  {
    std::lock_guard<std::mutex> lock(mtx_);
    lastStatus_ = status;
    ctx_.reset();
  }
  if (finishedCb_)
    finishedCb_(status);
  transitionTo(ControllerState::Idle);
}

void SequenceController::transitionTo(ControllerState next) {
  ControllerState prev;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    prev = currentState_;
    currentState_ = next;
  }
  idleCv_.notify_all();
  std::cerr << "[SequenceController] " << toString(prev) << " -> " << toString(next) << '\n';
  if (stateCb_)
    stateCb_(next);
}

void SequenceController::requireIdle(const char* what) const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (currentState_ != ControllerState::Idle)
    throw SequenceError(Fault::RunAlreadyInProgress, std::string("[SequenceController] cannot ") +
                                                         what + " while " +
                                                         toString(currentState_));
}

void SequenceController::reapWorker() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

void SequenceController::reject(Fault fault, const std::string& reason) {
  errorMonitor_->notifyFailure(reason);
  throw SequenceError(fault, reason);
}
