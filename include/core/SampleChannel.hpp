#pragma once
/** @file  SampleChannel.hpp
 *  @brief Asynchronous, ordered sample conduit (runs its own worker thread).
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "core/RunTypes.hpp"

namespace ivseq {
  namespace core {

    class ErrorMonitor;
    template <typename T> class RingBuffer;

    /// Push interface implemented by logging / recording collaborators.
    class SampleSink {
    public:
      virtual ~SampleSink() = default;
      virtual void onRunStarted(const RunInfo& info) = 0;
      virtual void onSample(const Sample& sample) = 0;
      virtual void onRunCompleted(const RunStatus& status) = 0;
    };

    /**
 * @class SampleChannel
 * @brief Single-producer (timing driver) / single-consumer (worker thread) stream.
 *
 *  * `publish()` never blocks the producer on a slow sink.
 *  * The buffer is sized per run; overflow drops the oldest sample and is
 *    reported on std::cerr, the ErrorMonitor and `dropped()`.
 *  * Sinks see onRunStarted → onSample… → onRunCompleted, in that order.
 */
    class SampleChannel {

    public:
      explicit SampleChannel(std::shared_ptr<ErrorMonitor> errMonitor = nullptr);
      ~SampleChannel();

      SampleChannel(const SampleChannel&) = delete;
      SampleChannel& operator=(const SampleChannel&) = delete;

      // --- public API ---
      void subscribe(std::shared_ptr<SampleSink> sink); ///< only between runs

      void startNewRun(const RunInfo& info, std::size_t capacity); ///< notify sinks + launch worker
      void publish(const Sample& sample);                           ///< enqueue (non-blocking)
      void finishRun(const RunStatus& status);                      ///< drain + join + notify

      bool running() const;
      std::size_t dropped() const;

      static constexpr std::size_t kDefaultCapacity = 4096;

    private:
      void workerLoop();
      void deliver(const Sample& s);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::vector<std::shared_ptr<SampleSink>> sinks_;

      std::unique_ptr<RingBuffer<Sample>> buffer_;
      std::thread worker_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      bool running_{ false };
      bool stopping_{ false };
      std::size_t dropped_{ 0 };
    };

  } // namespace core
} // namespace ivseq
