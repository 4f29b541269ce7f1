#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO that overwrites its oldest element when full.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ivseq {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Not synchronised; the owner (SampleChannel) guards it with its own mutex.
 *
 *  * `push()` on a full buffer drops the oldest element and reports it.
 *  * T must be default-constructible and movable.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// @returns false if the oldest element had to be overwritten.
      bool push(T item) {
        bool kept = true;
        if (count_ == slots_.size()) {
          head_ = (head_ + 1) % slots_.size();
          --count_;
          ++dropped_;
          kept = false;
        }
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return kept;
      }

      std::optional<T> pop() {
        if (count_ == 0)
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      bool empty() const { return count_ == 0; }
      std::size_t size() const { return count_; }
      std::size_t capacity() const { return slots_.size(); }
      std::size_t dropped() const { return dropped_; }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      std::size_t dropped_{ 0 };
    };

  } // namespace core
} // namespace ivseq
