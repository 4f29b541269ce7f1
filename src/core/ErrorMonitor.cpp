/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink with a single escalation hook
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// ivseq headers
#include "core/ErrorMonitor.hpp"

namespace ivseq {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!recordIfNew(message))
        return;

      std::cerr << message << '\n';

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      // called outside the lock so the callback may query us
      if (cb)
        cb(message);
    }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    std::size_t ErrorMonitor::count() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::recordIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace ivseq
