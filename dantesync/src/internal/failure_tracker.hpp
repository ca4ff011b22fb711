// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Consecutive failure counting for one clock capability.
 */

#ifndef DANTESYNC_INTERNAL_FAILURE_TRACKER_HPP_
#define DANTESYNC_INTERNAL_FAILURE_TRACKER_HPP_

#include <algorithm>
#include <cstdint>
#include <string>

namespace dantesync {
namespace internal {

/**
 * @brief Raises a fault after threshold consecutive failures.
 *
 * The next success clears both the count and the fault.
 */
class FailureTracker {
 public:
  explicit FailureTracker(int threshold) : threshold_(std::max(1, threshold)) {}

  void RecordSuccess() {
    consecutive_ = 0;
    fault_ = false;
  }

  /** @return true when this failure raised the fault. */
  bool RecordFailure(const std::string& err) {
    ++total_failures_;
    ++consecutive_;
    last_error_ = err;
    bool was = fault_;
    if (consecutive_ >= threshold_) fault_ = true;
    return fault_ && !was;
  }

  bool Fault() const { return fault_; }
  int Consecutive() const { return consecutive_; }
  uint64_t TotalFailures() const { return total_failures_; }
  const std::string& LastError() const { return last_error_; }

 private:
  int threshold_;
  int consecutive_ = 0;
  bool fault_ = false;
  uint64_t total_failures_ = 0;
  std::string last_error_;
};

}  // namespace internal
}  // namespace dantesync

#endif  // DANTESYNC_INTERNAL_FAILURE_TRACKER_HPP_
