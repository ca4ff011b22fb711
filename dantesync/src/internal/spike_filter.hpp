// Copyright (c) 2025 <Your Name>
/**
 * @file spike_filter.hpp
 * @brief Median-based outlier suppression for raw drift rates.
 *
 * A sample deviating from the median of the recent window by more than the
 * threshold is replaced by that median. The sample is never dropped, so the
 * downstream cadence is unchanged.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <vector>

namespace dantesync {
namespace internal {

class SpikeFilter {
 public:
  struct Result {
    double value;      ///< Value to use downstream
    bool substituted;  ///< true when value is the window median
    double median;     ///< Median the sample was tested against
  };

  SpikeFilter(int window, int min_fill, double threshold)
      : window_(static_cast<size_t>(std::max(1, window))),
        min_fill_(static_cast<size_t>(std::max(1, min_fill))),
        threshold_(threshold) {}

  /**
   * @brief Test one raw value and insert the (possibly substituted) value.
   *
   * Inactive until the window holds min_fill values; until then the raw
   * value passes through unchanged.
   */
  Result Filter(double raw) {
    Result r{raw, false, raw};
    if (values_.size() >= min_fill_) {
      r.median = Median();
      if (std::abs(raw - r.median) > threshold_) {
        r.value = r.median;
        r.substituted = true;
      }
    }
    values_.push_back(r.value);
    while (values_.size() > window_) values_.pop_front();
    return r;
  }

  void Clear() { values_.clear(); }
  size_t Size() const { return values_.size(); }

  double Median() const {
    if (values_.empty()) return 0.0;
    std::vector<double> tmp(values_.begin(), values_.end());
    const size_t mid = tmp.size() / 2;
    std::nth_element(tmp.begin(), tmp.begin() + mid, tmp.end());
    double m = tmp[mid];
    if (tmp.size() % 2 == 0) {
      double lower = *std::max_element(tmp.begin(), tmp.begin() + mid);
      m = (m + lower) / 2.0;
    }
    return m;
  }

 private:
  size_t window_;
  size_t min_fill_;
  double threshold_;
  std::deque<double> values_;
};

}  // namespace internal
}  // namespace dantesync
