// Implementation of exposure tallies.

#include "design/exposure_tally.h"

#include <algorithm>

namespace iped {

void ExposureTally::add(ElementMask mask) {
  for (int idx = 0; idx < num_elements_; ++idx) {
    if (isShown(mask, idx)) {
      ++counts_[static_cast<size_t>(idx)];
      ++total_;
    }
  }
  ++tasks_;
}

void ExposureTally::merge(const ExposureTally& other) {
  for (int idx = 0; idx < num_elements_; ++idx) {
    counts_[static_cast<size_t>(idx)] += other.counts_[static_cast<size_t>(idx)];
  }
  total_ += other.total_;
  tasks_ += other.tasks_;
}

double ExposureTally::mean() const {
  if (num_elements_ == 0) return 0.0;
  return static_cast<double>(total_) / static_cast<double>(num_elements_);
}

double ExposureTally::maxAbsDeviation() const {
  if (num_elements_ == 0) return 0.0;
  return static_cast<double>(scaledMaxDeviationWith(0)) / static_cast<double>(num_elements_);
}

int64_t ExposureTally::scaledMaxDeviationWith(ElementMask extra) const {
  const int64_t n = num_elements_;
  const int64_t new_total = total_ + activeCount(extra);
  int64_t worst = 0;
  for (int idx = 0; idx < num_elements_; ++idx) {
    int64_t count = counts_[static_cast<size_t>(idx)] + (isShown(extra, idx) ? 1 : 0);
    int64_t deviation = n * count - new_total;
    if (deviation < 0) deviation = -deviation;
    worst = std::max(worst, deviation);
  }
  return worst;
}

int64_t ExposureTally::scaledSquaredDeviationWith(ElementMask extra) const {
  const int64_t n = num_elements_;
  const int64_t new_total = total_ + activeCount(extra);
  int64_t sum = 0;
  for (int idx = 0; idx < num_elements_; ++idx) {
    int64_t count = counts_[static_cast<size_t>(idx)] + (isShown(extra, idx) ? 1 : 0);
    int64_t deviation = n * count - new_total;
    sum += deviation * deviation;
  }
  return sum;
}

double ExposureTally::allowedDeviation(double tolerance) const {
  return std::max(tolerance * mean(), 1.0);
}

bool ExposureTally::withinTolerance(double tolerance) const {
  // Small epsilon: both sides come from integer ratios.
  return maxAbsDeviation() <= allowedDeviation(tolerance) + 1e-9;
}

ExposureTally SharedExposureTally::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tally_;
}

void SharedExposureTally::merge(const ExposureTally& delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  tally_.merge(delta);
}

}  // namespace iped
