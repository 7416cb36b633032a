// Per-element exposure accumulator shared by the balance scheduler.

#ifndef IPED_DESIGN_EXPOSURE_TALLY_H
#define IPED_DESIGN_EXPOSURE_TALLY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "core/basic_types.h"

namespace iped {

/// @brief Counts how often each element has been shown.
///
/// Deviations are kept in integer form: for element i the scaled deviation
/// is |n * count_i - total|, which is n times the distance from the mean.
class ExposureTally {
 public:
  explicit ExposureTally(int num_elements = 0) : num_elements_(num_elements) {}

  /// @brief Record one task.
  void add(ElementMask mask);

  /// @brief Add every count of another tally over the same elements.
  void merge(const ExposureTally& other);

  int numElements() const { return num_elements_; }
  int64_t count(int element) const { return counts_[static_cast<size_t>(element)]; }

  /// @brief Sum of all element counts.
  int64_t total() const { return total_; }

  /// @brief Number of tasks recorded.
  size_t tasks() const { return tasks_; }

  /// @brief Mean exposure per element.
  double mean() const;

  /// @brief Largest |count_i - mean| over all elements.
  double maxAbsDeviation() const;

  /// @brief Largest scaled deviation after hypothetically adding one more task.
  /// @param extra Task to add (0 for the current state).
  /// @return max_i |n * (count_i + shown_i) - (total + active(extra))|.
  int64_t scaledMaxDeviationWith(ElementMask extra) const;

  /// @brief Sum of squared scaled deviations after hypothetically adding one task.
  /// @return sum_i (n * (count_i + shown_i) - (total + active(extra)))^2.
  int64_t scaledSquaredDeviationWith(ElementMask extra) const;

  /// @brief Allowed absolute deviation for a tolerance fraction.
  ///
  /// max(tolerance * mean, 1.0): rounding alone can force a deviation just
  /// under one exposure when the total does not divide evenly.
  double allowedDeviation(double tolerance) const;

  /// @brief True if maxAbsDeviation() <= allowedDeviation(tolerance).
  bool withinTolerance(double tolerance) const;

 private:
  int num_elements_;
  std::array<int64_t, kMaxElements> counts_{};
  int64_t total_ = 0;
  size_t tasks_ = 0;
};

/// @brief Mutex-guarded study-wide tally for the parallel scheduler.
///
/// Workers read a snapshot at batch start and merge their private deltas
/// afterwards; each merge is applied atomically.
class SharedExposureTally {
 public:
  explicit SharedExposureTally(int num_elements) : tally_(num_elements) {}

  SharedExposureTally(const SharedExposureTally&) = delete;
  SharedExposureTally& operator=(const SharedExposureTally&) = delete;

  /// @brief Copy of the current counts.
  ExposureTally snapshot() const;

  /// @brief Add a respondent's delta to the shared counts.
  void merge(const ExposureTally& delta);

 private:
  mutable std::mutex mutex_;
  ExposureTally tally_;
};

}  // namespace iped

#endif  // IPED_DESIGN_EXPOSURE_TALLY_H
