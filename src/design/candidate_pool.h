// Candidate pool: the feasible task vectors all respondents draw from.

#ifndef IPED_DESIGN_CANDIDATE_POOL_H
#define IPED_DESIGN_CANDIDATE_POOL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "design/element_set.h"

namespace iped {

/// @brief One feasible task vector tagged with its active count.
struct CandidateTask {
  ElementMask mask = 0;
  uint8_t active_count = 0;
};

/// @brief Distinct candidate tasks grouped by active-count level.
///
/// Each level k in [min_active, max_active] holds either every k-subset of
/// the elements or, when C(n, k) exceeds the per-level cap, a uniform sample
/// of cap distinct k-subsets. Candidates within a level are sorted by mask.
/// The pool is read-only once built and may be shared between threads.
class CandidatePool {
 public:
  CandidatePool() = default;

  int numElements() const { return num_elements_; }
  int minActive() const { return min_active_; }
  int maxActive() const { return max_active_; }

  /// @brief Total candidates across all levels.
  size_t size() const;

  /// @brief Candidates with exactly active_count elements shown.
  /// @param active_count Level in [minActive(), maxActive()].
  const std::vector<CandidateTask>& level(int active_count) const;

  /// @brief True if the level holds every k-subset (no sampling).
  bool levelComplete(int active_count) const;

  /// @brief True if every level is complete; a larger cap cannot add candidates.
  bool complete() const;

 private:
  friend struct PoolBuilder;

  int num_elements_ = 0;
  int min_active_ = 0;
  int max_active_ = 0;
  std::vector<std::vector<CandidateTask>> levels_;
  std::vector<bool> level_complete_;
};

/// @brief Outcome of buildCandidatePool().
struct PoolBuildResult {
  CandidatePool pool;
  bool success = false;
  DesignError error = DesignError::None;
  std::string error_message;
};

/// @brief Build the candidate pool for a study.
///
/// Pure function of (element count, min_active, max_active, cap): sampled
/// levels use a generator seeded from those values only.
///
/// @param elements Study elements.
/// @param min_active Lower active bound.
/// @param max_active Upper active bound.
/// @param cap_per_level Maximum candidates kept per level (>= 1).
/// @return Pool, or InfeasibleDesign when the bounds admit no candidate.
PoolBuildResult buildCandidatePool(const ElementSet& elements, int min_active,
                                   int max_active, int cap_per_level);

}  // namespace iped

#endif  // IPED_DESIGN_CANDIDATE_POOL_H
