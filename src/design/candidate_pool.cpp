// Implementation of candidate pool construction.

#include "design/candidate_pool.h"

#include <algorithm>
#include <random>
#include <set>
#include <utility>

#include "core/rng_util.h"
#include "design/task_planner.h"

namespace iped {

namespace {

/// Salt for the pool sampling seed, kept apart from respondent seeds.
constexpr uint32_t kPoolSeedSalt = 0xC0DEu;

/// @brief Enumerate every mask with exactly k of the low n bits set, ascending.
///
/// Gosper's hack: next = (((r ^ x) >> 2) / c) | r with c = lowest set bit
/// of x and r = x + c.
std::vector<ElementMask> enumerateSubsets(int num_elements, int k) {
  std::vector<ElementMask> masks;
  const uint32_t limit = 1u << num_elements;
  uint32_t subset = (1u << k) - 1u;
  while (subset < limit) {
    masks.push_back(static_cast<ElementMask>(subset));
    uint32_t lowest = subset & (~subset + 1u);
    uint32_t ripple = subset + lowest;
    subset = (((ripple ^ subset) >> 2) / lowest) | ripple;
  }
  return masks;
}

/// @brief Draw one uniform k-subset by partial Fisher-Yates.
ElementMask sampleSubset(std::mt19937& rng, int num_elements, int k) {
  int order[kMaxElements];
  for (int idx = 0; idx < num_elements; ++idx) order[idx] = idx;

  ElementMask mask = 0;
  for (int idx = 0; idx < k; ++idx) {
    int pick = rng::rollRange(rng, idx, num_elements - 1);
    std::swap(order[idx], order[pick]);
    mask = static_cast<ElementMask>(mask | (1u << order[idx]));
  }
  return mask;
}

/// @brief Sample cap distinct k-subsets uniformly without replacement.
///
/// When the cap is at least half of C(n, k), rejection sampling would spin,
/// so the full level is enumerated, shuffled and truncated instead.
std::vector<ElementMask> sampleLevel(std::mt19937& rng, int num_elements, int k,
                                     uint64_t total, int cap) {
  std::vector<ElementMask> masks;
  if (static_cast<uint64_t>(cap) * 2 >= total) {
    masks = enumerateSubsets(num_elements, k);
    rng::shuffleInPlace(rng, masks);
    masks.resize(static_cast<size_t>(cap));
  } else {
    std::set<ElementMask> chosen;
    while (chosen.size() < static_cast<size_t>(cap)) {
      chosen.insert(sampleSubset(rng, num_elements, k));
    }
    masks.assign(chosen.begin(), chosen.end());
  }
  std::sort(masks.begin(), masks.end());
  return masks;
}

}  // namespace

struct PoolBuilder {
  static PoolBuildResult build(const ElementSet& elements, int min_active,
                               int max_active, int cap_per_level) {
    PoolBuildResult result;
    const int num_elements = elements.size();

    if (min_active > max_active) {
      result.error = DesignError::InfeasibleDesign;
      result.error_message = "min_active " + std::to_string(min_active) +
                             " exceeds max_active " + std::to_string(max_active);
      return result;
    }
    if (cap_per_level < 1) {
      result.error = DesignError::InfeasibleDesign;
      result.error_message = "pool cap must be at least 1";
      return result;
    }

    CandidatePool& pool = result.pool;
    pool.num_elements_ = num_elements;
    pool.min_active_ = min_active;
    pool.max_active_ = max_active;

    uint32_t pool_seed = rng::splitmix32(kPoolSeedSalt, static_cast<uint32_t>(num_elements));
    pool_seed = rng::splitmix32(pool_seed, static_cast<uint32_t>(min_active));
    pool_seed = rng::splitmix32(pool_seed, static_cast<uint32_t>(max_active));
    pool_seed = rng::splitmix32(pool_seed, static_cast<uint32_t>(cap_per_level));

    size_t total_candidates = 0;
    for (int k = min_active; k <= max_active; ++k) {
      std::vector<CandidateTask> level;
      bool complete = true;
      uint64_t level_total = binomial(num_elements, k);

      if (k >= 1 && level_total > 0) {
        std::vector<ElementMask> masks;
        if (level_total <= static_cast<uint64_t>(cap_per_level)) {
          masks = enumerateSubsets(num_elements, k);
        } else {
          std::mt19937 level_rng(rng::splitmix32(pool_seed, static_cast<uint32_t>(k)));
          masks = sampleLevel(level_rng, num_elements, k, level_total, cap_per_level);
          complete = false;
        }
        level.reserve(masks.size());
        for (ElementMask mask : masks) {
          level.push_back({mask, static_cast<uint8_t>(k)});
        }
      }

      total_candidates += level.size();
      pool.levels_.push_back(std::move(level));
      pool.level_complete_.push_back(complete);
    }

    if (total_candidates == 0) {
      result.error = DesignError::InfeasibleDesign;
      result.error_message = "active range [" + std::to_string(min_active) + ", " +
                             std::to_string(max_active) + "] admits no task over " +
                             std::to_string(num_elements) + " elements";
      return result;
    }
    // Every level in range must be drawable by the scheduler.
    for (int k = min_active; k <= max_active; ++k) {
      if (pool.level(k).empty()) {
        result.error = DesignError::InfeasibleDesign;
        result.error_message = "no candidate with " + std::to_string(k) + " active elements";
        return result;
      }
    }

    result.success = true;
    return result;
  }
};

size_t CandidatePool::size() const {
  size_t total = 0;
  for (const auto& level : levels_) total += level.size();
  return total;
}

const std::vector<CandidateTask>& CandidatePool::level(int active_count) const {
  return levels_[static_cast<size_t>(active_count - min_active_)];
}

bool CandidatePool::levelComplete(int active_count) const {
  return level_complete_[static_cast<size_t>(active_count - min_active_)];
}

bool CandidatePool::complete() const {
  return std::all_of(level_complete_.begin(), level_complete_.end(),
                     [](bool done) { return done; });
}

PoolBuildResult buildCandidatePool(const ElementSet& elements, int min_active,
                                   int max_active, int cap_per_level) {
  return PoolBuilder::build(elements, min_active, max_active, cap_per_level);
}

}  // namespace iped
