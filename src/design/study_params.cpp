// Implementation of study parameter checks.

#include "design/study_params.h"

#include "core/basic_types.h"
#include "core/rng_util.h"

namespace iped {

namespace {

/// @brief Format "<name> must be in [lo, hi] (got value)".
std::string rangeError(const char* name, int lo, int hi, int value) {
  return std::string(name) + " must be in [" + std::to_string(lo) + ", " +
         std::to_string(hi) + "] (got " + std::to_string(value) + ")";
}

/// Base value mixed into derived seeds.
constexpr uint32_t kDerivedSeedBase = 0x1EDu;

}  // namespace

std::string validateStudyParams(const StudyDesignParams& params) {
  if (params.num_elements < kMinElements || params.num_elements > kMaxElements) {
    return rangeError("num_elements", kMinElements, kMaxElements, params.num_elements);
  }
  if (params.tasks_per_respondent < kMinTasksPerRespondent ||
      params.tasks_per_respondent > kMaxTasksPerRespondent) {
    return rangeError("tasks_per_respondent", kMinTasksPerRespondent,
                      kMaxTasksPerRespondent, params.tasks_per_respondent);
  }
  if (params.num_respondents < kMinRespondents ||
      params.num_respondents > kMaxRespondents) {
    return rangeError("num_respondents", kMinRespondents, kMaxRespondents,
                      params.num_respondents);
  }
  if (params.min_active < 1) {
    return "min_active must be >= 1 (got " + std::to_string(params.min_active) + ")";
  }
  if (params.max_active > params.num_elements) {
    return "max_active must be <= num_elements (" + std::to_string(params.max_active) +
           " > " + std::to_string(params.num_elements) + ")";
  }
  if (params.min_active > params.max_active) {
    return "min_active must be <= max_active (" + std::to_string(params.min_active) +
           " > " + std::to_string(params.max_active) + ")";
  }
  return "";
}

uint32_t defaultSeedFor(const StudyDesignParams& params) {
  uint32_t seed = rng::splitmix32(kDerivedSeedBase, static_cast<uint32_t>(params.num_elements));
  seed = rng::splitmix32(seed, static_cast<uint32_t>(params.tasks_per_respondent));
  seed = rng::splitmix32(seed, static_cast<uint32_t>(params.num_respondents));
  seed = rng::splitmix32(seed, static_cast<uint32_t>(params.min_active));
  seed = rng::splitmix32(seed, static_cast<uint32_t>(params.max_active));
  if (seed == 0) seed = 1;
  return seed;
}

}  // namespace iped
