// Study design parameters and their range checks.

#ifndef IPED_DESIGN_STUDY_PARAMS_H
#define IPED_DESIGN_STUDY_PARAMS_H

#include <cstdint>
#include <string>

namespace iped {

/// @brief Shape of one IPED study.
///
/// Invariant once validated: 1 <= min_active <= max_active <= num_elements.
struct StudyDesignParams {
  int num_elements = 4;          ///< Elements in the study (4-16).
  int tasks_per_respondent = 1;  ///< Tasks shown to each respondent (1-100).
  int num_respondents = 1;       ///< Respondents in the study (1-10000).
  int min_active = 1;            ///< Fewest elements shown in one task.
  int max_active = 1;            ///< Most elements shown in one task.

  /// @brief Number of distinct active-count levels.
  int activeLevels() const { return max_active - min_active + 1; }
};

/// @brief Check every parameter range and the min/max ordering.
/// @param params Parameters to check.
/// @return Empty string when valid, otherwise a description of the first problem.
std::string validateStudyParams(const StudyDesignParams& params);

/// @brief Fixed seed derived from the study shape.
///
/// Used when the caller passes seed 0, so the same configuration always
/// regenerates the same matrix.
///
/// @param params Study parameters.
/// @return Non-zero seed.
uint32_t defaultSeedFor(const StudyDesignParams& params);

}  // namespace iped

#endif  // IPED_DESIGN_STUDY_PARAMS_H
