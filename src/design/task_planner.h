// Sizing helpers for study setup: design capacity and a default
// tasks-per-respondent value.

#ifndef IPED_DESIGN_TASK_PLANNER_H
#define IPED_DESIGN_TASK_PLANNER_H

#include <cstdint>

namespace iped {

/// @brief Binomial coefficient C(n, k). Returns 0 for k < 0 or k > n.
uint64_t binomial(int n, int k);

/// @brief Count distinct task vectors with an active count in [min_active, max_active].
/// @param num_elements Elements in the study.
/// @param min_active Lower active bound (clamped to 0).
/// @param max_active Upper active bound (clamped to num_elements).
/// @return Sum of C(num_elements, k) over the range, 0 if the range is empty.
uint64_t visibleCapacity(int num_elements, int min_active, int max_active);

/// @brief Default tasks per respondent for a study size.
///
/// Picks K = 2 for up to 8 elements and K = 3 above, then uses half of
/// C(num_elements, K), capped at 24. Fewer than 4 elements yields 8.
///
/// @param num_elements Elements in the study.
/// @return Recommended tasks per respondent.
int recommendTasksPerRespondent(int num_elements);

}  // namespace iped

#endif  // IPED_DESIGN_TASK_PLANNER_H
