// Study matrix: the generated task assignments for every respondent.

#ifndef IPED_DESIGN_STUDY_MATRIX_H
#define IPED_DESIGN_STUDY_MATRIX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "design/exposure_tally.h"

namespace iped {

/// @brief One task shown to one respondent.
struct TaskAssignment {
  std::string task_id;            ///< "{respondent}_{task_index}".
  ElementMask elements_shown = 0; ///< Bit i = element i shown.
  int task_index = 0;             ///< Position in the respondent's sequence.
};

/// Ordered tasks of one respondent.
using RespondentMatrix = std::vector<TaskAssignment>;

/// @brief All respondents' task sequences.
///
/// respondents[r] is serialized under the key std::to_string(r).
/// element_ids maps mask bits to serialized element keys.
struct StudyMatrix {
  std::vector<std::string> element_ids;
  std::vector<RespondentMatrix> respondents;

  int numElements() const { return static_cast<int>(element_ids.size()); }
  size_t numRespondents() const { return respondents.size(); }
};

/// @brief Build the task identifier for a respondent/task pair.
std::string makeTaskId(size_t respondent, int task_index);

/// @brief Count element exposures over the whole matrix.
ExposureTally tallyExposures(const StudyMatrix& matrix);

/// @brief Exposure statistics for reporting.
struct ExposureSummary {
  std::vector<int64_t> counts;     ///< Exposures per element, in element order.
  double mean = 0.0;               ///< Mean exposures per element.
  double max_abs_deviation = 0.0;  ///< Largest |count - mean|.
  double relative_deviation = 0.0; ///< max_abs_deviation / mean (0 if mean is 0).
  size_t duplicate_sequences = 0;  ///< Respondents whose sequence repeats an earlier one.
};

/// @brief Compute exposure statistics for a matrix.
ExposureSummary summarizeExposures(const StudyMatrix& matrix);

}  // namespace iped

#endif  // IPED_DESIGN_STUDY_MATRIX_H
