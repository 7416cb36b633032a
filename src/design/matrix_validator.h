// Post-generation validation of a study matrix.

#ifndef IPED_DESIGN_MATRIX_VALIDATOR_H
#define IPED_DESIGN_MATRIX_VALIDATOR_H

#include <cstdint>
#include <string>

#include "design/study_matrix.h"
#include "design/study_params.h"

namespace iped {

/// @brief Which matrix invariant failed.
enum class MatrixViolation : uint8_t {
  None,
  ShapeMismatch,          ///< Wrong respondent count, task count or element count.
  ActiveCountOutOfRange,  ///< A task shows fewer than min_active or more than max_active elements.
  TaskIndexGap,           ///< task_index is not the 0-based position.
  MalformedTaskId,        ///< task_id is not "{respondent}_{task_index}".
  DuplicateTaskId,        ///< task_id repeated within the study.
  ExposureImbalance       ///< Study-wide exposure deviation above tolerance.
};

/// @brief Convert MatrixViolation to string.
const char* matrixViolationToString(MatrixViolation violation);

/// @brief First violation found, or valid.
struct ValidationReport {
  bool valid = true;
  MatrixViolation violation = MatrixViolation::None;
  int respondent = -1;  ///< Offending respondent (-1 for study-wide checks).
  int task = -1;        ///< Offending task position (-1 if not task-specific).
  std::string message;
};

/// @brief Check a matrix against its study parameters.
///
/// Checks, in order: shape, per-task active counts, task_index contiguity,
/// task_id format and uniqueness, then study-wide exposure balance. Identical
/// respondent sequences are allowed and not reported. Runs in
/// O(respondents * tasks * elements).
///
/// @param matrix Matrix to check.
/// @param params Study parameters the matrix was generated for.
/// @param exposure_tolerance Allowed deviation as a fraction of mean exposure.
/// @return Report naming the first violation.
ValidationReport validateMatrix(const StudyMatrix& matrix, const StudyDesignParams& params,
                                double exposure_tolerance);

/// @brief Derive parameters from an existing matrix.
///
/// Respondent count, element count and the first respondent's task count are
/// read directly; min/max active are the observed extremes. Used to check a
/// persisted matrix when the original configuration is not at hand.
StudyDesignParams inferStudyParams(const StudyMatrix& matrix);

/// @brief Validate a matrix against the parameters inferred from it.
///
/// The inferred parameters must themselves be in range (4-16 elements,
/// 1-100 tasks, 1-10000 respondents); otherwise the report is a
/// ShapeMismatch. An empty matrix or an empty first respondent fails here.
///
/// @param matrix Matrix to check, typically loaded from JSON.
/// @param exposure_tolerance Allowed deviation as a fraction of mean exposure.
/// @return Report naming the first violation.
ValidationReport validateInferredMatrix(const StudyMatrix& matrix, double exposure_tolerance);

}  // namespace iped

#endif  // IPED_DESIGN_MATRIX_VALIDATOR_H
