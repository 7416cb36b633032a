// Implementation of study matrix validation.

#include "design/matrix_validator.h"

#include <algorithm>
#include <cstdio>
#include <unordered_set>
#include <utility>

#include "core/basic_types.h"

namespace iped {

namespace {

ValidationReport violation(MatrixViolation kind, int respondent, int task, std::string message) {
  ValidationReport report;
  report.valid = false;
  report.violation = kind;
  report.respondent = respondent;
  report.task = task;
  report.message = std::move(message);
  return report;
}

}  // namespace

const char* matrixViolationToString(MatrixViolation violation) {
  switch (violation) {
    case MatrixViolation::None:                  return "None";
    case MatrixViolation::ShapeMismatch:         return "ShapeMismatch";
    case MatrixViolation::ActiveCountOutOfRange: return "ActiveCountOutOfRange";
    case MatrixViolation::TaskIndexGap:          return "TaskIndexGap";
    case MatrixViolation::MalformedTaskId:       return "MalformedTaskId";
    case MatrixViolation::DuplicateTaskId:       return "DuplicateTaskId";
    case MatrixViolation::ExposureImbalance:     return "ExposureImbalance";
  }
  return "Unknown";
}

ValidationReport validateMatrix(const StudyMatrix& matrix, const StudyDesignParams& params,
                                double exposure_tolerance) {
  if (matrix.numElements() != params.num_elements) {
    return violation(MatrixViolation::ShapeMismatch, -1, -1,
                     "matrix has " + std::to_string(matrix.numElements()) +
                         " elements, expected " + std::to_string(params.num_elements));
  }
  if (matrix.numRespondents() != static_cast<size_t>(params.num_respondents)) {
    return violation(MatrixViolation::ShapeMismatch, -1, -1,
                     "matrix has " + std::to_string(matrix.numRespondents()) +
                         " respondents, expected " + std::to_string(params.num_respondents));
  }

  const ElementMask valid_bits = fullMask(params.num_elements);
  std::unordered_set<std::string> seen_ids;
  seen_ids.reserve(static_cast<size_t>(params.num_respondents) *
                   static_cast<size_t>(params.tasks_per_respondent));

  for (size_t resp = 0; resp < matrix.respondents.size(); ++resp) {
    const auto& tasks = matrix.respondents[resp];
    const int resp_idx = static_cast<int>(resp);

    if (tasks.size() != static_cast<size_t>(params.tasks_per_respondent)) {
      return violation(MatrixViolation::ShapeMismatch, resp_idx, -1,
                       "respondent " + std::to_string(resp) + " has " +
                           std::to_string(tasks.size()) + " tasks, expected " +
                           std::to_string(params.tasks_per_respondent));
    }

    for (size_t pos = 0; pos < tasks.size(); ++pos) {
      const TaskAssignment& task = tasks[pos];
      const int pos_idx = static_cast<int>(pos);
      const std::string where =
          "respondent " + std::to_string(resp) + " task " + std::to_string(pos);

      if ((task.elements_shown & ~valid_bits) != 0) {
        return violation(MatrixViolation::ShapeMismatch, resp_idx, pos_idx,
                         where + ": shows an element outside the study");
      }
      int active = activeCount(task.elements_shown);
      if (active < params.min_active || active > params.max_active) {
        return violation(MatrixViolation::ActiveCountOutOfRange, resp_idx, pos_idx,
                         where + ": " + std::to_string(active) + " active elements, allowed [" +
                             std::to_string(params.min_active) + ", " +
                             std::to_string(params.max_active) + "]");
      }
      if (task.task_index != pos_idx) {
        return violation(MatrixViolation::TaskIndexGap, resp_idx, pos_idx,
                         where + ": task_index " + std::to_string(task.task_index));
      }
      if (task.task_id != makeTaskId(resp, pos_idx)) {
        return violation(MatrixViolation::MalformedTaskId, resp_idx, pos_idx,
                         where + ": task_id '" + task.task_id + "'");
      }
      if (!seen_ids.insert(task.task_id).second) {
        return violation(MatrixViolation::DuplicateTaskId, resp_idx, pos_idx,
                         where + ": duplicate task_id '" + task.task_id + "'");
      }
    }
  }

  ExposureTally tally = tallyExposures(matrix);
  if (!tally.withinTolerance(exposure_tolerance)) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "exposure deviation %.2f exceeds allowed %.2f (mean %.2f)",
                  tally.maxAbsDeviation(), tally.allowedDeviation(exposure_tolerance),
                  tally.mean());
    return violation(MatrixViolation::ExposureImbalance, -1, -1, buf);
  }

  return ValidationReport();
}

StudyDesignParams inferStudyParams(const StudyMatrix& matrix) {
  StudyDesignParams params;
  params.num_elements = matrix.numElements();
  params.num_respondents = static_cast<int>(matrix.numRespondents());
  params.tasks_per_respondent =
      matrix.respondents.empty() ? 0 : static_cast<int>(matrix.respondents.front().size());

  int lo = params.num_elements;
  int hi = 0;
  for (const auto& tasks : matrix.respondents) {
    for (const auto& task : tasks) {
      int active = activeCount(task.elements_shown);
      lo = std::min(lo, active);
      hi = std::max(hi, active);
    }
  }
  if (hi < lo) {
    lo = 1;
    hi = 1;
  }
  // Empty tasks are reported as ActiveCountOutOfRange, not as a bad range.
  lo = std::max(lo, 1);
  hi = std::max(hi, lo);
  params.min_active = lo;
  params.max_active = hi;
  return params;
}

ValidationReport validateInferredMatrix(const StudyMatrix& matrix, double exposure_tolerance) {
  StudyDesignParams params = inferStudyParams(matrix);
  std::string range_error = validateStudyParams(params);
  if (!range_error.empty()) {
    return violation(MatrixViolation::ShapeMismatch, -1, -1, "inferred " + range_error);
  }
  return validateMatrix(matrix, params, exposure_tolerance);
}

}  // namespace iped
