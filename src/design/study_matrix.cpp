// Implementation of study matrix helpers.

#include "design/study_matrix.h"

#include <set>
#include <utility>

namespace iped {

std::string makeTaskId(size_t respondent, int task_index) {
  return std::to_string(respondent) + "_" + std::to_string(task_index);
}

ExposureTally tallyExposures(const StudyMatrix& matrix) {
  ExposureTally tally(matrix.numElements());
  for (const auto& respondent : matrix.respondents) {
    for (const auto& task : respondent) {
      tally.add(task.elements_shown);
    }
  }
  return tally;
}

ExposureSummary summarizeExposures(const StudyMatrix& matrix) {
  ExposureSummary summary;
  ExposureTally tally = tallyExposures(matrix);

  summary.counts.reserve(static_cast<size_t>(matrix.numElements()));
  for (int idx = 0; idx < matrix.numElements(); ++idx) {
    summary.counts.push_back(tally.count(idx));
  }
  summary.mean = tally.mean();
  summary.max_abs_deviation = tally.maxAbsDeviation();
  summary.relative_deviation = summary.mean > 0.0 ? summary.max_abs_deviation / summary.mean : 0.0;

  std::set<std::vector<ElementMask>> seen;
  for (const auto& respondent : matrix.respondents) {
    std::vector<ElementMask> sequence;
    sequence.reserve(respondent.size());
    for (const auto& task : respondent) {
      sequence.push_back(task.elements_shown);
    }
    if (!seen.insert(std::move(sequence)).second) {
      ++summary.duplicate_sequences;
    }
  }
  return summary;
}

}  // namespace iped
