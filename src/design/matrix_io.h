// JSON serialization of the study matrix.
//
// Shape:
//   {"0": [{"task_id": "0_0", "elements_shown": {"E1": 1, "E2": 0}, "task_index": 0}, ...],
//    "1": [...]}
// Respondent keys are written in numeric order, element keys in element
// order, tasks in sequence order.

#ifndef IPED_DESIGN_MATRIX_IO_H
#define IPED_DESIGN_MATRIX_IO_H

#include <cstddef>
#include <string>

#include "core/json_helpers.h"
#include "design/study_matrix.h"

namespace iped {

/// @brief Append a matrix as one JSON object value.
void writeMatrix(JsonWriter& writer, const StudyMatrix& matrix);

/// @brief Serialize a matrix.
/// @param matrix Matrix to serialize.
/// @param pretty Indent the output.
/// @return JSON text.
std::string matrixToJson(const StudyMatrix& matrix, bool pretty = false);

/// @brief Parse a serialized matrix.
///
/// Respondent keys must be the decimal indices 0..R-1 (any order). Element
/// keys are taken from the first task; every task must use the same key set
/// with values 0 or 1, and at most kMaxElements keys. Invariants beyond the
/// shape are left to validateMatrix().
///
/// @param json JSON text.
/// @param length Length of the text.
/// @param[out] out Parsed matrix.
/// @param[out] error Optional reason on failure.
/// @return True on success.
bool matrixFromJson(const char* json, size_t length, StudyMatrix& out,
                    std::string* error = nullptr);

}  // namespace iped

#endif  // IPED_DESIGN_MATRIX_IO_H
