// Study matrix generator: builds the candidate pool, schedules every
// respondent, validates the result and retries once with a larger pool.

#ifndef IPED_GENERATOR_H
#define IPED_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "design/matrix_validator.h"
#include "design/study_matrix.h"
#include "design/study_params.h"

namespace iped {

/// @brief Configuration for one generation request.
struct GeneratorConfig {
  StudyDesignParams params;
  std::vector<std::string> element_names;  ///< Empty = "E1".."En".
  uint32_t seed = 0;                       ///< 0 = derived from params (reproducible).
  bool randomize_seed = false;             ///< Draw a fresh seed from the system device.
  double exposure_tolerance = kDefaultExposureTolerance;
  int pool_cap_per_level = kDefaultPoolCapPerLevel;
  bool strict = false;          ///< No retry.
  int num_threads = 1;          ///< Scheduling workers; 0 = hardware concurrency.
  int batch_size = 0;           ///< Respondents per tally snapshot; 0 = thread count.
  uint32_t timeout_ms = 0;      ///< Wall-clock limit; 0 = none.
  bool verbose = false;         ///< Log state transitions and retries to stderr.
};

/// @brief Result from generation.
///
/// On failure the matrix is empty: there is no partial output.
struct DesignResult {
  StudyMatrix matrix;
  bool success = false;
  DesignError error = DesignError::None;
  std::string error_message;
  uint32_t seed_used = 0;
  int attempts = 0;             ///< Scheduling passes run (1 or 2).
  int pool_cap_used = 0;        ///< Per-level cap of the last pool built.
  size_t pool_size = 0;         ///< Candidates in the last pool built.
  GenerationState final_state = GenerationState::Configured;
  ValidationReport validation;  ///< Last validation report.
  ExposureSummary exposure;     ///< Filled on success.
};

/// @brief Check a configuration before any generation work.
/// @param config Configuration to check.
/// @return Empty string when valid, otherwise the first problem.
std::string validateGeneratorConfig(const GeneratorConfig& config);

/// @brief Generate a study matrix.
///
/// State machine: Configured -> PoolBuilt -> Scheduling -> Validating ->
/// Accepted. A scheduling or validation failure moves to
/// RetryWithLargerPool once (pool cap x4) unless config.strict is set or
/// the pool already holds every feasible task; a second failure is Failed.
///
/// Errors: InvalidConfiguration for bad parameters, InfeasibleBalance when
/// the exposure tolerance cannot be met, InfeasibleDesign for an empty pool,
/// a timeout, or a matrix that still fails validation.
///
/// The same config (with a non-random seed) always yields the same matrix.
///
/// @param config Generation configuration.
/// @return DesignResult with the matrix and metadata.
DesignResult generate(const GeneratorConfig& config);

/// @brief Resolve the worker thread count (0 = hardware concurrency, at least 1).
int resolveThreadCount(int requested);

/// @brief Parse a persisted matrix and validate it against its inferred parameters.
/// @param json Matrix JSON text.
/// @param length Length of the text.
/// @param exposure_tolerance Allowed deviation as a fraction of mean exposure.
/// @param[out] matrix Parsed matrix.
/// @param[out] report Validation report (set only when parsing succeeds).
/// @param[out] error Optional parse failure reason.
/// @return False if the text is not a matrix.
bool validateMatrixJson(const char* json, size_t length, double exposure_tolerance,
                        StudyMatrix& matrix, ValidationReport& report,
                        std::string* error = nullptr);

/// @brief Build a JSON summary of a result (no matrix).
/// @param result Generation result.
/// @param config Configuration used for generation.
/// @return JSON string.
std::string buildSummaryJson(const DesignResult& result, const GeneratorConfig& config);

}  // namespace iped

#endif  // IPED_GENERATOR_H
