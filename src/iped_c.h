// C API for FFI bindings and survey back ends.

#ifndef IPED_C_H
#define IPED_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a generator instance.
typedef void* IpedHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  IPED_OK = 0,
  IPED_ERROR_INVALID_PARAM = 1,          ///< Null handle or input.
  IPED_ERROR_INVALID_CONFIGURATION = 2,  ///< Study parameters out of range.
  IPED_ERROR_INFEASIBLE_DESIGN = 3,      ///< No feasible task pool, timeout, or invalid matrix.
  IPED_ERROR_INFEASIBLE_BALANCE = 4,     ///< Exposure tolerance could not be met.
  IPED_ERROR_INVALID_MATRIX = 5,         ///< Persisted matrix is malformed or violates an invariant.
} IpedError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Matrix JSON output.
typedef struct {
  char* json;     ///< JSON string
  size_t length;  ///< String length
} IpedMatrixData;

/// @brief Generation info.
typedef struct {
  uint32_t seed_used;             ///< Seed used for generation
  uint8_t attempts;               ///< Scheduling passes (1 or 2)
  int32_t pool_cap_per_level;     ///< Per-level cap of the final pool
  uint32_t pool_size;             ///< Candidates in the final pool
  uint8_t num_elements;
  uint16_t tasks_per_respondent;  ///< Resolved task count
  uint16_t num_respondents;
  double mean_exposure;           ///< Mean exposures per element
  double max_abs_deviation;       ///< Largest |count - mean|
  double relative_deviation;      ///< max_abs_deviation / mean
  uint32_t duplicate_sequences;   ///< Respondents repeating an earlier sequence
} IpedInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new generator instance.
/// @return Handle (must be freed with iped_destroy)
IpedHandle iped_create(void);

/// @brief Destroy a generator instance.
/// @param handle Handle to destroy
void iped_destroy(IpedHandle handle);

// ============================================================================
// Generation
// ============================================================================

/// @brief Generate a study matrix from a JSON config string.
///
/// JSON fields (all optional, defaults applied):
///   num_elements: number (4-16, default 4)
///   tasks_per_respondent: number (1-100, 0 or absent = recommended)
///   num_respondents: number (1-10000, default 1)
///   min_active / max_active: number (default 1)
///   element_names: array of strings (num_elements entries)
///   seed: number (0 = derived from the parameters)
///   randomize_seed: boolean
///   exposure_tolerance: number (default 0.10)
///   pool_cap_per_level: number (default 128)
///   strict: boolean (no retry)
///   num_threads: number (0 = hardware concurrency, default 1)
///   batch_size: number (0 = thread count)
///   timeout_ms: number (0 = none)
///
/// @param handle Handle
/// @param json JSON config string
/// @param length Length of the JSON string
/// @return IPED_OK on success
IpedError iped_generate_from_json(IpedHandle handle, const char* json, size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the generated matrix as JSON.
/// @param handle Handle
/// @return MatrixData (must be freed with iped_free_matrix), or NULL
IpedMatrixData* iped_get_matrix(IpedHandle handle);

/// @brief Free matrix data.
/// @param data Pointer returned by iped_get_matrix
void iped_free_matrix(IpedMatrixData* data);

/// @brief Get generation info.
/// @param handle Handle
/// @return Pointer to static IpedInfo (valid until next call, do not free)
IpedInfo* iped_get_info(IpedHandle handle);

/// @brief Get the message of the last failed call on this handle.
/// @param handle Handle
/// @return Message owned by the handle ("" if none)
const char* iped_last_message(IpedHandle handle);

// ============================================================================
// Validation
// ============================================================================

/// @brief Re-validate a persisted matrix.
///
/// Study parameters are inferred from the matrix itself; the reason for a
/// failure is available through iped_last_message().
///
/// @param handle Handle
/// @param json Matrix JSON
/// @param length Length of the JSON string
/// @param exposure_tolerance Allowed deviation as a fraction of mean (<= 0 = default)
/// @return IPED_OK if the matrix is valid, IPED_ERROR_INVALID_MATRIX otherwise
IpedError iped_validate_json(IpedHandle handle, const char* json, size_t length,
                             double exposure_tolerance);

// ============================================================================
// Planning
// ============================================================================

/// @brief Recommended tasks per respondent for an element count.
uint16_t iped_recommend_tasks(uint8_t num_elements);

/// @brief Number of distinct task vectors with active count in [min_active, max_active].
uint64_t iped_visible_capacity(uint8_t num_elements, uint8_t min_active, uint8_t max_active);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* iped_error_string(IpedError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* iped_version(void);

#ifdef __cplusplus
}
#endif

#endif  // IPED_C_H
