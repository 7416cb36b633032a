// Basic types for IPED task-matrix generation.

#ifndef IPED_CORE_BASIC_TYPES_H
#define IPED_CORE_BASIC_TYPES_H

#include <cstdint>

namespace iped {

/// Bitmask over the elements of one study. Bit i set = element i shown.
/// kMaxElements is 16, so every task vector fits in 16 bits.
using ElementMask = uint16_t;

// ---------------------------------------------------------------------------
// Study parameter ranges
// ---------------------------------------------------------------------------

constexpr int kMinElements = 4;
constexpr int kMaxElements = 16;
constexpr int kMinTasksPerRespondent = 1;
constexpr int kMaxTasksPerRespondent = 100;
constexpr int kMinRespondents = 1;
constexpr int kMaxRespondents = 10000;

// ---------------------------------------------------------------------------
// Generation defaults
// ---------------------------------------------------------------------------

/// Allowed exposure deviation as a fraction of the mean exposure.
constexpr double kDefaultExposureTolerance = 0.10;

/// Candidates kept per active-count level before switching to sampling.
constexpr int kDefaultPoolCapPerLevel = 128;

/// Pool cap growth applied on the single automatic retry.
constexpr int kRetryPoolCapMultiplier = 4;

/// Largest per-level cap accepted from configuration. C(16, 8) = 12870.
constexpr int kMaxPoolCapPerLevel = 16384;

// ---------------------------------------------------------------------------
// Element mask helpers
// ---------------------------------------------------------------------------

/// @brief Count active elements in a task vector.
/// @param mask Element mask.
/// @return Number of set bits.
inline int activeCount(ElementMask mask) {
  int count = 0;
  uint32_t bits = mask;
  while (bits != 0) {
    bits &= bits - 1;
    ++count;
  }
  return count;
}

/// @brief Check whether an element is shown in a task vector.
/// @param mask Element mask.
/// @param element Zero-based element index.
inline bool isShown(ElementMask mask, int element) {
  return ((static_cast<uint32_t>(mask) >> element) & 1u) != 0;
}

/// @brief Mask with the lowest num_elements bits set.
inline ElementMask fullMask(int num_elements) {
  return static_cast<ElementMask>((1u << num_elements) - 1u);
}

// ---------------------------------------------------------------------------
// Error and state enums
// ---------------------------------------------------------------------------

/// @brief Typed failure reported by generation and validation.
enum class DesignError : uint8_t {
  None,                  ///< Success.
  InvalidConfiguration,  ///< Out-of-range parameters, rejected before generation.
  InfeasibleDesign,      ///< No candidates, timeout, or retried output still invalid.
  InfeasibleBalance      ///< Exposure tolerance not met after the pool was exhausted.
};

/// @brief Lifecycle of one generation request.
///
/// Configured -> PoolBuilt -> Scheduling -> Validating -> Accepted, with a
/// single RetryWithLargerPool detour back to Scheduling. Failed is terminal.
enum class GenerationState : uint8_t {
  Configured,
  PoolBuilt,
  Scheduling,
  Validating,
  RetryWithLargerPool,
  Accepted,
  Failed
};

/// @brief Convert DesignError to string.
const char* designErrorToString(DesignError error);

/// @brief Convert GenerationState to string.
const char* generationStateToString(GenerationState state);

}  // namespace iped

#endif  // IPED_CORE_BASIC_TYPES_H
