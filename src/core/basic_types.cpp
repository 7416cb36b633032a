// Implementation of basic type conversions.

#include "core/basic_types.h"

namespace iped {

const char* designErrorToString(DesignError error) {
  switch (error) {
    case DesignError::None:                 return "None";
    case DesignError::InvalidConfiguration: return "InvalidConfiguration";
    case DesignError::InfeasibleDesign:     return "InfeasibleDesign";
    case DesignError::InfeasibleBalance:    return "InfeasibleBalance";
  }
  return "Unknown";
}

const char* generationStateToString(GenerationState state) {
  switch (state) {
    case GenerationState::Configured:          return "Configured";
    case GenerationState::PoolBuilt:           return "PoolBuilt";
    case GenerationState::Scheduling:          return "Scheduling";
    case GenerationState::Validating:          return "Validating";
    case GenerationState::RetryWithLargerPool: return "RetryWithLargerPool";
    case GenerationState::Accepted:            return "Accepted";
    case GenerationState::Failed:              return "Failed";
  }
  return "Unknown";
}

}  // namespace iped
