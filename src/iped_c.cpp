// Implementation of C API for FFI bindings.

#include "iped_c.h"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/version_info.h"
#include "design/matrix_io.h"
#include "design/task_planner.h"
#include "generator.h"

namespace {

/// @brief Internal state held per IpedHandle.
struct IpedInstance {
  iped::GeneratorConfig config;
  iped::DesignResult result;
  std::string matrix_json;
  std::string last_message;
  bool has_result = false;
};

/// @brief Parse a GeneratorConfig from a JSON key-value map.
iped::GeneratorConfig configFromJson(const std::map<std::string, iped::JsonValue>& kv) {
  iped::GeneratorConfig config;
  iped::StudyDesignParams& params = config.params;

  auto it = kv.find("num_elements");
  if (it != kv.end()) params.num_elements = it->second.asInt(params.num_elements);

  it = kv.find("num_respondents");
  if (it != kv.end()) params.num_respondents = it->second.asInt(params.num_respondents);

  it = kv.find("min_active");
  if (it != kv.end()) params.min_active = it->second.asInt(params.min_active);

  it = kv.find("max_active");
  if (it != kv.end()) params.max_active = it->second.asInt(params.max_active);

  params.tasks_per_respondent = 0;
  it = kv.find("tasks_per_respondent");
  if (it != kv.end()) params.tasks_per_respondent = it->second.asInt(0);
  if (params.tasks_per_respondent == 0) {
    params.tasks_per_respondent = iped::recommendTasksPerRespondent(params.num_elements);
  }

  it = kv.find("element_names");
  if (it != kv.end() && it->second.type == iped::JsonValue::Array) {
    for (const auto& name : it->second.array_items) {
      config.element_names.push_back(name.asString());
    }
  }

  it = kv.find("seed");
  if (it != kv.end()) config.seed = it->second.asUint(0);

  it = kv.find("randomize_seed");
  if (it != kv.end()) config.randomize_seed = it->second.asBool(false);

  it = kv.find("exposure_tolerance");
  if (it != kv.end()) config.exposure_tolerance = it->second.asDouble(config.exposure_tolerance);

  it = kv.find("pool_cap_per_level");
  if (it != kv.end()) config.pool_cap_per_level = it->second.asInt(config.pool_cap_per_level);

  it = kv.find("strict");
  if (it != kv.end()) config.strict = it->second.asBool(false);

  it = kv.find("num_threads");
  if (it != kv.end()) config.num_threads = it->second.asInt(config.num_threads);

  it = kv.find("batch_size");
  if (it != kv.end()) config.batch_size = it->second.asInt(config.batch_size);

  it = kv.find("timeout_ms");
  if (it != kv.end()) config.timeout_ms = it->second.asUint(0);

  return config;
}

IpedError toIpedError(iped::DesignError error) {
  switch (error) {
    case iped::DesignError::None:                 return IPED_OK;
    case iped::DesignError::InvalidConfiguration: return IPED_ERROR_INVALID_CONFIGURATION;
    case iped::DesignError::InfeasibleDesign:     return IPED_ERROR_INFEASIBLE_DESIGN;
    case iped::DesignError::InfeasibleBalance:    return IPED_ERROR_INFEASIBLE_BALANCE;
  }
  return IPED_ERROR_INFEASIBLE_DESIGN;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

IpedHandle iped_create(void) {
  return new IpedInstance();
}

void iped_destroy(IpedHandle handle) {
  delete static_cast<IpedInstance*>(handle);
}

// ============================================================================
// Generation
// ============================================================================

IpedError iped_generate_from_json(IpedHandle handle, const char* json, size_t length) {
  if (!handle || !json) {
    return IPED_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<IpedInstance*>(handle);
  instance->has_result = false;
  instance->matrix_json.clear();
  instance->last_message.clear();

  auto kv = iped::parseJsonObject(json, length);
  instance->config = configFromJson(kv);

  instance->result = iped::generate(instance->config);
  if (!instance->result.success) {
    instance->last_message = instance->result.error_message;
    return toIpedError(instance->result.error);
  }

  instance->matrix_json = iped::matrixToJson(instance->result.matrix);
  instance->has_result = true;
  return IPED_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

IpedMatrixData* iped_get_matrix(IpedHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<IpedInstance*>(handle);
  if (!instance->has_result) return nullptr;

  auto* result = static_cast<IpedMatrixData*>(malloc(sizeof(IpedMatrixData)));
  if (!result) return nullptr;

  result->length = instance->matrix_json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, instance->matrix_json.c_str(), result->length + 1);
  return result;
}

void iped_free_matrix(IpedMatrixData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// Static buffer for info queries
static IpedInfo s_info;

IpedInfo* iped_get_info(IpedHandle handle) {
  s_info = {};
  if (!handle) return &s_info;

  auto* instance = static_cast<IpedInstance*>(handle);
  if (!instance->has_result) return &s_info;

  const iped::DesignResult& result = instance->result;
  const iped::StudyDesignParams& params = instance->config.params;
  s_info.seed_used = result.seed_used;
  s_info.attempts = static_cast<uint8_t>(result.attempts);
  s_info.pool_cap_per_level = result.pool_cap_used;
  s_info.pool_size = static_cast<uint32_t>(result.pool_size);
  s_info.num_elements = static_cast<uint8_t>(params.num_elements);
  s_info.tasks_per_respondent = static_cast<uint16_t>(params.tasks_per_respondent);
  s_info.num_respondents = static_cast<uint16_t>(params.num_respondents);
  s_info.mean_exposure = result.exposure.mean;
  s_info.max_abs_deviation = result.exposure.max_abs_deviation;
  s_info.relative_deviation = result.exposure.relative_deviation;
  s_info.duplicate_sequences = static_cast<uint32_t>(result.exposure.duplicate_sequences);

  return &s_info;
}

const char* iped_last_message(IpedHandle handle) {
  if (!handle) return "";
  return static_cast<IpedInstance*>(handle)->last_message.c_str();
}

// ============================================================================
// Validation
// ============================================================================

IpedError iped_validate_json(IpedHandle handle, const char* json, size_t length,
                             double exposure_tolerance) {
  if (!handle || !json) {
    return IPED_ERROR_INVALID_PARAM;
  }
  auto* instance = static_cast<IpedInstance*>(handle);
  instance->last_message.clear();

  if (exposure_tolerance <= 0.0) exposure_tolerance = iped::kDefaultExposureTolerance;

  iped::StudyMatrix matrix;
  iped::ValidationReport report;
  std::string parse_error;
  if (!iped::validateMatrixJson(json, length, exposure_tolerance, matrix, report,
                                &parse_error)) {
    instance->last_message = parse_error;
    return IPED_ERROR_INVALID_MATRIX;
  }
  if (!report.valid) {
    instance->last_message = std::string(iped::matrixViolationToString(report.violation)) +
                             ": " + report.message;
    return IPED_ERROR_INVALID_MATRIX;
  }
  return IPED_OK;
}

// ============================================================================
// Planning
// ============================================================================

uint16_t iped_recommend_tasks(uint8_t num_elements) {
  return static_cast<uint16_t>(iped::recommendTasksPerRespondent(num_elements));
}

uint64_t iped_visible_capacity(uint8_t num_elements, uint8_t min_active, uint8_t max_active) {
  return iped::visibleCapacity(num_elements, min_active, max_active);
}

// ============================================================================
// Error Handling
// ============================================================================

const char* iped_error_string(IpedError error) {
  switch (error) {
    case IPED_OK: return "No error";
    case IPED_ERROR_INVALID_PARAM: return "Invalid parameter";
    case IPED_ERROR_INVALID_CONFIGURATION: return "Invalid study configuration";
    case IPED_ERROR_INFEASIBLE_DESIGN: return "Infeasible design";
    case IPED_ERROR_INFEASIBLE_BALANCE: return "Exposure balance not achievable";
    case IPED_ERROR_INVALID_MATRIX: return "Invalid matrix";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* iped_version(void) {
  return IPED_VERSION;
}

}  // extern "C"
