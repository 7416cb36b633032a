// Implementation of the study matrix generator.

#include "generator.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <thread>
#include <utility>

#include "core/json_helpers.h"
#include "core/rng_util.h"
#include "design/balance_scheduler.h"
#include "design/candidate_pool.h"
#include "design/element_set.h"
#include "design/matrix_io.h"
#include "design/task_planner.h"

namespace iped {

namespace {

constexpr int kMaxAttempts = 2;

/// @brief Record a state transition, logging it when verbose.
void enterState(DesignResult& result, GenerationState state, bool verbose) {
  result.final_state = state;
  if (verbose) {
    std::fprintf(stderr, "[generate] state -> %s\n", generationStateToString(state));
  }
}

/// @brief Mark the result as failed with no matrix.
void fail(DesignResult& result, DesignError error, std::string message, bool verbose) {
  result.success = false;
  result.error = error;
  result.error_message = std::move(message);
  result.matrix = StudyMatrix();
  enterState(result, GenerationState::Failed, verbose);
  if (verbose) {
    std::fprintf(stderr, "[generate] %s: %s\n", designErrorToString(error),
                 result.error_message.c_str());
  }
}

uint32_t resolveSeed(const GeneratorConfig& config) {
  if (config.randomize_seed) return rng::generateRandomSeed();
  if (config.seed != 0) return config.seed;
  return defaultSeedFor(config.params);
}

/// @brief Attach task ids and indices to scheduled masks.
StudyMatrix assembleMatrix(const ElementSet& elements,
                           const std::vector<std::vector<ElementMask>>& schedule) {
  StudyMatrix matrix;
  matrix.element_ids = elements.ids();
  matrix.respondents.resize(schedule.size());
  for (size_t resp = 0; resp < schedule.size(); ++resp) {
    RespondentMatrix& tasks = matrix.respondents[resp];
    tasks.reserve(schedule[resp].size());
    for (size_t pos = 0; pos < schedule[resp].size(); ++pos) {
      TaskAssignment task;
      task.task_index = static_cast<int>(pos);
      task.task_id = makeTaskId(resp, task.task_index);
      task.elements_shown = schedule[resp][pos];
      tasks.push_back(std::move(task));
    }
  }
  return matrix;
}

}  // namespace

int resolveThreadCount(int requested) {
  if (requested > 0) return requested;
  unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

std::string validateGeneratorConfig(const GeneratorConfig& config) {
  std::string params_error = validateStudyParams(config.params);
  if (!params_error.empty()) return params_error;

  if (!(config.exposure_tolerance > 0.0)) {
    return "exposure_tolerance must be positive";
  }
  if (config.pool_cap_per_level < 1 || config.pool_cap_per_level > kMaxPoolCapPerLevel) {
    return "pool_cap_per_level must be in [1, " + std::to_string(kMaxPoolCapPerLevel) + "]";
  }
  if (config.num_threads < 0) return "num_threads must be >= 0";
  if (config.batch_size < 0) return "batch_size must be >= 0";
  if (!config.element_names.empty() &&
      config.element_names.size() != static_cast<size_t>(config.params.num_elements)) {
    return "element_names has " + std::to_string(config.element_names.size()) +
           " entries, expected " + std::to_string(config.params.num_elements);
  }
  return "";
}

DesignResult generate(const GeneratorConfig& config) {
  DesignResult result;
  const bool verbose = config.verbose;
  const StudyDesignParams& params = config.params;

  std::string config_error = validateGeneratorConfig(config);
  if (!config_error.empty()) {
    fail(result, DesignError::InvalidConfiguration, config_error, verbose);
    return result;
  }

  std::string element_error;
  std::optional<ElementSet> elements =
      config.element_names.empty() ? ElementSet::create(params.num_elements, &element_error)
                                   : ElementSet::createNamed(config.element_names, &element_error);
  if (!elements) {
    fail(result, DesignError::InvalidConfiguration, element_error, verbose);
    return result;
  }

  result.seed_used = resolveSeed(config);

  const int threads = resolveThreadCount(config.num_threads);
  ScheduleOptions options;
  options.num_respondents = params.num_respondents;
  options.seed = result.seed_used;
  options.exposure_tolerance = config.exposure_tolerance;
  options.num_threads = threads;
  options.batch_size = config.batch_size > 0 ? config.batch_size : threads;
  if (config.timeout_ms > 0) {
    options.deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config.timeout_ms);
  }

  if (verbose) {
    std::fprintf(stderr,
                 "[generate] n=%d tasks=%d respondents=%d active=[%d,%d] seed=%u "
                 "threads=%d batch=%d\n",
                 params.num_elements, params.tasks_per_respondent, params.num_respondents,
                 params.min_active, params.max_active, result.seed_used, options.num_threads,
                 options.batch_size);
    uint64_t capacity =
        visibleCapacity(params.num_elements, params.min_active, params.max_active);
    if (static_cast<uint64_t>(params.tasks_per_respondent) > capacity) {
      std::fprintf(stderr,
                   "[generate] %d tasks exceed %llu distinct task vectors; "
                   "respondents will see repeats\n",
                   params.tasks_per_respondent, static_cast<unsigned long long>(capacity));
    }
  }

  int cap = config.pool_cap_per_level;
  for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    result.attempts = attempt;
    result.pool_cap_used = cap;

    PoolBuildResult built =
        buildCandidatePool(*elements, params.min_active, params.max_active, cap);
    if (!built.success) {
      fail(result, built.error, built.error_message, verbose);
      return result;
    }
    const CandidatePool& pool = built.pool;
    result.pool_size = pool.size();
    enterState(result, GenerationState::PoolBuilt, verbose);
    if (verbose) {
      std::fprintf(stderr, "[generate] attempt %d: pool of %zu candidates (cap %d/level%s)\n",
                   attempt, pool.size(), cap, pool.complete() ? ", complete" : "");
    }

    enterState(result, GenerationState::Scheduling, verbose);
    BalanceScheduler scheduler(pool, params.tasks_per_respondent);
    ScheduleResult scheduled = scheduler.scheduleStudy(options);
    if (scheduled.timed_out) {
      fail(result, DesignError::InfeasibleDesign, scheduled.error_message, verbose);
      return result;
    }

    DesignError error = scheduled.error;
    std::string message = scheduled.error_message;
    if (scheduled.success) {
      result.matrix = assembleMatrix(*elements, scheduled.respondents);
      enterState(result, GenerationState::Validating, verbose);
      result.validation = validateMatrix(result.matrix, params, config.exposure_tolerance);
      if (result.validation.valid) {
        result.success = true;
        result.error = DesignError::None;
        result.error_message.clear();
        result.exposure = summarizeExposures(result.matrix);
        enterState(result, GenerationState::Accepted, verbose);
        return result;
      }
      error = result.validation.violation == MatrixViolation::ExposureImbalance
                  ? DesignError::InfeasibleBalance
                  : DesignError::InfeasibleDesign;
      message = result.validation.message;
    }

    const int next_cap = std::min(cap * kRetryPoolCapMultiplier, kMaxPoolCapPerLevel);
    if (config.strict || attempt == kMaxAttempts || pool.complete() || next_cap == cap) {
      if (verbose && attempt < kMaxAttempts) {
        std::fprintf(stderr, "[generate] no retry (%s)\n",
                     config.strict ? "strict" : "pool cannot grow");
      }
      fail(result, error, message, verbose);
      return result;
    }

    enterState(result, GenerationState::RetryWithLargerPool, verbose);
    if (verbose) {
      std::fprintf(stderr, "[generate] %s, retrying with cap %d/level\n", message.c_str(),
                   next_cap);
    }
    cap = next_cap;
  }

  fail(result, DesignError::InfeasibleDesign, "generation did not converge", verbose);
  return result;
}

bool validateMatrixJson(const char* json, size_t length, double exposure_tolerance,
                        StudyMatrix& matrix, ValidationReport& report, std::string* error) {
  if (!matrixFromJson(json, length, matrix, error)) return false;
  report = validateInferredMatrix(matrix, exposure_tolerance);
  return true;
}

std::string buildSummaryJson(const DesignResult& result, const GeneratorConfig& config) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("num_elements");
  writer.value(config.params.num_elements);
  writer.key("tasks_per_respondent");
  writer.value(config.params.tasks_per_respondent);
  writer.key("num_respondents");
  writer.value(config.params.num_respondents);
  writer.key("min_active");
  writer.value(config.params.min_active);
  writer.key("max_active");
  writer.value(config.params.max_active);
  writer.key("exposure_tolerance");
  writer.value(config.exposure_tolerance);

  writer.key("success");
  writer.value(result.success);
  writer.key("error");
  writer.value(designErrorToString(result.error));
  if (!result.error_message.empty()) {
    writer.key("error_message");
    writer.value(result.error_message);
  }
  writer.key("state");
  writer.value(generationStateToString(result.final_state));
  writer.key("seed");
  writer.value(result.seed_used);
  writer.key("attempts");
  writer.value(result.attempts);
  writer.key("pool_cap_per_level");
  writer.value(result.pool_cap_used);
  writer.key("pool_size");
  writer.value(static_cast<int64_t>(result.pool_size));

  if (result.success) {
    const ExposureSummary& summary = result.exposure;
    writer.key("exposure");
    writer.beginObject();
    writer.key("counts");
    writer.beginArray();
    for (int64_t count : summary.counts) writer.value(count);
    writer.endArray();
    writer.key("mean");
    writer.value(summary.mean);
    writer.key("max_abs_deviation");
    writer.value(summary.max_abs_deviation);
    writer.key("relative_deviation");
    writer.value(summary.relative_deviation);
    writer.key("duplicate_sequences");
    writer.value(static_cast<int64_t>(summary.duplicate_sequences));
    writer.endObject();
  }

  writer.endObject();
  return writer.toString();
}

}  // namespace iped
