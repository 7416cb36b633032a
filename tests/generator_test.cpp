// Tests for generator.h -- end-to-end generation, error mapping, retry,
// determinism and threading.

#include "generator.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

#include "core/basic_types.h"
#include "design/matrix_io.h"
#include "design/task_planner.h"
#include "test_helpers.h"

namespace iped {
namespace {

// ---------------------------------------------------------------------------
// Test helpers
// ---------------------------------------------------------------------------

/// @brief Create a GeneratorConfig for testing.
/// @param seed Random seed (default 42 for deterministic tests).
GeneratorConfig makeTestConfig(int elements, int tasks, int respondents, int min_active,
                               int max_active, uint32_t seed = 42) {
  GeneratorConfig config;
  config.params.num_elements = elements;
  config.params.tasks_per_respondent = tasks;
  config.params.num_respondents = respondents;
  config.params.min_active = min_active;
  config.params.max_active = max_active;
  config.seed = seed;
  return config;
}

// ---------------------------------------------------------------------------
// End-to-end scenarios
// ---------------------------------------------------------------------------

TEST(GeneratorTest, SmallStudyShape) {
  DesignResult result = generate(makeTestConfig(4, 4, 2, 1, 2));
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.final_state, GenerationState::Accepted);
  EXPECT_EQ(result.seed_used, 42u);

  const StudyMatrix& matrix = result.matrix;
  ASSERT_EQ(matrix.numRespondents(), 2u);
  std::set<std::string> ids;
  for (size_t resp = 0; resp < 2; ++resp) {
    ASSERT_EQ(matrix.respondents[resp].size(), 4u);
    for (int pos = 0; pos < 4; ++pos) {
      const TaskAssignment& task = matrix.respondents[resp][static_cast<size_t>(pos)];
      EXPECT_EQ(task.task_index, pos);
      EXPECT_EQ(task.task_id, std::to_string(resp) + "_" + std::to_string(pos));
      int active = activeCount(task.elements_shown);
      EXPECT_GE(active, 1);
      EXPECT_LE(active, 2);
      ids.insert(task.task_id);
    }
  }
  EXPECT_EQ(ids, (std::set<std::string>{"0_0", "0_1", "0_2", "0_3", "1_0", "1_1", "1_2", "1_3"}));
  EXPECT_EQ(matrix.element_ids, (std::vector<std::string>{"E1", "E2", "E3", "E4"}));
}

TEST(GeneratorTest, MinAboveMaxIsInvalidConfiguration) {
  DesignResult result = generate(makeTestConfig(4, 4, 2, 5, 4));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, DesignError::InvalidConfiguration);
  EXPECT_EQ(result.final_state, GenerationState::Failed);
  EXPECT_EQ(result.matrix.numRespondents(), 0u);
}

TEST(GeneratorTest, FullActiveRangeSucceeds) {
  DesignResult result = generate(makeTestConfig(4, 6, 3, 1, 4));
  ASSERT_TRUE(result.success) << result.error_message;
  for (const auto& tasks : result.matrix.respondents) {
    for (const auto& task : tasks) {
      EXPECT_GE(activeCount(task.elements_shown), 1);
      EXPECT_LE(activeCount(task.elements_shown), 4);
    }
  }
}

TEST(GeneratorTest, AllShownRepeatsOnlyTask) {
  DesignResult result = generate(makeTestConfig(4, 50, 1, 4, 4));
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.matrix.respondents[0].size(), 50u);
  for (const auto& task : result.matrix.respondents[0]) {
    EXPECT_EQ(task.elements_shown, 0x0F);
  }
}

TEST(GeneratorTest, MediumStudyBalanced) {
  GeneratorConfig config = makeTestConfig(6, 24, 100, 2, 4);
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_TRUE(result.validation.valid);
  EXPECT_LE(result.exposure.max_abs_deviation,
            std::max(config.exposure_tolerance * result.exposure.mean, 1.0) + 1e-9);
  EXPECT_EQ(test_helpers::totalTaskCount(result.matrix), 2400u);
}

TEST(GeneratorTest, LargeElementCountUsesSampledPool) {
  GeneratorConfig config = makeTestConfig(16, 20, 40, 4, 8);
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.pool_size, static_cast<size_t>(5 * kDefaultPoolCapPerLevel));
}

// ---------------------------------------------------------------------------
// Parameter validation
// ---------------------------------------------------------------------------

TEST(GeneratorTest, OutOfRangeParametersRejected) {
  EXPECT_EQ(generate(makeTestConfig(3, 4, 2, 1, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(17, 4, 2, 1, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 0, 2, 1, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 101, 2, 1, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 4, 0, 1, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 4, 10001, 1, 2)).error,
            DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 4, 2, 0, 2)).error, DesignError::InvalidConfiguration);
  EXPECT_EQ(generate(makeTestConfig(4, 4, 2, 1, 5)).error, DesignError::InvalidConfiguration);
}

TEST(GeneratorTest, InvalidTuningRejected) {
  GeneratorConfig config = makeTestConfig(4, 4, 2, 1, 2);
  config.exposure_tolerance = 0.0;
  EXPECT_EQ(generate(config).error, DesignError::InvalidConfiguration);

  config = makeTestConfig(4, 4, 2, 1, 2);
  config.pool_cap_per_level = 0;
  EXPECT_EQ(generate(config).error, DesignError::InvalidConfiguration);

  config = makeTestConfig(4, 4, 2, 1, 2);
  config.num_threads = -1;
  EXPECT_EQ(generate(config).error, DesignError::InvalidConfiguration);

  config = makeTestConfig(4, 4, 2, 1, 2);
  config.element_names = {"a", "b"};
  EXPECT_EQ(generate(config).error, DesignError::InvalidConfiguration);

  config = makeTestConfig(4, 4, 2, 1, 2);
  config.element_names = {"a", "b", "a", "c"};
  EXPECT_EQ(generate(config).error, DesignError::InvalidConfiguration);
}

TEST(GeneratorTest, ValidateGeneratorConfigMessage) {
  GeneratorConfig config = makeTestConfig(4, 4, 2, 1, 2);
  EXPECT_EQ(validateGeneratorConfig(config), "");
  config.batch_size = -3;
  EXPECT_NE(validateGeneratorConfig(config).find("batch_size"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Seeds and determinism
// ---------------------------------------------------------------------------

TEST(GeneratorTest, SameSeedSameOutput) {
  GeneratorConfig config = makeTestConfig(8, 12, 50, 2, 5);
  DesignResult first = generate(config);
  DesignResult second = generate(config);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(matrixToJson(first.matrix), matrixToJson(second.matrix));
}

TEST(GeneratorTest, DifferentSeedDifferentOutput) {
  DesignResult first = generate(makeTestConfig(8, 12, 50, 2, 5, 42));
  DesignResult second = generate(makeTestConfig(8, 12, 50, 2, 5, 7));
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_NE(matrixToJson(first.matrix), matrixToJson(second.matrix));
}

TEST(GeneratorTest, ZeroSeedDerivedFromParams) {
  GeneratorConfig config = makeTestConfig(6, 8, 20, 1, 3, 0);
  DesignResult first = generate(config);
  DesignResult second = generate(config);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.seed_used, defaultSeedFor(config.params));
  EXPECT_EQ(first.seed_used, second.seed_used);
  EXPECT_EQ(matrixToJson(first.matrix), matrixToJson(second.matrix));
}

TEST(GeneratorTest, RandomizeSeedReported) {
  GeneratorConfig config = makeTestConfig(6, 8, 20, 1, 3);
  config.randomize_seed = true;
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_NE(result.seed_used, 0u);

  // Replaying the reported seed reproduces the matrix.
  GeneratorConfig replay = makeTestConfig(6, 8, 20, 1, 3, result.seed_used);
  EXPECT_EQ(matrixToJson(generate(replay).matrix), matrixToJson(result.matrix));
}

// ---------------------------------------------------------------------------
// Threading
// ---------------------------------------------------------------------------

TEST(GeneratorTest, ThreadCountDoesNotChangeOutput) {
  GeneratorConfig serial = makeTestConfig(10, 15, 200, 2, 6);
  serial.batch_size = 16;
  GeneratorConfig parallel = serial;
  parallel.num_threads = 4;

  DesignResult first = generate(serial);
  DesignResult second = generate(parallel);
  ASSERT_TRUE(first.success) << first.error_message;
  ASSERT_TRUE(second.success) << second.error_message;
  EXPECT_EQ(matrixToJson(first.matrix), matrixToJson(second.matrix));
}

TEST(GeneratorTest, HardwareConcurrencyThreads) {
  GeneratorConfig config = makeTestConfig(6, 10, 64, 2, 4);
  config.num_threads = 0;
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_TRUE(result.validation.valid);
}

TEST(GeneratorTest, ResolveThreadCount) {
  EXPECT_EQ(resolveThreadCount(3), 3);
  EXPECT_GE(resolveThreadCount(0), 1);
}

// ---------------------------------------------------------------------------
// Retry and failure modes
// ---------------------------------------------------------------------------

TEST(GeneratorTest, RetryGrowsPoolCap) {
  // One sampled candidate per level cannot balance 16 elements; the retry
  // builds a 4x pool.
  GeneratorConfig config = makeTestConfig(16, 20, 50, 8, 8);
  config.pool_cap_per_level = 1;
  DesignResult result = generate(config);
  EXPECT_EQ(result.attempts, 2);
  EXPECT_EQ(result.pool_cap_used, kRetryPoolCapMultiplier);
  EXPECT_EQ(result.pool_size, static_cast<size_t>(kRetryPoolCapMultiplier));
}

TEST(GeneratorTest, StrictSkipsRetry) {
  GeneratorConfig config = makeTestConfig(16, 20, 50, 8, 8);
  config.pool_cap_per_level = 1;
  config.strict = true;
  DesignResult result = generate(config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, DesignError::InfeasibleBalance);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(result.final_state, GenerationState::Failed);
  EXPECT_EQ(result.matrix.numRespondents(), 0u);
}

TEST(GeneratorTest, ToleranceFloorAcceptsSmallStudy) {
  // 6 exposures over 5 elements cannot be closer than (2,1,1,1,1): a
  // deviation of 0.8 passes only because the allowance never drops below 1.
  GeneratorConfig config = makeTestConfig(5, 3, 1, 2, 2);
  config.exposure_tolerance = 0.01;
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.attempts, 1);
  EXPECT_NEAR(result.exposure.max_abs_deviation, 0.8, 1e-9);
}

TEST(GeneratorTest, SmallCompletePoolsBalance) {
  // Every 2-of-4 and 4-of-8 subset is in the pool, so there is no retry:
  // the scheduler alone must reach counts within one exposure of the mean.
  const StudyDesignParams shapes[] = {{4, 5, 3, 2, 2}, {8, 7, 3, 4, 4}, {4, 5, 5, 2, 2}};
  for (const StudyDesignParams& shape : shapes) {
    GeneratorConfig config;
    config.params = shape;
    DesignResult result = generate(config);
    EXPECT_TRUE(result.success) << shape.num_elements << " elements, "
                                << shape.tasks_per_respondent << " tasks: "
                                << result.error_message;
    EXPECT_EQ(result.attempts, 1);
  }
}

TEST(GeneratorTest, TimeoutIsInfeasibleDesign) {
  GeneratorConfig config = makeTestConfig(16, 100, 10000, 1, 16);
  config.timeout_ms = 1;
  DesignResult result = generate(config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, DesignError::InfeasibleDesign);
  EXPECT_NE(result.error_message.find("timed out"), std::string::npos);
  EXPECT_EQ(result.matrix.numRespondents(), 0u);
}

// ---------------------------------------------------------------------------
// Element names and summary
// ---------------------------------------------------------------------------

TEST(GeneratorTest, CustomElementNames) {
  GeneratorConfig config = makeTestConfig(4, 4, 2, 1, 2);
  config.element_names = {"price", "brand", "size", "color"};
  DesignResult result = generate(config);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.matrix.element_ids, config.element_names);
  EXPECT_NE(matrixToJson(result.matrix).find("\"brand\":"), std::string::npos);
}

TEST(GeneratorTest, NamesDoNotChangeSchedule) {
  GeneratorConfig plain = makeTestConfig(4, 4, 2, 1, 2);
  GeneratorConfig named = plain;
  named.element_names = {"a", "b", "c", "d"};
  DesignResult first = generate(plain);
  DesignResult second = generate(named);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  for (size_t resp = 0; resp < 2; ++resp) {
    for (size_t pos = 0; pos < 4; ++pos) {
      EXPECT_EQ(first.matrix.respondents[resp][pos].elements_shown,
                second.matrix.respondents[resp][pos].elements_shown);
    }
  }
}

TEST(GeneratorTest, ExposureSummaryFilled) {
  DesignResult result = generate(makeTestConfig(6, 10, 30, 2, 3));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.exposure.counts.size(), 6u);
  int64_t total = 0;
  for (int64_t count : result.exposure.counts) total += count;
  EXPECT_DOUBLE_EQ(result.exposure.mean, static_cast<double>(total) / 6.0);
}

TEST(GeneratorTest, SummaryJson) {
  GeneratorConfig config = makeTestConfig(4, 4, 2, 1, 2);
  DesignResult result = generate(config);
  std::string json = buildSummaryJson(result, config);
  EXPECT_NE(json.find("\"success\":true"), std::string::npos);
  EXPECT_NE(json.find("\"seed\":42"), std::string::npos);
  EXPECT_NE(json.find("\"state\":\"Accepted\""), std::string::npos);
  EXPECT_NE(json.find("\"exposure\":{"), std::string::npos);
}

TEST(GeneratorTest, SummaryJsonOnFailure) {
  GeneratorConfig config = makeTestConfig(4, 4, 2, 5, 4);
  DesignResult result = generate(config);
  std::string json = buildSummaryJson(result, config);
  EXPECT_NE(json.find("\"error\":\"InvalidConfiguration\""), std::string::npos);
  EXPECT_EQ(json.find("\"exposure\""), std::string::npos);
}

// ---------------------------------------------------------------------------
// Persisted matrix validation
// ---------------------------------------------------------------------------

TEST(GeneratorTest, GeneratedMatrixRevalidates) {
  DesignResult result = generate(makeTestConfig(7, 9, 40, 2, 5));
  ASSERT_TRUE(result.success);
  std::string json = matrixToJson(result.matrix);

  StudyMatrix loaded;
  ValidationReport report;
  std::string error;
  ASSERT_TRUE(validateMatrixJson(json.data(), json.size(), kDefaultExposureTolerance, loaded,
                                 report, &error))
      << error;
  EXPECT_TRUE(report.valid) << report.message;
  EXPECT_EQ(loaded.numRespondents(), 40u);
}

TEST(GeneratorTest, TamperedMatrixFailsRevalidation) {
  DesignResult result = generate(makeTestConfig(4, 4, 2, 1, 2));
  ASSERT_TRUE(result.success);
  result.matrix.respondents[1][2].task_index = 7;
  std::string json = matrixToJson(result.matrix);

  StudyMatrix loaded;
  ValidationReport report;
  ASSERT_TRUE(validateMatrixJson(json.data(), json.size(), kDefaultExposureTolerance, loaded,
                                 report));
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.violation, MatrixViolation::TaskIndexGap);
}

TEST(GeneratorTest, PersistedMatrixOutsideParameterRangesRejected) {
  const std::string inputs[] = {
      "{}",
      R"({"0": []})",
      R"({"0": [{"task_id": "0_0", "elements_shown": {"E1": 1}, "task_index": 0}]})",
  };
  for (const std::string& json : inputs) {
    StudyMatrix loaded;
    ValidationReport report;
    ASSERT_TRUE(validateMatrixJson(json.data(), json.size(), kDefaultExposureTolerance, loaded,
                                   report))
        << json;
    EXPECT_FALSE(report.valid) << json;
    EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch) << json;
  }
}

}  // namespace
}  // namespace iped
