// Tests for design/matrix_validator.h -- invariant checks on study matrices.

#include "design/matrix_validator.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace iped {
namespace {

using test_helpers::makeMatrix;

StudyDesignParams makeParams(int elements, int tasks, int respondents, int min_active,
                             int max_active) {
  StudyDesignParams params;
  params.num_elements = elements;
  params.tasks_per_respondent = tasks;
  params.num_respondents = respondents;
  params.min_active = min_active;
  params.max_active = max_active;
  return params;
}

/// 2 respondents x 4 tasks over 4 elements, every element shown 3 times.
StudyMatrix balancedMatrix() {
  return makeMatrix(4, {{0b0001, 0b0110, 0b1000, 0b0011}, {0b1100, 0b0010, 0b0101, 0b1000}});
}

// ---------------------------------------------------------------------------
// Valid input
// ---------------------------------------------------------------------------

TEST(MatrixValidatorTest, AcceptsBalancedMatrix) {
  ValidationReport report = validateMatrix(balancedMatrix(), makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_TRUE(report.valid) << report.message;
  EXPECT_EQ(report.violation, MatrixViolation::None);
}

TEST(MatrixValidatorTest, IdenticalSequencesAllowed) {
  StudyMatrix matrix = makeMatrix(4, {{0b0011, 0b1100}, {0b0011, 0b1100}});
  EXPECT_TRUE(validateMatrix(matrix, makeParams(4, 2, 2, 2, 2), 0.10).valid);
}

// ---------------------------------------------------------------------------
// Shape
// ---------------------------------------------------------------------------

TEST(MatrixValidatorTest, WrongRespondentCount) {
  ValidationReport report = validateMatrix(balancedMatrix(), makeParams(4, 4, 3, 1, 2), 0.10);
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
}

TEST(MatrixValidatorTest, WrongElementCount) {
  ValidationReport report = validateMatrix(balancedMatrix(), makeParams(5, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
}

TEST(MatrixValidatorTest, WrongTaskCount) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[1].pop_back();
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
  EXPECT_EQ(report.respondent, 1);
}

TEST(MatrixValidatorTest, BitOutsideStudy) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[0][0].elements_shown = 0b10000;
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
  EXPECT_EQ(report.task, 0);
}

// ---------------------------------------------------------------------------
// Per-task invariants
// ---------------------------------------------------------------------------

TEST(MatrixValidatorTest, ActiveCountTooHigh) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[1][2].elements_shown = 0b0111;
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ActiveCountOutOfRange);
  EXPECT_EQ(report.respondent, 1);
  EXPECT_EQ(report.task, 2);
}

TEST(MatrixValidatorTest, EmptyTaskRejected) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[0][3].elements_shown = 0;
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ActiveCountOutOfRange);
}

TEST(MatrixValidatorTest, TaskIndexGap) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[0][2].task_index = 3;
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::TaskIndexGap);
}

TEST(MatrixValidatorTest, MalformedTaskId) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[1][0].task_id = "1-0";
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::MalformedTaskId);
}

TEST(MatrixValidatorTest, TaskIdFromOtherRespondent) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[1][0].task_id = "0_0";
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.violation, MatrixViolation::MalformedTaskId);
}

// ---------------------------------------------------------------------------
// Exposure balance
// ---------------------------------------------------------------------------

TEST(MatrixValidatorTest, ExposureImbalance) {
  StudyMatrix matrix =
      makeMatrix(4, {{0b0001, 0b0001, 0b0001, 0b0001}, {0b0001, 0b0010, 0b0100, 0b0001}});
  ValidationReport report = validateMatrix(matrix, makeParams(4, 4, 2, 1, 2), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ExposureImbalance);
  EXPECT_EQ(report.respondent, -1);
  EXPECT_FALSE(report.message.empty());
}

TEST(MatrixValidatorTest, LooseToleranceAcceptsImbalance) {
  StudyMatrix matrix = makeMatrix(4, {{0b0011, 0b0001}, {0b0101, 0b1000}});
  // Counts (3,1,1,1): mean 1.5, deviation 1.5.
  EXPECT_FALSE(validateMatrix(matrix, makeParams(4, 2, 2, 1, 2), 0.10).valid);
  EXPECT_TRUE(validateMatrix(matrix, makeParams(4, 2, 2, 1, 2), 1.0).valid);
}

// ---------------------------------------------------------------------------
// inferStudyParams / names
// ---------------------------------------------------------------------------

TEST(MatrixValidatorTest, InferStudyParams) {
  StudyDesignParams params = inferStudyParams(balancedMatrix());
  EXPECT_EQ(params.num_elements, 4);
  EXPECT_EQ(params.num_respondents, 2);
  EXPECT_EQ(params.tasks_per_respondent, 4);
  EXPECT_EQ(params.min_active, 1);
  EXPECT_EQ(params.max_active, 2);
}

TEST(MatrixValidatorTest, InferredMatrixAccepted) {
  ValidationReport report = validateInferredMatrix(balancedMatrix(), 0.10);
  EXPECT_TRUE(report.valid) << report.message;
}

TEST(MatrixValidatorTest, InferredMatrixWithoutRespondents) {
  ValidationReport report = validateInferredMatrix(makeMatrix(4, {}), 0.10);
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
}

TEST(MatrixValidatorTest, InferredMatrixWithoutTasks) {
  ValidationReport report = validateInferredMatrix(makeMatrix(4, {{}}), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
  EXPECT_NE(report.message.find("tasks_per_respondent"), std::string::npos);
}

TEST(MatrixValidatorTest, InferredMatrixTooFewElements) {
  ValidationReport report = validateInferredMatrix(makeMatrix(1, {{0b1}}), 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ShapeMismatch);
  EXPECT_NE(report.message.find("num_elements"), std::string::npos);
}

TEST(MatrixValidatorTest, InferredMatrixEmptyTaskIsActiveCountViolation) {
  StudyMatrix matrix = balancedMatrix();
  matrix.respondents[0][1].elements_shown = 0;
  ValidationReport report = validateInferredMatrix(matrix, 0.10);
  EXPECT_EQ(report.violation, MatrixViolation::ActiveCountOutOfRange);
  EXPECT_EQ(report.respondent, 0);
  EXPECT_EQ(report.task, 1);
}

TEST(MatrixValidatorTest, ViolationNames) {
  EXPECT_STREQ(matrixViolationToString(MatrixViolation::None), "None");
  EXPECT_STREQ(matrixViolationToString(MatrixViolation::TaskIndexGap), "TaskIndexGap");
  EXPECT_STREQ(matrixViolationToString(MatrixViolation::ExposureImbalance), "ExposureImbalance");
}

}  // namespace
}  // namespace iped
