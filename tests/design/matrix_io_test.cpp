// Tests for design/matrix_io.h -- matrix JSON layout and loading.

#include "design/matrix_io.h"

#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"

namespace iped {
namespace {

using test_helpers::makeMatrix;

bool load(const std::string& json, StudyMatrix& matrix, std::string* error = nullptr) {
  return matrixFromJson(json.data(), json.size(), matrix, error);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

TEST(MatrixIoTest, SerializedLayout) {
  StudyMatrix matrix = makeMatrix(4, {{0b0001, 0b0110}});
  EXPECT_EQ(matrixToJson(matrix),
            R"({"0":[)"
            R"({"task_id":"0_0","elements_shown":{"E1":1,"E2":0,"E3":0,"E4":0},"task_index":0},)"
            R"({"task_id":"0_1","elements_shown":{"E1":0,"E2":1,"E3":1,"E4":0},"task_index":1}]})");
}

TEST(MatrixIoTest, RespondentKeysInNumericOrder) {
  std::vector<std::vector<ElementMask>> masks(12, std::vector<ElementMask>{0b0001});
  std::string json = matrixToJson(makeMatrix(4, masks));
  size_t pos_2 = json.find("\"2\":");
  size_t pos_10 = json.find("\"10\":");
  ASSERT_NE(pos_2, std::string::npos);
  ASSERT_NE(pos_10, std::string::npos);
  EXPECT_LT(pos_2, pos_10);
}

TEST(MatrixIoTest, CustomElementNames) {
  StudyMatrix matrix = makeMatrix(4, {{0b1000}});
  matrix.element_ids = {"price", "brand", "size", "color"};
  std::string json = matrixToJson(matrix);
  EXPECT_NE(json.find(R"("elements_shown":{"price":0,"brand":0,"size":0,"color":1})"),
            std::string::npos);
}

TEST(MatrixIoTest, PrettyOutputReloads) {
  StudyMatrix matrix = makeMatrix(5, {{0b00011, 0b11000}, {0b00100, 0b01001}});
  std::string pretty = matrixToJson(matrix, true);
  EXPECT_NE(pretty.find('\n'), std::string::npos);

  StudyMatrix loaded;
  ASSERT_TRUE(load(pretty, loaded));
  EXPECT_EQ(matrixToJson(loaded), matrixToJson(matrix));
}

TEST(MatrixIoTest, EmptyMatrix) {
  EXPECT_EQ(matrixToJson(makeMatrix(4, {})), "{}");
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

TEST(MatrixIoTest, LoadsRespondentsInAnyKeyOrder) {
  const std::string json =
      R"({"1": [{"task_id": "1_0", "elements_shown": {"A": 0, "B": 1, "C": 0, "D": 0}, "task_index": 0}],)"
      R"( "0": [{"task_id": "0_0", "elements_shown": {"A": 1, "B": 0, "C": 0, "D": 1}, "task_index": 0}]})";
  StudyMatrix matrix;
  std::string error;
  ASSERT_TRUE(load(json, matrix, &error)) << error;
  ASSERT_EQ(matrix.numRespondents(), 2u);
  EXPECT_EQ(matrix.element_ids, (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_EQ(matrix.respondents[0][0].elements_shown, 0b1001);
  EXPECT_EQ(matrix.respondents[1][0].elements_shown, 0b0010);
  EXPECT_EQ(matrix.respondents[1][0].task_id, "1_0");
}

TEST(MatrixIoTest, ElementKeyOrderPerTaskMayDiffer) {
  const std::string json =
      R"({"0": [{"task_id": "0_0", "elements_shown": {"A": 1, "B": 0, "C": 0, "D": 0}, "task_index": 0},)"
      R"(        {"task_id": "0_1", "elements_shown": {"D": 1, "C": 0, "B": 0, "A": 0}, "task_index": 1}]})";
  StudyMatrix matrix;
  ASSERT_TRUE(load(json, matrix));
  EXPECT_EQ(matrix.respondents[0][1].elements_shown, 0b1000);
}

TEST(MatrixIoTest, RejectsNonObjectRoot) {
  StudyMatrix matrix;
  std::string error;
  EXPECT_FALSE(load("[]", matrix, &error));
  EXPECT_NE(error.find("object"), std::string::npos);
}

TEST(MatrixIoTest, RejectsInvalidJson) {
  StudyMatrix matrix;
  std::string error;
  EXPECT_FALSE(load(R"({"0": [)", matrix, &error));
  EXPECT_NE(error.find("invalid JSON"), std::string::npos);
}

TEST(MatrixIoTest, RejectsBadRespondentKeys) {
  StudyMatrix matrix;
  EXPECT_FALSE(load(R"({"x": []})", matrix));
  EXPECT_FALSE(load(R"({"01": []})", matrix));
  EXPECT_FALSE(load(R"({"0": [], "2": []})", matrix));
  EXPECT_FALSE(load(R"({"0": [], "0": []})", matrix));
}

TEST(MatrixIoTest, RejectsNonBinaryFlag) {
  const std::string json =
      R"({"0": [{"task_id": "0_0", "elements_shown": {"A": 2, "B": 0, "C": 0, "D": 0}, "task_index": 0}]})";
  StudyMatrix matrix;
  std::string error;
  EXPECT_FALSE(load(json, matrix, &error));
  EXPECT_NE(error.find("0 or 1"), std::string::npos);
}

TEST(MatrixIoTest, RejectsMismatchedElementKeys) {
  const std::string json =
      R"({"0": [{"task_id": "0_0", "elements_shown": {"A": 1, "B": 0, "C": 0, "D": 0}, "task_index": 0},)"
      R"(        {"task_id": "0_1", "elements_shown": {"A": 1, "B": 0, "C": 0, "E": 0}, "task_index": 1}]})";
  StudyMatrix matrix;
  std::string error;
  EXPECT_FALSE(load(json, matrix, &error));
  EXPECT_NE(error.find("lacks element 'D'"), std::string::npos);
}

TEST(MatrixIoTest, RejectsMissingFields) {
  StudyMatrix matrix;
  EXPECT_FALSE(load(R"({"0": [{"elements_shown": {"A": 1}, "task_index": 0}]})", matrix));
  EXPECT_FALSE(load(R"({"0": [{"task_id": "0_0", "elements_shown": {"A": 1}}]})", matrix));
  EXPECT_FALSE(load(R"({"0": [{"task_id": "0_0", "task_index": 0}]})", matrix));
}

TEST(MatrixIoTest, FailedLoadClearsOutput) {
  StudyMatrix matrix = makeMatrix(4, {{0b0001}});
  EXPECT_FALSE(load("[]", matrix));
  EXPECT_EQ(matrix.numRespondents(), 0u);
  EXPECT_TRUE(matrix.element_ids.empty());
}

TEST(MatrixIoTest, FailureAfterValidRespondentLeavesOutputEmpty) {
  // Respondent 0 parses; respondent 1 has a bad flag.
  const std::string json =
      R"({"0": [{"task_id": "0_0", "elements_shown": {"A": 1, "B": 0, "C": 0, "D": 0}, "task_index": 0}],)"
      R"( "1": [{"task_id": "1_0", "elements_shown": {"A": 0, "B": 7, "C": 0, "D": 0}, "task_index": 0}]})";
  StudyMatrix matrix = makeMatrix(4, {{0b0001}});
  EXPECT_FALSE(load(json, matrix));
  EXPECT_EQ(matrix.numRespondents(), 0u);
  EXPECT_TRUE(matrix.element_ids.empty());
}

}  // namespace
}  // namespace iped
