// Implementation of study matrix JSON serialization.

#include "design/matrix_io.h"

#include <cctype>
#include <cstdlib>
#include <set>
#include <utility>

#include "core/basic_types.h"
#include "core/json_parser.h"

namespace iped {

void writeMatrix(JsonWriter& writer, const StudyMatrix& matrix) {
  writer.beginObject();
  for (size_t resp = 0; resp < matrix.respondents.size(); ++resp) {
    writer.key(std::to_string(resp));
    writer.beginArray();
    for (const auto& task : matrix.respondents[resp]) {
      writer.beginObject();
      writer.key("task_id");
      writer.value(task.task_id);
      writer.key("elements_shown");
      writer.beginObject();
      for (int elem = 0; elem < matrix.numElements(); ++elem) {
        writer.key(matrix.element_ids[static_cast<size_t>(elem)]);
        writer.value(isShown(task.elements_shown, elem) ? 1 : 0);
      }
      writer.endObject();
      writer.key("task_index");
      writer.value(task.task_index);
      writer.endObject();
    }
    writer.endArray();
  }
  writer.endObject();
}

std::string matrixToJson(const StudyMatrix& matrix, bool pretty) {
  JsonWriter writer;
  writeMatrix(writer, matrix);
  return pretty ? writer.toPrettyString() : writer.toString();
}

namespace {

bool fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

/// @brief Parse a respondent key: plain decimal digits, no sign, no leading zero.
bool parseRespondentKey(const std::string& key, size_t& index) {
  if (key.empty() || key.size() > 9) return false;
  if (key.size() > 1 && key[0] == '0') return false;
  for (char chr : key) {
    if (!std::isdigit(static_cast<unsigned char>(chr))) return false;
  }
  index = static_cast<size_t>(std::strtoul(key.c_str(), nullptr, 10));
  return true;
}

/// @brief Read element keys from the first task's elements_shown object.
bool readElementIds(const JsonValue& shown, std::vector<std::string>& ids, std::string* error) {
  if (shown.type != JsonValue::Object) {
    return fail(error, "elements_shown must be an object");
  }
  if (shown.object_keys.empty() ||
      shown.object_keys.size() > static_cast<size_t>(kMaxElements)) {
    return fail(error, "elements_shown must have 1-" + std::to_string(kMaxElements) + " keys");
  }
  std::set<std::string> unique(shown.object_keys.begin(), shown.object_keys.end());
  if (unique.size() != shown.object_keys.size()) {
    return fail(error, "elements_shown has duplicate keys");
  }
  ids = shown.object_keys;
  return true;
}

bool readTask(const JsonValue& node, const std::vector<std::string>& ids,
              TaskAssignment& task, std::string* error) {
  if (node.type != JsonValue::Object) return fail(error, "task must be an object");

  const JsonValue* task_id = node.find("task_id");
  if (!task_id || task_id->type != JsonValue::String) {
    return fail(error, "task_id missing or not a string");
  }
  const JsonValue* task_index = node.find("task_index");
  if (!task_index || !task_index->isInteger()) {
    return fail(error, "task_index missing or not an integer in task '" +
                           task_id->string_val + "'");
  }
  const JsonValue* shown = node.find("elements_shown");
  if (!shown || shown->type != JsonValue::Object) {
    return fail(error, "elements_shown missing in task '" + task_id->string_val + "'");
  }
  if (shown->object_keys.size() != ids.size()) {
    return fail(error, "task '" + task_id->string_val + "' has " +
                           std::to_string(shown->object_keys.size()) + " elements, expected " +
                           std::to_string(ids.size()));
  }

  ElementMask mask = 0;
  for (size_t elem = 0; elem < ids.size(); ++elem) {
    const JsonValue* flag = shown->find(ids[elem]);
    if (!flag) {
      return fail(error, "task '" + task_id->string_val + "' lacks element '" + ids[elem] + "'");
    }
    if (!flag->isInteger() || (flag->number_val != 0.0 && flag->number_val != 1.0)) {
      return fail(error, "element '" + ids[elem] + "' in task '" + task_id->string_val +
                             "' must be 0 or 1");
    }
    if (flag->number_val == 1.0) {
      mask = static_cast<ElementMask>(mask | (1u << elem));
    }
  }

  task.task_id = task_id->string_val;
  task.task_index = task_index->asInt();
  task.elements_shown = mask;
  return true;
}

}  // namespace

bool matrixFromJson(const char* json, size_t length, StudyMatrix& out, std::string* error) {
  out = StudyMatrix();

  JsonValue root;
  std::string parse_error;
  if (!parseJson(json, length, root, &parse_error)) {
    return fail(error, "invalid JSON: " + parse_error);
  }
  if (root.type != JsonValue::Object) {
    return fail(error, "matrix must be a JSON object");
  }

  const size_t num_respondents = root.object_keys.size();
  std::vector<const JsonValue*> by_index(num_respondents, nullptr);
  for (size_t idx = 0; idx < num_respondents; ++idx) {
    size_t resp = 0;
    const std::string& key = root.object_keys[idx];
    if (!parseRespondentKey(key, resp) || resp >= num_respondents) {
      return fail(error, "respondent key '" + key + "' is not in 0.." +
                             std::to_string(num_respondents == 0 ? 0 : num_respondents - 1));
    }
    if (by_index[resp]) {
      return fail(error, "duplicate respondent key '" + key + "'");
    }
    by_index[resp] = &root.object_values[idx];
  }

  // Built aside so a failure part way through leaves out empty.
  StudyMatrix matrix;
  matrix.respondents.resize(num_respondents);
  for (size_t resp = 0; resp < num_respondents; ++resp) {
    const JsonValue& tasks = *by_index[resp];
    if (tasks.type != JsonValue::Array) {
      return fail(error, "respondent " + std::to_string(resp) + " must map to an array");
    }
    RespondentMatrix& dest = matrix.respondents[resp];
    dest.reserve(tasks.array_items.size());
    for (const JsonValue& node : tasks.array_items) {
      if (matrix.element_ids.empty()) {
        const JsonValue* shown =
            node.type == JsonValue::Object ? node.find("elements_shown") : nullptr;
        if (!shown) return fail(error, "first task lacks elements_shown");
        if (!readElementIds(*shown, matrix.element_ids, error)) return false;
      }
      TaskAssignment task;
      if (!readTask(node, matrix.element_ids, task, error)) return false;
      dest.push_back(std::move(task));
    }
  }
  out = std::move(matrix);
  return true;
}

}  // namespace iped
