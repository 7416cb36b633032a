// Implementation of ElementSet.

#include "design/element_set.h"

#include <set>
#include <utility>

namespace iped {

namespace {

bool countInRange(int num_elements, std::string* error) {
  if (num_elements >= kMinElements && num_elements <= kMaxElements) return true;
  if (error) {
    *error = "num_elements must be in [" + std::to_string(kMinElements) + ", " +
             std::to_string(kMaxElements) + "] (got " + std::to_string(num_elements) + ")";
  }
  return false;
}

}  // namespace

std::string defaultElementId(int element) {
  return "E" + std::to_string(element + 1);
}

std::optional<ElementSet> ElementSet::create(int num_elements, std::string* error) {
  if (!countInRange(num_elements, error)) return std::nullopt;

  std::vector<std::string> ids;
  ids.reserve(static_cast<size_t>(num_elements));
  for (int idx = 0; idx < num_elements; ++idx) {
    ids.push_back(defaultElementId(idx));
  }
  return ElementSet(std::move(ids));
}

std::optional<ElementSet> ElementSet::createNamed(const std::vector<std::string>& names,
                                                  std::string* error) {
  if (!countInRange(static_cast<int>(names.size()), error)) return std::nullopt;

  std::set<std::string> seen;
  for (size_t idx = 0; idx < names.size(); ++idx) {
    if (names[idx].empty()) {
      if (error) *error = "element name " + std::to_string(idx) + " is empty";
      return std::nullopt;
    }
    if (!seen.insert(names[idx]).second) {
      if (error) *error = "duplicate element name '" + names[idx] + "'";
      return std::nullopt;
    }
  }
  return ElementSet(names);
}

int ElementSet::indexOf(std::string_view name) const {
  for (size_t idx = 0; idx < ids_.size(); ++idx) {
    if (ids_[idx] == name) return static_cast<int>(idx);
  }
  return -1;
}

}  // namespace iped
