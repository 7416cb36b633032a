// Immutable set of study elements with their serialization identifiers.

#ifndef IPED_DESIGN_ELEMENT_SET_H
#define IPED_DESIGN_ELEMENT_SET_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace iped {

/// @brief Ordered identifiers of a study's elements.
///
/// Element i is bit i of an ElementMask. Identifiers are only used at the
/// serialization boundary. Instances are created through the factories
/// below and never modified afterwards.
class ElementSet {
 public:
  /// @brief Create a set with default identifiers "E1".."En".
  /// @param num_elements Element count, must be in [kMinElements, kMaxElements].
  /// @param[out] error Optional reason on failure.
  /// @return The set, or nullopt if num_elements is out of range.
  static std::optional<ElementSet> create(int num_elements, std::string* error = nullptr);

  /// @brief Create a set with caller-supplied identifiers.
  ///
  /// Names must be non-empty and unique; their count sets the element count.
  ///
  /// @param names Element identifiers in element order.
  /// @param[out] error Optional reason on failure.
  /// @return The set, or nullopt on a bad count, empty name or duplicate.
  static std::optional<ElementSet> createNamed(const std::vector<std::string>& names,
                                               std::string* error = nullptr);

  int size() const { return static_cast<int>(ids_.size()); }
  const std::vector<std::string>& ids() const { return ids_; }
  const std::string& id(int element) const { return ids_[static_cast<size_t>(element)]; }

  /// @brief Find an element by identifier.
  /// @return Element index, or -1 if absent.
  int indexOf(std::string_view name) const;

  /// @brief Mask with every element shown.
  ElementMask allShown() const { return fullMask(size()); }

 private:
  explicit ElementSet(std::vector<std::string> ids) : ids_(std::move(ids)) {}

  std::vector<std::string> ids_;
};

/// @brief Default identifier for an element ("E" + 1-based index).
std::string defaultElementId(int element);

}  // namespace iped

#endif  // IPED_DESIGN_ELEMENT_SET_H
