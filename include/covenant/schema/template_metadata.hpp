#pragma once
#include <covenant/schema/json_value.hpp>
#include <optional>
#include <string>

namespace covenant::schema {

/// Descriptive sidecar attached to templates and outputs.
///
/// Never contributes to a template hash.
struct template_metadata_t final {
  std::optional<std::string> label;
  std::optional<std::string> color;
  json_object_t extra;

  /// True when every field is at its default, i.e. nothing worth persisting.
  bool is_empty() const { return *this == template_metadata_t{}; }

  bool operator==(const template_metadata_t& other) const = default;
};

}  // namespace covenant::schema
