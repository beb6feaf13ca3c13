#pragma once
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_metadata.hpp>
#include <optional>

namespace covenant::schema {

/// One payment destination of a template.
///
/// `template_hash` is set when `script_pubkey` commits to a nested template,
/// which is how templates link into a graph.
struct output_t final {
  amount_t amount{};
  bytes_t script_pubkey;
  std::optional<hash32_t> template_hash;
  template_metadata_t metadata;

  bool operator==(const output_t& other) const = default;
};

}  // namespace covenant::schema
