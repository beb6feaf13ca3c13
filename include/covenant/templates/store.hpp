#pragma once
#include <spdlog/spdlog.h>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>
#include <covenant/schema/template_record.hpp>
#include <covenant/storage/storage.hpp>
#include <covenant/templates/graph.hpp>
#include <covenant/templates/template.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::templates {

inline constexpr auto kTemplateKeyPrefix = std::string_view{"TPL|"};

inline covenant::schema::bytes_t make_template_key_prefix() {
  return covenant::schema::make_bytes(kTemplateKeyPrefix);
}

/// `TPL|` followed by the raw 32-byte digest.
inline covenant::schema::bytes_t make_template_key(
    const covenant::schema::hash32_t& hash) {
  auto key = make_template_key_prefix();
  key.insert(std::end(key), std::begin(hash), std::end(hash));
  return key;
}

struct load_result final {
  covenant::schema::template_error_code code{
      covenant::schema::template_error_code::ok};
  std::string log;
  template_graph graph;

  bool ok() const {
    return code == covenant::schema::template_error_code::ok;
  }
};

/// Persist every template of `graph`, replacing whatever was stored under
/// the template prefix before.
template <typename Storage, typename Encoder>
void save(const template_graph& graph, Storage& storage, Encoder& encoder) {
  auto entries = std::vector<covenant::storage::key_value_entry_t>{};
  entries.reserve(graph.size());
  for (const auto& hash : graph.topological_order()) {
    const auto* tmpl = graph.find(hash);
    entries.push_back(
        {make_template_key(hash), encoder.encode(tmpl->to_record())});
  }
  auto prefix = make_template_key_prefix();
  storage.replace_by_prefix(covenant::schema::make_bytes_view(prefix),
                            entries);
  spdlog::debug("saved {} templates", entries.size());
}

/// Decode, verify, and reassemble every stored template.
///
/// A record that does not decode, does not verify, or is stored under a
/// key other than its own digest is `invariant_violation`. A record that
/// commits to a template absent from the store is `missing_child`.
template <typename Storage, typename Encoder>
load_result load(const Storage& storage, Encoder& encoder) {
  auto result = load_result{};
  auto fail = [&](covenant::schema::template_error_code code,
                  std::string log) {
    spdlog::warn("template store load failed: {}", log);
    result.code = code;
    result.log = std::move(log);
    result.graph = template_graph{};
    return result;
  };

  auto prefix = make_template_key_prefix();
  auto pending = std::map<covenant::schema::hash32_t, transaction_template>{};
  for (const auto& [key, value] :
       storage.list_by_prefix(covenant::schema::make_bytes_view(prefix))) {
    auto key_hex = covenant::schema::to_hex(key);
    auto record = encoder.template try_decode<covenant::schema::template_record_t>(
        covenant::schema::make_bytes_view(value));
    if (!record) {
      return fail(covenant::schema::template_error_code::invariant_violation,
                  "undecodable record at " + key_hex);
    }
    auto rebuilt = transaction_template::from_record(*record);
    if (!rebuilt.ok()) {
      return fail(covenant::schema::template_error_code::invariant_violation,
                  "record at " + key_hex + ": " + rebuilt.log);
    }
    auto hash = rebuilt.value->hash();
    if (key != make_template_key(hash)) {
      return fail(covenant::schema::template_error_code::invariant_violation,
                  "record at " + key_hex + " commits to " +
                      covenant::schema::to_hex(hash));
    }
    pending.emplace(hash, std::move(*rebuilt.value));
  }

  // Insert in passes; each pass admits every template whose children are
  // already in the graph.
  while (!pending.empty()) {
    auto progressed = false;
    for (auto it = std::begin(pending); it != std::end(pending);) {
      const auto& outputs = it->second.outputs();
      auto ready = std::all_of(
          std::begin(outputs), std::end(outputs), [&](const auto& output) {
            return !output.template_hash ||
                   result.graph.contains(*output.template_hash);
          });
      if (!ready) {
        ++it;
        continue;
      }
      auto code = result.graph.insert(it->second);
      if (code != covenant::schema::template_error_code::ok) {
        return fail(code, "insert of " + covenant::schema::to_hex(it->first) +
                              " failed: " +
                              std::string{covenant::schema::to_string(code)});
      }
      it = pending.erase(it);
      progressed = true;
    }
    if (!progressed) {
      return fail(covenant::schema::template_error_code::missing_child,
                  std::to_string(pending.size()) +
                      " stored templates commit to absent children");
    }
  }

  spdlog::debug("loaded {} templates", result.graph.size());
  return result;
}

}  // namespace covenant::templates
