#include <covenant/bitcoin/script.hpp>

#include <algorithm>
#include <iterator>

namespace covenant::bitcoin {

covenant::schema::bytes_t make_ctv_script(
    const covenant::schema::hash32_t& hash) {
  auto script = covenant::schema::bytes_t{};
  script.reserve(hash.size() + 2);
  script.push_back(kOpPushBytes32);
  script.insert(std::end(script), std::begin(hash), std::end(hash));
  script.push_back(kOpCheckTemplateVerify);
  return script;
}

std::optional<covenant::schema::hash32_t> match_ctv_script(
    const covenant::schema::bytes_view_t& script) {
  if (script.size() != 34 || script.front() != kOpPushBytes32 ||
      script.back() != kOpCheckTemplateVerify) {
    return std::nullopt;
  }
  auto hash = covenant::schema::hash32_t{};
  std::copy_n(std::begin(script) + 1, hash.size(), std::begin(hash));
  return hash;
}

}  // namespace covenant::bitcoin
