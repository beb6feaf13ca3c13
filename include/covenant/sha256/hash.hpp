#pragma once
#include <covenant/schema/primitives.hpp>
#include <string_view>

namespace covenant::sha256 {

covenant::schema::hash32_t hash(const std::string_view& str);
covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes);

/// SHA256(SHA256(bytes)), as used for transaction ids.
covenant::schema::hash32_t double_hash(
    const covenant::schema::bytes_view_t& bytes);

}  // namespace covenant::sha256
