#pragma once
#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace covenant::bitcoin {

inline constexpr auto kOpPushBytes32 = uint8_t{0x20};
// OP_NOP4, redefined by BIP-119.
inline constexpr auto kOpCheckTemplateVerify = uint8_t{0xb3};

/// Bare CTV locking script: `<32-byte hash> OP_CHECKTEMPLATEVERIFY`.
covenant::schema::bytes_t make_ctv_script(
    const covenant::schema::hash32_t& hash);

/// Extract the committed hash from a bare CTV script.
std::optional<covenant::schema::hash32_t> match_ctv_script(
    const covenant::schema::bytes_view_t& script);

}  // namespace covenant::bitcoin
