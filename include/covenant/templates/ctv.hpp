#pragma once
#include <covenant/bitcoin/transaction.hpp>
#include <covenant/schema/primitives.hpp>
#include <cstdint>

namespace covenant::templates {

/// SHA256 over the concatenated 4-byte little-endian input sequences.
covenant::schema::hash32_t compute_sequences_hash(
    const covenant::bitcoin::transaction_t& tx);

/// SHA256 over the concatenated consensus-encoded outputs.
covenant::schema::hash32_t compute_outputs_hash(
    const covenant::bitcoin::transaction_t& tx);

/// CheckTemplateVerify commitment of `tx` scoped to `input_index`.
///
/// SHA256(version || lock_time || input_count || sequences_hash ||
///        output_count || outputs_hash || input_index), integers as 4-byte
/// little-endian. Prevouts, scriptSigs and witnesses are not committed, so
/// for templates (empty scriptSigs) this equals the BIP-119 default hash.
covenant::schema::hash32_t compute_ctv_hash(
    const covenant::bitcoin::transaction_t& tx,
    uint32_t input_index);

}  // namespace covenant::templates
