#pragma once
#include <covenant/bitcoin/transaction.hpp>
#include <covenant/schema/clause.hpp>
#include <covenant/schema/output.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>
#include <covenant/schema/template_metadata.hpp>
#include <covenant/schema/template_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace covenant::templates {

struct template_result;

/// Immutable, hash-committed description of a future transaction.
///
/// Instances come only from `template_builder::finalize` or from
/// `from_record`, both of which establish:
///   - `ctv() == compute_ctv_hash(tx(), ctv_index())`
///   - `outputs()[i]` mirrors `tx().outputs[i]` (amount and script)
///   - `total_amount() <= max()`
/// No member mutates a live template.
class transaction_template final {
 public:
  const std::vector<covenant::schema::clause_t>& guards() const {
    return guards_;
  }
  const covenant::schema::hash32_t& ctv() const { return ctv_; }
  uint32_t ctv_index() const { return ctv_index_; }
  covenant::schema::amount_t max() const { return max_; }
  const std::optional<covenant::schema::amount_t>& min_feerate_sats_vbyte()
      const {
    return min_feerate_sats_vbyte_;
  }
  const covenant::schema::template_metadata_t& metadata() const {
    return metadata_;
  }
  const covenant::bitcoin::transaction_t& tx() const { return tx_; }
  const std::vector<covenant::schema::output_t>& outputs() const {
    return outputs_;
  }

  /// Cached template hash.
  covenant::schema::hash32_t hash() const { return ctv_; }

  /// Sum of output amounts, i.e. what must be sent to this template for the
  /// transaction to be valid.
  covenant::schema::amount_t total_amount() const;

  /// Recompute the hash and re-check output consistency and bounds.
  covenant::schema::template_error_code verify() const;

  covenant::schema::template_record_t to_record() const;

  /// Rebuild a template from its persisted form. Any disagreement between
  /// the claimed hash or output annotations and the carried transaction is
  /// reported as `invariant_violation`.
  static template_result from_record(
      const covenant::schema::template_record_t& record);

 private:
  friend class template_builder;

  transaction_template(std::vector<covenant::schema::clause_t> guards,
                       covenant::schema::hash32_t ctv,
                       uint32_t ctv_index,
                       covenant::schema::amount_t max,
                       std::optional<covenant::schema::amount_t> min_feerate,
                       covenant::schema::template_metadata_t metadata,
                       covenant::bitcoin::transaction_t tx,
                       std::vector<covenant::schema::output_t> outputs);

  std::vector<covenant::schema::clause_t> guards_;
  covenant::schema::hash32_t ctv_{};
  uint32_t ctv_index_{};
  covenant::schema::amount_t max_{};
  std::optional<covenant::schema::amount_t> min_feerate_sats_vbyte_;
  covenant::schema::template_metadata_t metadata_;
  covenant::bitcoin::transaction_t tx_;
  std::vector<covenant::schema::output_t> outputs_;
};

/// Outcome of an operation that produces a template. `value` is set iff
/// `code` is `ok`.
struct template_result final {
  covenant::schema::template_error_code code{
      covenant::schema::template_error_code::ok};
  std::string log;
  std::optional<transaction_template> value;

  bool ok() const {
    return code == covenant::schema::template_error_code::ok;
  }
};

/// Check that `outputs` annotate `tx`: one per transaction output, same
/// amount and script, and every `template_hash` backed by a bare CTV script
/// committing to exactly that hash. `empty_output_set` when there are no
/// outputs, `invariant_violation` on any disagreement.
covenant::schema::template_error_code check_outputs(
    const covenant::bitcoin::transaction_t& tx,
    const std::vector<covenant::schema::output_t>& outputs);

/// Output paying `amount` into `child`, committing to its hash with a bare
/// CheckTemplateVerify script.
covenant::schema::output_t make_ctv_output(
    covenant::schema::amount_t amount,
    const transaction_template& child,
    covenant::schema::template_metadata_t metadata = {});

}  // namespace covenant::templates
