#include <covenant/bitcoin/script.hpp>
#include <covenant/bitcoin/serialize.hpp>
#include <covenant/templates/ctv.hpp>
#include <covenant/templates/template.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using covenant::schema::amount_t;
using covenant::schema::template_error_code;

namespace covenant::templates {

namespace {

template_result make_error(const template_error_code code, std::string log) {
  return template_result{.code = code, .log = std::move(log), .value = {}};
}

std::optional<covenant::schema::template_metadata_t> persisted(
    const covenant::schema::template_metadata_t& metadata) {
  if (metadata.is_empty()) {
    return std::nullopt;
  }
  return metadata;
}

}  // namespace

transaction_template::transaction_template(
    std::vector<covenant::schema::clause_t> guards,
    covenant::schema::hash32_t ctv,
    uint32_t ctv_index,
    amount_t max,
    std::optional<amount_t> min_feerate,
    covenant::schema::template_metadata_t metadata,
    covenant::bitcoin::transaction_t tx,
    std::vector<covenant::schema::output_t> outputs)
    : guards_(std::move(guards)),
      ctv_(ctv),
      ctv_index_(ctv_index),
      max_(max),
      min_feerate_sats_vbyte_(min_feerate),
      metadata_(std::move(metadata)),
      tx_(std::move(tx)),
      outputs_(std::move(outputs)) {}

amount_t transaction_template::total_amount() const {
  auto total = amount_t{0};
  for (const auto& output : outputs_) {
    total += output.amount;
  }
  return total;
}

template_error_code transaction_template::verify() const {
  if (auto code = check_outputs(tx_, outputs_);
      code != template_error_code::ok) {
    return code;
  }
  if (total_amount() > max_) {
    return template_error_code::invariant_violation;
  }
  if (compute_ctv_hash(tx_, ctv_index_) != ctv_) {
    return template_error_code::invariant_violation;
  }
  return template_error_code::ok;
}

covenant::schema::template_record_t transaction_template::to_record() const {
  auto record = covenant::schema::template_record_t{};
  record.metadata = persisted(metadata_);
  record.guards = guards_;
  record.ctv = ctv_;
  record.ctv_index = ctv_index_;
  record.max = max_;
  record.min_feerate_sats_vbyte = min_feerate_sats_vbyte_;
  record.tx = covenant::bitcoin::serialize(tx_);
  record.outputs.reserve(outputs_.size());
  for (const auto& output : outputs_) {
    record.outputs.push_back(covenant::schema::output_record_t{
        .amount = output.amount,
        .template_hash = output.template_hash,
        .metadata = persisted(output.metadata)});
  }
  return record;
}

template_result transaction_template::from_record(
    const covenant::schema::template_record_t& record) {
  if (record.version != 1) {
    return make_error(template_error_code::malformed_input,
                      "unsupported template record version");
  }
  if (!covenant::schema::money_range(record.max)) {
    return make_error(template_error_code::malformed_input,
                      "max amount out of range");
  }
  if (record.min_feerate_sats_vbyte && *record.min_feerate_sats_vbyte < 0) {
    return make_error(template_error_code::malformed_input,
                      "negative minimum feerate");
  }
  auto tx = covenant::bitcoin::try_deserialize(
      covenant::schema::make_bytes_view(record.tx));
  if (!tx) {
    return make_error(template_error_code::malformed_input,
                      "transaction bytes do not decode");
  }
  if (tx->outputs.empty()) {
    return make_error(template_error_code::empty_output_set,
                      "transaction has no outputs");
  }
  if (record.outputs.size() != tx->outputs.size()) {
    return make_error(template_error_code::invariant_violation,
                      "output annotations do not match transaction outputs");
  }

  auto outputs = std::vector<covenant::schema::output_t>{};
  outputs.reserve(record.outputs.size());
  auto total = amount_t{0};
  for (std::size_t i = 0; i < record.outputs.size(); ++i) {
    const auto& annotation = record.outputs[i];
    if (!covenant::schema::money_range(annotation.amount)) {
      return make_error(template_error_code::malformed_input,
                        "output amount out of range");
    }
    if (annotation.amount != tx->outputs[i].value) {
      return make_error(template_error_code::invariant_violation,
                        "output amount does not match transaction");
    }
    total += annotation.amount;
    if (!covenant::schema::money_range(total)) {
      return make_error(template_error_code::malformed_input,
                        "output total out of range");
    }
    outputs.push_back(covenant::schema::output_t{
        .amount = annotation.amount,
        .script_pubkey = tx->outputs[i].script_pubkey,
        .template_hash = annotation.template_hash,
        .metadata = annotation.metadata.value_or(
            covenant::schema::template_metadata_t{})});
  }
  if (check_outputs(*tx, outputs) != template_error_code::ok) {
    return make_error(template_error_code::invariant_violation,
                      "template hash annotation does not match output script");
  }
  if (total > record.max) {
    return make_error(template_error_code::invariant_violation,
                      "outputs exceed declared max");
  }

  auto ctv = compute_ctv_hash(*tx, record.ctv_index);
  if (ctv != record.ctv) {
    spdlog::warn("Rejecting template record claiming {} (recomputed {})",
                 covenant::schema::to_hex(record.ctv),
                 covenant::schema::to_hex(ctv));
    return make_error(template_error_code::invariant_violation,
                      "template hash does not match transaction");
  }

  return template_result{
      .code = template_error_code::ok,
      .log = {},
      .value = transaction_template{
          record.guards, ctv, record.ctv_index, record.max,
          record.min_feerate_sats_vbyte,
          record.metadata.value_or(covenant::schema::template_metadata_t{}),
          std::move(*tx), std::move(outputs)}};
}

template_error_code check_outputs(
    const covenant::bitcoin::transaction_t& tx,
    const std::vector<covenant::schema::output_t>& outputs) {
  if (outputs.empty()) {
    return template_error_code::empty_output_set;
  }
  if (outputs.size() != tx.outputs.size()) {
    return template_error_code::invariant_violation;
  }
  for (std::size_t i = 0; i < outputs.size(); ++i) {
    const auto& output = outputs[i];
    if (output.amount != tx.outputs[i].value ||
        output.script_pubkey != tx.outputs[i].script_pubkey) {
      return template_error_code::invariant_violation;
    }
    if (output.template_hash &&
        covenant::bitcoin::match_ctv_script(covenant::schema::make_bytes_view(
            output.script_pubkey)) != output.template_hash) {
      return template_error_code::invariant_violation;
    }
  }
  return template_error_code::ok;
}

covenant::schema::output_t make_ctv_output(
    const amount_t amount,
    const transaction_template& child,
    covenant::schema::template_metadata_t metadata) {
  return covenant::schema::output_t{
      .amount = amount,
      .script_pubkey = covenant::bitcoin::make_ctv_script(child.hash()),
      .template_hash = child.hash(),
      .metadata = std::move(metadata)};
}

}  // namespace covenant::templates
