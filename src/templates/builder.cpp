#include <covenant/bitcoin/script.hpp>
#include <covenant/templates/builder.hpp>
#include <covenant/templates/ctv.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

using covenant::schema::amount_t;
using covenant::schema::template_error_code;

namespace covenant::templates {

namespace {

template_result make_error(const template_error_code code, std::string log) {
  spdlog::warn("Template finalize rejected ({}): {}",
               covenant::schema::to_string(code), log);
  return template_result{.code = code, .log = std::move(log), .value = {}};
}

}  // namespace

template_builder::template_builder(template_policy policy)
    : policy_(policy) {}

template_error_code template_builder::add_output(
    covenant::schema::output_t output) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  if (!covenant::schema::money_range(output.amount) ||
      !covenant::schema::money_range(pending_total_ + output.amount)) {
    return template_error_code::malformed_input;
  }
  if (output.template_hash &&
      covenant::bitcoin::match_ctv_script(covenant::schema::make_bytes_view(
          output.script_pubkey)) != output.template_hash) {
    return template_error_code::malformed_input;
  }
  pending_total_ += output.amount;
  outputs_.push_back(std::move(output));
  return template_error_code::ok;
}

template_error_code template_builder::remove_output(const std::size_t index) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  if (index >= outputs_.size()) {
    return template_error_code::malformed_input;
  }
  auto it = std::begin(outputs_) + static_cast<std::ptrdiff_t>(index);
  pending_total_ -= it->amount;
  outputs_.erase(it);
  return template_error_code::ok;
}

template_error_code template_builder::add_guard(
    covenant::schema::clause_t guard) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  guards_.push_back(std::move(guard));
  return template_error_code::ok;
}

template_error_code template_builder::set_max(const amount_t max) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  if (!covenant::schema::money_range(max)) {
    return template_error_code::malformed_input;
  }
  max_ = max;
  return template_error_code::ok;
}

template_error_code template_builder::set_min_feerate(
    const amount_t sats_per_vbyte) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  if (sats_per_vbyte < 0) {
    return template_error_code::malformed_input;
  }
  min_feerate_ = sats_per_vbyte;
  return template_error_code::ok;
}

template_error_code template_builder::set_metadata(
    covenant::schema::template_metadata_t metadata) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  metadata_ = std::move(metadata);
  return template_error_code::ok;
}

template_error_code template_builder::set_label(std::string label) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  metadata_.label = std::move(label);
  return template_error_code::ok;
}

template_error_code template_builder::set_color(std::string color) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  metadata_.color = std::move(color);
  return template_error_code::ok;
}

template_error_code template_builder::set_extra(
    std::string key,
    covenant::schema::json_value value) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  metadata_.extra.insert_or_assign(std::move(key), std::move(value));
  return template_error_code::ok;
}

template_error_code template_builder::set_version(const int32_t version) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  policy_.version = version;
  return template_error_code::ok;
}

template_error_code template_builder::set_lock_time(const uint32_t lock_time) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  policy_.lock_time = lock_time;
  return template_error_code::ok;
}

template_error_code template_builder::set_sequence(const std::size_t input_index,
                                                   const uint32_t sequence) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  if (input_index >= kMaxTemplateInputs) {
    return template_error_code::malformed_input;
  }
  if (input_index >= sequences_.size()) {
    sequences_.resize(input_index + 1);
  }
  sequences_[input_index] = sequence;
  return template_error_code::ok;
}

template_error_code template_builder::require_exact_amount(const bool exact) {
  if (finalized_) {
    return template_error_code::already_finalized;
  }
  exact_amount_ = exact;
  return template_error_code::ok;
}

covenant::bitcoin::transaction_t template_builder::materialize() const {
  // A final sequence on every input would disable the lock time.
  auto default_sequence = policy_.sequence;
  if (policy_.lock_time != 0 &&
      default_sequence == covenant::bitcoin::kSequenceFinal) {
    default_sequence = covenant::bitcoin::kSequenceLockTimeEnabled;
  }

  auto tx = covenant::bitcoin::transaction_t{};
  tx.version = policy_.version;
  tx.lock_time = policy_.lock_time;
  tx.inputs.reserve(sequences_.size());
  for (const auto& sequence : sequences_) {
    auto input = covenant::bitcoin::tx_in_t{};
    input.sequence = sequence.value_or(default_sequence);
    tx.inputs.push_back(std::move(input));
  }
  tx.outputs.reserve(outputs_.size());
  for (const auto& output : outputs_) {
    tx.outputs.push_back(covenant::bitcoin::tx_out_t{
        .value = output.amount, .script_pubkey = output.script_pubkey});
  }
  return tx;
}

template_result template_builder::finalize(const uint32_t ctv_index) {
  if (finalized_) {
    return template_result{.code = template_error_code::already_finalized,
                           .log = "builder already finalized",
                           .value = {}};
  }
  if (outputs_.empty()) {
    return make_error(template_error_code::empty_output_set,
                      "template has no outputs");
  }
  auto max = max_.value_or(pending_total_);
  if (pending_total_ > max) {
    return make_error(template_error_code::amount_exceeded,
                      fmt::format("outputs total {} exceeds max {}",
                                  pending_total_, max));
  }
  if (exact_amount_ && pending_total_ != max) {
    return make_error(template_error_code::amount_mismatch,
                      fmt::format("outputs total {} does not equal max {}",
                                  pending_total_, max));
  }

  auto tx = materialize();
  auto ctv = compute_ctv_hash(tx, ctv_index);

  finalized_ = true;
  spdlog::debug("Finalized template {} ({} output(s), {} sats, index {})",
                covenant::schema::to_hex(ctv), outputs_.size(),
                pending_total_, ctv_index);

  return template_result{
      .code = template_error_code::ok,
      .log = {},
      .value = transaction_template{std::move(guards_), ctv, ctv_index, max,
                                    min_feerate_, std::move(metadata_),
                                    std::move(tx), std::move(outputs_)}};
}

}  // namespace covenant::templates
