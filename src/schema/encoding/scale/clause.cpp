#include <covenant/schema/encoding/scale/clause.hpp>

#include <stdexcept>
#include <utility>

namespace covenant::schema {

namespace {

enum class clause_tag : uint8_t {
  satisfied = 0,
  signature_check = 1,
  preimage_check = 2,
  after = 3,
  older = 4,
  check_template_verify = 5,
  conjunction = 6,
  disjunction = 7,
};

void decode_clause(clause_t& o, ::scale::Decoder& decoder, uint32_t depth);

std::vector<clause_t> decode_clauses(::scale::Decoder& decoder,
                                     const uint32_t depth) {
  auto size = uint32_t{};
  decode(size, decoder);
  auto out = std::vector<clause_t>{};
  for (auto i = uint32_t{0}; i < size; ++i) {
    auto clause = clause_t{};
    decode_clause(clause, decoder, depth + 1);
    out.push_back(std::move(clause));
  }
  return out;
}

void decode_clause(clause_t& o,
                   ::scale::Decoder& decoder,
                   const uint32_t depth) {
  if (depth > kMaxClauseDepth) {
    throw std::invalid_argument("clause nested too deeply");
  }
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (static_cast<clause_tag>(tag)) {
    case clause_tag::satisfied:
      o.value = satisfied_t{};
      return;
    case clause_tag::signature_check: {
      auto value = signature_check_t{};
      decode(value.public_key, decoder);
      o.value = value;
      return;
    }
    case clause_tag::preimage_check: {
      auto value = preimage_check_t{};
      decode(value.hash, decoder);
      o.value = value;
      return;
    }
    case clause_tag::after: {
      auto value = after_t{};
      decode(value.lock_time, decoder);
      o.value = value;
      return;
    }
    case clause_tag::older: {
      auto value = older_t{};
      decode(value.sequence, decoder);
      o.value = value;
      return;
    }
    case clause_tag::check_template_verify: {
      auto value = check_template_verify_t{};
      decode(value.hash, decoder);
      o.value = value;
      return;
    }
    case clause_tag::conjunction:
      o.value = and_clause_t{decode_clauses(decoder, depth)};
      return;
    case clause_tag::disjunction:
      o.value = or_clause_t{decode_clauses(decoder, depth)};
      return;
  }
  throw std::invalid_argument("unknown clause tag");
}

void encode_tag(const clause_tag tag, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(tag), encoder);
}

}  // namespace

void encode(const clause_t& o, ::scale::Encoder& encoder) {
  std::visit(overloaded{[&](const satisfied_t&) {
                          encode_tag(clause_tag::satisfied, encoder);
                        },
                        [&](const signature_check_t& value) {
                          encode_tag(clause_tag::signature_check, encoder);
                          encode(value.public_key, encoder);
                        },
                        [&](const preimage_check_t& value) {
                          encode_tag(clause_tag::preimage_check, encoder);
                          encode(value.hash, encoder);
                        },
                        [&](const after_t& value) {
                          encode_tag(clause_tag::after, encoder);
                          encode(value.lock_time, encoder);
                        },
                        [&](const older_t& value) {
                          encode_tag(clause_tag::older, encoder);
                          encode(value.sequence, encoder);
                        },
                        [&](const check_template_verify_t& value) {
                          encode_tag(clause_tag::check_template_verify,
                                     encoder);
                          encode(value.hash, encoder);
                        },
                        [&](const and_clause_t& value) {
                          encode_tag(clause_tag::conjunction, encoder);
                          encode(value.clauses, encoder);
                        },
                        [&](const or_clause_t& value) {
                          encode_tag(clause_tag::disjunction, encoder);
                          encode(value.clauses, encoder);
                        }},
             o.value);
}

void decode(clause_t& o, ::scale::Decoder& decoder) {
  decode_clause(o, decoder, 0);
}

void encode(const std::vector<clause_t>& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint32_t>(o.size()), encoder);
  for (const auto& clause : o) {
    encode(clause, encoder);
  }
}

void decode(std::vector<clause_t>& o, ::scale::Decoder& decoder) {
  o = decode_clauses(decoder, 0);
}

}  // namespace covenant::schema
