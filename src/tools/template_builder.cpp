#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <covenant/bitcoin/serialize.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>
#include <covenant/templates/builder.hpp>
#include <covenant/templates/ctv.hpp>
#include <covenant/templates/template.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = covenant::schema::encoding::encoder<
    covenant::schema::encoding::scale_encoder_tag>;
using covenant::schema::template_error_code;
namespace po = boost::program_options;

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

int fail(const template_error_code code, const std::string_view detail) {
  spdlog::error("{}", detail);
  std::cerr << covenant::schema::to_string(code) << '\n';
  return 1;
}

/// `<sats>:<script-hex>`
std::optional<covenant::schema::output_t> parse_output(
    const std::string_view text) {
  auto separator = text.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto amount = covenant::schema::try_parse_amount(text.substr(0, separator));
  auto script = covenant::schema::try_from_hex(
      normalize_hex(text.substr(separator + 1)));
  if (!amount || !script) {
    return std::nullopt;
  }
  return covenant::schema::output_t{.amount = *amount,
                                    .script_pubkey = std::move(*script)};
}

int run_build(const po::variables_map& vm) {
  auto policy = covenant::templates::template_policy{};
  if (vm.contains("version")) {
    policy.version = vm["version"].as<int32_t>();
  }
  auto builder = covenant::templates::template_builder{policy};

  auto check = [](const template_error_code code, const std::string_view what) {
    if (code != template_error_code::ok) {
      spdlog::error("{} rejected: {}", what, covenant::schema::to_string(code));
      return false;
    }
    return true;
  };

  if (!vm.contains("output")) {
    return fail(template_error_code::empty_output_set,
                "build requires at least one --output");
  }
  for (const auto& text : vm["output"].as<std::vector<std::string>>()) {
    auto output = parse_output(text);
    if (!output) {
      return fail(template_error_code::malformed_input,
                  "output must be <sats>:<script-hex>, got '" + text + "'");
    }
    auto code = builder.add_output(std::move(*output));
    if (!check(code, "output " + text)) {
      return fail(code, "invalid output");
    }
  }

  auto apply = [&](const template_error_code code,
                   const std::string_view what) -> std::optional<int> {
    if (!check(code, what)) {
      return fail(code, std::string{"invalid "} + std::string{what});
    }
    return std::nullopt;
  };

  auto parse_amount_flag =
      [&](const std::string& name) -> std::optional<covenant::schema::amount_t> {
    return covenant::schema::try_parse_amount(vm[name].as<std::string>());
  };

  if (vm.contains("max")) {
    auto max = parse_amount_flag("max");
    if (!max) {
      return fail(template_error_code::malformed_input, "invalid --max");
    }
    if (auto rc = apply(builder.set_max(*max), "max")) {
      return *rc;
    }
  }
  if (vm.contains("min-feerate")) {
    auto feerate = parse_amount_flag("min-feerate");
    if (!feerate) {
      return fail(template_error_code::malformed_input,
                  "invalid --min-feerate");
    }
    if (auto rc = apply(builder.set_min_feerate(*feerate), "min-feerate")) {
      return *rc;
    }
  }
  if (vm.contains("label")) {
    if (auto rc = apply(builder.set_label(vm["label"].as<std::string>()),
                        "label")) {
      return *rc;
    }
  }
  if (vm.contains("color")) {
    if (auto rc = apply(builder.set_color(vm["color"].as<std::string>()),
                        "color")) {
      return *rc;
    }
  }
  if (vm.contains("lock-time")) {
    if (auto rc = apply(builder.set_lock_time(vm["lock-time"].as<uint32_t>()),
                        "lock-time")) {
      return *rc;
    }
  }
  if (auto rc = apply(builder.require_exact_amount(vm.contains("strict")),
                      "strict")) {
    return *rc;
  }

  auto result = builder.finalize(vm["ctv-index"].as<uint32_t>());
  if (!result.ok()) {
    return fail(result.code, result.log);
  }

  auto record = encoder_t{}.encode(result.value->to_record());
  std::cout << "ctv=" << covenant::schema::to_hex(result.value->hash()) << '\n'
            << "record=" << covenant::schema::to_hex(record) << '\n';
  return 0;
}

int run_verify(const po::variables_map& vm) {
  if (!vm.contains("record")) {
    return fail(template_error_code::malformed_input,
                "verify requires --record");
  }
  auto bytes = covenant::schema::try_from_hex(
      normalize_hex(vm["record"].as<std::string>()));
  if (!bytes) {
    return fail(template_error_code::malformed_input, "record is not hex");
  }
  auto record = encoder_t{}.try_decode<covenant::schema::template_record_t>(
      covenant::schema::make_bytes_view(*bytes));
  if (!record) {
    return fail(template_error_code::malformed_input,
                "record does not decode");
  }
  auto result = covenant::templates::transaction_template::from_record(*record);
  if (!result.ok()) {
    return fail(result.code, result.log);
  }
  std::cout << "ok " << covenant::schema::to_hex(result.value->hash()) << '\n';
  return 0;
}

int run_ctv_hash(const po::variables_map& vm) {
  if (!vm.contains("tx")) {
    return fail(template_error_code::malformed_input, "ctv-hash requires --tx");
  }
  auto bytes = covenant::schema::try_from_hex(
      normalize_hex(vm["tx"].as<std::string>()));
  if (!bytes) {
    return fail(template_error_code::malformed_input, "tx is not hex");
  }
  auto tx = covenant::bitcoin::try_deserialize(
      covenant::schema::make_bytes_view(*bytes));
  if (!tx) {
    return fail(template_error_code::malformed_input,
                "tx is not a consensus-encoded transaction");
  }
  auto hash = covenant::templates::compute_ctv_hash(
      *tx, vm["ctv-index"].as<uint32_t>());
  std::cout << covenant::schema::to_hex(hash) << '\n';
  return 0;
}

void configure_logging(const bool verbose) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("covenant", console_sink);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  covenant_template_builder build --output <sats>:<script-hex> "
               "[options]\n"
            << "  covenant_template_builder verify --record <hex>\n"
            << "  covenant_template_builder ctv-hash --tx <hex> "
               "[--ctv-index N]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"covenant_template_builder options"};
  options.add_options()("help,h", "show help")(
      "verbose,v", "enable debug logging")(
      "command", po::value<std::string>(&command), "build|verify|ctv-hash")(
      "output", po::value<std::vector<std::string>>()->composing(),
      "output as <sats>:<script-hex>, repeatable")(
      "max", po::value<std::string>(), "upper bound on the output total")(
      "min-feerate", po::value<std::string>(),
      "minimum fee rate in sats/vbyte")("label", po::value<std::string>(),
                                         "template label")(
      "color", po::value<std::string>(), "template color")(
      "lock-time", po::value<uint32_t>(), "transaction lock time")(
      "version", po::value<int32_t>(), "transaction version")(
      "ctv-index", po::value<uint32_t>()->default_value(0),
      "input index committed by the digest")(
      "strict", "require the output total to equal --max")(
      "record", po::value<std::string>(), "encoded template record hex")(
      "tx", po::value<std::string>(), "consensus-encoded transaction hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(vm.contains("verbose"));

  if (command == "build") {
    return run_build(vm);
  }
  if (command == "verify") {
    return run_verify(vm);
  }
  if (command == "ctv-hash") {
    return run_ctv_hash(vm);
  }

  spdlog::error("command must be build|verify|ctv-hash, got '{}'", command);
  print_help(options);
  return 2;
}
