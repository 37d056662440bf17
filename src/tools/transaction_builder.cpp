#include <boost/program_options.hpp>
#include <mosaic/blake3/hash.hpp>
#include <mosaic/common/critical.hpp>
#include <mosaic/crypto/verify.hpp>
#include <mosaic/execution/signing.hpp>
#include <mosaic/schema/encoding/scale/encoder.hpp>
#include <mosaic/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = mosaic::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

constexpr auto kDefaultChainName = std::string_view{"mosaic-local-chain"};

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    mosaic::common::critical("missing required option --{}", name);
  }
  return vm[name].as<std::string>();
}

mosaic::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto value = mosaic::schema::try_make_hash32(require(vm, name));
  if (!value) {
    mosaic::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *value;
}

template <typename T>
T get_value(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    mosaic::common::critical("missing required option --{}", name);
  }
  return vm[name].as<T>();
}

mosaic::schema::amount_t get_amount(const po::variables_map& vm,
                                    const std::string& name) {
  auto text = vm[name].as<std::string>();
  if (text.empty() || !std::ranges::all_of(text, [](const char c) {
        return c >= '0' && c <= '9';
      })) {
    mosaic::common::critical("--{} must be a decimal amount", name);
  }
  return mosaic::schema::amount_t{text.c_str()};
}

std::optional<mosaic::crypto::ed25519_seed_t> get_secret_key(
    const po::variables_map& vm) {
  if (!vm.contains("secret-key-hex")) {
    return std::nullopt;
  }
  return get_hash32(vm, "secret-key-hex");
}

mosaic::schema::ed25519_public_key_t get_signer(const po::variables_map& vm) {
  if (auto secret = get_secret_key(vm)) {
    auto public_key = mosaic::crypto::derive_public_key(*secret);
    if (!public_key) {
      mosaic::common::critical("failed to derive ed25519 public key");
    }
    return *public_key;
  }
  return get_hash32(vm, "signer-public-key-hex");
}

mosaic::schema::ed25519_signature_t get_signature(
    const po::variables_map& vm) {
  auto signature = mosaic::schema::ed25519_signature_t{};
  auto hex = vm["signature-hex"].as<std::string>();
  if (hex.empty()) {
    return signature;
  }
  auto bytes = mosaic::schema::from_hex(hex);
  if (bytes.size() != signature.size()) {
    mosaic::common::critical("ed25519 signature must be 64 bytes");
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
  return signature;
}

mosaic::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = require(vm, "payload");
  if (payload == "mint") {
    return mosaic::schema::mint_artifact_t{
        .recipient = get_hash32(vm, "recipient"),
        .trait_commitment = get_hash32(vm, "trait-commitment"),
        .layer_count = get_value<uint32_t>(vm, "layer-count")};
  }
  if (payload == "approve") {
    return mosaic::schema::approve_spender_t{
        .spender = get_hash32(vm, "spender"),
        .token_id = get_value<uint64_t>(vm, "token-id")};
  }
  if (payload == "set-operator") {
    return mosaic::schema::set_operator_approval_t{
        .operator_id = get_hash32(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "transfer" || payload == "safe-transfer") {
    return mosaic::schema::transfer_artifact_t{
        .from = get_hash32(vm, "from"),
        .to = get_hash32(vm, "to"),
        .token_id = get_value<uint64_t>(vm, "token-id"),
        .safe = payload == "safe-transfer"};
  }
  if (payload == "configure-royalty") {
    return mosaic::schema::configure_royalty_t{
        .payee = get_hash32(vm, "payee"),
        .basis_points = get_value<uint16_t>(vm, "basis-points")};
  }
  if (payload == "update-base-uri") {
    return mosaic::schema::update_base_uri_t{.base_uri =
                                                 require(vm, "base-uri")};
  }
  mosaic::common::critical("unsupported payload '{}'", payload);
}

mosaic::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require(vm, "path");
  if (path == "/engine/info" || path == "/registry/info") {
    return {};
  }
  if (path == "/registry/owner" || path == "/registry/approved" ||
      path == "/registry/artifact") {
    return encoder.encode(get_value<uint64_t>(vm, "token-id"));
  }
  if (path == "/registry/balance" || path == "/registry/cooldown" ||
      path == "/engine/nonce") {
    return encoder.encode(get_hash32(vm, "address"));
  }
  if (path == "/registry/operator") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "holder"), get_hash32(vm, "operator")});
  }
  if (path == "/registry/royalty") {
    if (!vm.contains("sale-price")) {
      return {};
    }
    return encoder.encode(get_amount(vm, "sale-price"));
  }
  if (path == "/registry/interface") {
    auto text = require(vm, "interface-id");
    auto bytes = mosaic::schema::try_from_hex(text);
    if (!bytes || bytes->size() != 4) {
      mosaic::common::critical("--interface-id must be 4 bytes of hex");
    }
    auto interface_id = uint32_t{};
    for (const auto byte : *bytes) {
      interface_id = (interface_id << 8u) | byte;
    }
    return encoder.encode(interface_id);
  }
  mosaic::common::critical("unsupported query path '{}'", path);
}

std::string format_output(const po::variables_map& vm,
                          const mosaic::schema::bytes_t& bytes) {
  auto format = vm["output"].as<std::string>();
  if (format == "hex") {
    return mosaic::schema::to_hex(mosaic::schema::bytes_view_t{bytes});
  }
  if (format == "base64") {
    return mosaic::schema::to_base64(mosaic::schema::bytes_view_t{bytes});
  }
  mosaic::common::critical("--output must be hex|base64");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  mosaic_transaction_builder transaction [options]\n"
            << "  mosaic_transaction_builder query-key [options]\n"
            << "  mosaic_transaction_builder address [options]\n"
            << "  mosaic_transaction_builder chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"mosaic_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|address|chain-id")(
      "payload", po::value<std::string>(),
      "mint|approve|set-operator|transfer|safe-transfer|configure-royalty|"
      "update-base-uri")("output",
                         po::value<std::string>()->default_value("base64"),
                         "hex|base64")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name",
      po::value<std::string>()->default_value(std::string{kDefaultChainName}),
      "name hashed by the chain-id command")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "value", po::value<std::string>()->default_value("0"),
      "attached payment in base units (decimal)")(
      "signer-public-key-hex", po::value<std::string>(),
      "ed25519 public key hex")(
      "secret-key-hex", po::value<std::string>(),
      "ed25519 32-byte seed hex; signs the transaction")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "precomputed signature hex")(
      "recipient", po::value<std::string>(), "mint recipient address")(
      "trait-commitment", po::value<std::string>(), "trait root hash32 hex")(
      "layer-count", po::value<uint32_t>(), "number of layers")(
      "spender", po::value<std::string>(), "spender address")(
      "token-id", po::value<uint64_t>(), "artifact id")(
      "operator", po::value<std::string>(), "operator address")(
      "approved", po::value<bool>()->default_value(true),
      "grant (true) or revoke (false)")("from", po::value<std::string>(),
                                        "current holder address")(
      "to", po::value<std::string>(), "new holder address")(
      "payee", po::value<std::string>(), "royalty payee address")(
      "basis-points", po::value<uint16_t>(), "royalty rate")(
      "base-uri", po::value<std::string>(), "new metadata base URI")(
      "path", po::value<std::string>(), "query path")(
      "address", po::value<std::string>(), "address hex")(
      "holder", po::value<std::string>(), "holder address hex")(
      "sale-price", po::value<std::string>(), "sale price (decimal)")(
      "interface-id", po::value<std::string>(), "4-byte interface id hex");

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
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto encoder = encoder_t{};
    auto transaction = mosaic::schema::transaction_t{
        .version = 1,
        .chain_id = get_hash32(vm, "chain-id"),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = get_signer(vm),
        .value = get_amount(vm, "value"),
        .payload = build_payload(vm),
        .signature = get_signature(vm)};
    if (auto secret = get_secret_key(vm)) {
      auto message =
          mosaic::execution::make_signing_payload(encoder, transaction);
      auto signature = mosaic::crypto::sign(
          mosaic::schema::bytes_view_t{message}, *secret);
      if (!signature) {
        mosaic::common::critical("failed to sign transaction");
      }
      transaction.signature = *signature;
    }
    std::cout << format_output(vm, encoder.encode(transaction)) << '\n';
    return 0;
  }

  if (command == "query-key") {
    std::cout << format_output(vm, build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "address") {
    auto address = mosaic::crypto::derive_address(get_signer(vm));
    std::cout << mosaic::schema::to_hex(address) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = mosaic::blake3::hash(
        std::string_view{vm["chain-name"].as<std::string>()});
    std::cout << mosaic::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  mosaic::common::critical(
      "command must be transaction|query-key|address|chain-id");
}
