#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mosaic/blake3/hash.hpp>
#include <mosaic/common/critical.hpp>
#include <mosaic/crypto/verify.hpp>
#include <mosaic/execution/engine.hpp>
#include <mosaic/execution/events.hpp>
#include <mosaic/execution/signing.hpp>
#include <mosaic/registry/constants.hpp>
#include <mosaic/schema/envelope_error_code.hpp>
#include <mosaic/schema/key/engine_keys.hpp>
#include <mosaic/schema/query_error_code.hpp>
#include <mosaic/schema/registry_info.hpp>
#include <mosaic/schema/registry_meta.hpp>
#include <exception>
#include <set>
#include <tuple>
#include <utility>

using namespace mosaic::schema;

namespace {

using encoder_t = mosaic::schema::encoding::scale_encoder_t;

constexpr auto kCheckTxCodespace = std::string_view{"mosaic.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"mosaic.finalize"};
constexpr auto kRegistryCodespace = std::string_view{"mosaic.registry"};
constexpr auto kQueryCodespace = std::string_view{"mosaic.query"};

std::optional<mosaic::schema::transaction_t> decode_transaction(
    encoder_t& encoder,
    const mosaic::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<mosaic::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const envelope_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
  result.height = height;
  return result;
}

transaction_result_t make_registry_error_result(const registry_error_code code) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{name_of(code)};
  result.codespace = std::string{kRegistryCodespace};
  return result;
}

query_result_t make_registry_query_error(const registry_error_code code,
                                         const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{name_of(code)};
  result.codespace = std::string{kRegistryCodespace};
  result.height = height;
  return result;
}

/// Decode every row of one keyspace; a row that fails to decode means the
/// database is corrupt.
template <typename Key, typename Value>
std::vector<std::pair<Key, Value>> load_rows(
    encoder_t& encoder,
    mosaic::storage::storage<mosaic::storage::rocksdb_storage_tag>& storage,
    const std::string_view prefix) {
  auto out = std::vector<std::pair<Key, Value>>{};
  auto prefix_key = mosaic::schema::key::make_prefix_key(encoder, prefix);
  for (const auto& [key, value] :
       storage.list_by_prefix(make_bytes_view(prefix_key))) {
    auto id = mosaic::schema::key::parse_prefixed_key<Key>(
        encoder, prefix, make_bytes_view(key));
    auto decoded = encoder.try_decode<Value>(make_bytes_view(value));
    if (!id || !decoded) {
      mosaic::common::critical("corrupt row under keyspace '{}'", prefix);
    }
    out.emplace_back(std::move(*id), std::move(*decoded));
  }
  return out;
}

}  // namespace

namespace mosaic::execution {

engine::engine(
    mosaic::schema::encoding::scale_encoder_t& encoder,
    mosaic::storage::storage<mosaic::storage::rocksdb_storage_tag>& storage,
    engine_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{std::move(options)},
      registry_{options_.registry} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  } else if (!mosaic::crypto::available()) {
    spdlog::warn("OpenSSL has no ed25519 support; every signature will fail");
  }
  spdlog::info("Execution engine ready at height {} with {} artifact(s)",
               last_committed_height_, registry_.total_minted());
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::warn("CheckTx rejected undecodable transaction: {}", decode_error);
    return make_error_result(envelope_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckTxCodespace);
  }
  auto result = validate_transaction(*maybe_tx, kCheckTxCodespace);
  if (result.code == 0) {
    result.gas_wanted = 1000;
  }
  return result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        envelope_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != options_.chain_id) {
    return make_error_result(envelope_error_code::invalid_chain_id,
                             "invalid chain id",
                             "expected " + to_hex(options_.chain_id),
                             codespace);
  }
  if (is_zero_address(tx.signer)) {
    return make_error_result(envelope_error_code::invalid_signer,
                             "invalid signer", "signer public key is zero",
                             codespace);
  }
  auto signer = mosaic::crypto::derive_address(tx.signer);
  auto expected_nonce = last_nonce(signer) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error_result(envelope_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected " + std::to_string(expected_nonce),
                             codespace);
  }
  if (options_.require_strict_crypto) {
    auto message = make_signing_payload(encoder_, tx);
    if (!signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_error_result(
          envelope_error_code::signature_verification_failed,
          "signature verification failed", "", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const mosaic::registry::call_context& context) {
  auto result = transaction_result_t{};
  auto code = registry_error_code::ok;
  // Only receiver hooks throw out of the registry, after it restored its state.
  try {
    std::visit(
        overloaded{
            [&](const mint_artifact_t& payload) {
              auto minted = registry_.mint(context, payload.recipient,
                                           payload.trait_commitment,
                                           payload.layer_count);
              code = minted.code;
              if (minted.ok()) {
                result.data = encoder_.encode(minted.value);
                result.info = "mint_artifact accepted";
              }
            },
            [&](const approve_spender_t& payload) {
              code = registry_.approve(context, payload.spender,
                                       payload.token_id);
              result.info = "approve_spender accepted";
            },
            [&](const set_operator_approval_t& payload) {
              code = registry_.set_approval_for_all(context, payload.operator_id,
                                                    payload.approved);
              result.info = "set_operator_approval accepted";
            },
            [&](const transfer_artifact_t& payload) {
              code = payload.safe
                         ? registry_.safe_transfer(context, payload.from,
                                                   payload.to, payload.token_id)
                         : registry_.transfer(context, payload.from, payload.to,
                                              payload.token_id);
              result.info = "transfer_artifact accepted";
            },
            [&](const configure_royalty_t& payload) {
              code = registry_.configure_royalty(context, payload.payee,
                                                 payload.basis_points);
              result.info = "configure_royalty accepted";
            },
            [&](const update_base_uri_t& payload) {
              code = registry_.update_base_uri(context, payload.base_uri);
              result.info = "update_base_uri accepted";
            }},
        tx.payload);
  } catch (const std::exception& ex) {
    spdlog::warn("Receiver hook failed during transaction from {}: {}",
                 to_hex(context.caller), ex.what());
    code = registry_error_code::unsafe_recipient;
  }

  auto events = registry_.take_events();
  if (code != registry_error_code::ok) {
    return make_registry_error_result(code);
  }
  result.events = make_transaction_events(events);
  result.gas_wanted = 1000;
  result.gas_used = 750;
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  result.state_root = pending_state_root_;

  auto guard = block_in_flight_.try_enter();
  if (!guard) {
    spdlog::warn("Block {} finalized from inside a receiver hook", height);
    result.tx_results.assign(
        txs.size(), make_registry_error_result(registry_error_code::reentrancy));
    return result;
  }
  if (height == 0) {
    spdlog::error("Refusing to finalize block at height 0");
    result.tx_results.assign(
        txs.size(),
        make_error_result(envelope_error_code::invalid_block_height,
                          "invalid block height", "height must be positive",
                          kFinalizeCodespace));
    return result;
  }

  for (const auto& raw_tx : txs) {
    auto decode_error = std::string{};
    auto maybe_tx =
        decode_transaction(encoder_, make_bytes_view(raw_tx), decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(make_error_result(
          envelope_error_code::invalid_transaction, "invalid transaction",
          decode_error, kFinalizeCodespace));
      continue;
    }

    auto validation = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (validation.code != 0) {
      spdlog::warn("Rejected transaction at height {}: {}", height,
                   validation.log);
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    // A valid envelope consumes its nonce even when the registry call fails.
    auto signer = mosaic::crypto::derive_address(maybe_tx->signer);
    nonces_[signer] = maybe_tx->nonce;

    auto context = mosaic::registry::call_context{
        .caller = signer, .value = maybe_tx->value, .now = height};
    auto tx_result = execute_operation(*maybe_tx, context);
    spdlog::debug("Executed transaction from {} at height {}: code {} {}",
                  to_hex(signer), height, tx_result.code, tx_result.log);
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = compute_state_root(make_state_rows());
  result.state_root = pending_state_root_;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto result = commit_result_t{};
  result.retain_height = 0;

  auto guard = block_in_flight_.try_enter();
  if (!guard) {
    spdlog::warn("Commit requested from inside a receiver hook; ignored");
    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    return result;
  }
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  storage_.replace_by_prefixes(
      make_state_rows(),
      mosaic::storage::committed_state{
          .height = last_committed_height_,
          .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} state root {}", last_committed_height_,
               to_hex(last_committed_state_root_));

  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  if (path == "/engine/info") {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, options_.chain_id});
    result.height = last_committed_height_;
    return result;
  }
  if (path == "/engine/nonce") {
    auto signer = encoder_.try_decode<address_t>(data);
    if (!signer) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE address", last_committed_height_);
    }
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(last_nonce(*signer));
    result.height = last_committed_height_;
    return result;
  }
  if (path.starts_with("/registry/")) {
    return query_registry(path, data);
  }
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", last_committed_height_);
}

query_result_t engine::query_registry(const std::string_view path,
                                      const bytes_view_t& data) {
  auto height = last_committed_height_;
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;

  auto invalid_key = [&](const std::string_view expected) {
    return make_query_error(query_error_code::invalid_key,
                            "expected SCALE " + std::string{expected}, height);
  };

  if (path == "/registry/info") {
    result.value = encoder_.encode(registry_info_t{
        .name = std::string{registry_.name()},
        .symbol = std::string{registry_.symbol()},
        .base_uri = registry_.base_uri(),
        .controller = registry_.controller(),
        .total_minted = registry_.total_minted(),
        .remaining_supply = registry_.remaining_supply(),
        .next_token_id = registry_.next_token_id(),
        .collected = registry_.collected(),
        .royalty = registry_.royalty()});
    return result;
  }
  if (path == "/registry/owner" || path == "/registry/approved" ||
      path == "/registry/artifact") {
    auto token_id = encoder_.try_decode<token_id_t>(data);
    if (!token_id) {
      return invalid_key("token id");
    }
    if (path == "/registry/artifact") {
      auto record = registry_.artifact(*token_id);
      if (!record.ok()) {
        return make_registry_query_error(record.code, height);
      }
      result.value = encoder_.encode(record.value);
      return result;
    }
    auto holder = path == "/registry/owner"
                      ? registry_.owner_of(*token_id)
                      : registry_.get_approved(*token_id);
    if (!holder.ok()) {
      return make_registry_query_error(holder.code, height);
    }
    result.value = encoder_.encode(holder.value);
    return result;
  }
  if (path == "/registry/balance") {
    auto holder = encoder_.try_decode<address_t>(data);
    if (!holder) {
      return invalid_key("address");
    }
    auto balance = registry_.balance_of(*holder);
    if (!balance.ok()) {
      return make_registry_query_error(balance.code, height);
    }
    result.value = encoder_.encode(balance.value);
    return result;
  }
  if (path == "/registry/operator") {
    auto pair = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!pair) {
      return invalid_key("(holder, operator)");
    }
    result.value = encoder_.encode(registry_.is_approved_for_all(
        std::get<0>(*pair), std::get<1>(*pair)));
    return result;
  }
  if (path == "/registry/cooldown") {
    auto caller = encoder_.try_decode<address_t>(data);
    if (!caller) {
      return invalid_key("address");
    }
    // Measured against the height the next block will execute at.
    result.value = encoder_.encode(registry_.cooldown_remaining(
        *caller, static_cast<block_height_t>(height) + 1));
    return result;
  }
  if (path == "/registry/royalty") {
    if (data.empty()) {
      result.value = encoder_.encode(registry_.royalty());
      return result;
    }
    auto sale_price = encoder_.try_decode<amount_t>(data);
    if (!sale_price) {
      return invalid_key("sale price");
    }
    auto [payee, amount] = registry_.royalty_info(*sale_price);
    result.value = encoder_.encode(std::tuple{payee, amount});
    return result;
  }
  if (path == "/registry/interface") {
    auto interface_id = encoder_.try_decode<uint32_t>(data);
    if (!interface_id) {
      return invalid_key("interface id");
    }
    result.value =
        encoder_.encode(registry_.supports_interface(*interface_id));
    return result;
  }
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", height);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!options_.require_strict_crypto) {
    spdlog::warn("Ignoring signature verifier override; strict crypto is off");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

void engine::register_receiver(
    const address_t& account,
    std::shared_ptr<mosaic::registry::artifact_receiver> receiver) {
  auto lock = std::scoped_lock{mutex_};
  registry_.register_receiver(account, std::move(receiver));
}

std::vector<mosaic::storage::prefix_replacement_t> engine::make_state_rows()
    const {
  namespace key = mosaic::schema::key;
  const auto& state = registry_.state();
  auto rows = std::vector<mosaic::storage::prefix_replacement_t>{};
  rows.reserve(key::kEngineKeyspaces.size());

  auto keyspace = [&](const std::string_view prefix) -> auto& {
    return rows
        .emplace_back(mosaic::storage::prefix_replacement_t{
            .prefix = key::make_prefix_key(encoder_, prefix), .entries = {}})
        .entries;
  };

  auto& nonces = keyspace(key::kNonceKeyPrefix);
  for (const auto& [signer, nonce] : nonces_) {
    nonces.emplace_back(key::make_nonce_key(encoder_, signer),
                        encoder_.encode(nonce));
  }

  auto& meta = keyspace(key::kRegistryMetaKeyPrefix);
  meta.emplace_back(key::make_registry_meta_key(encoder_),
                    encoder_.encode(registry_meta_t{
                        .controller = state.controller,
                        .base_uri = state.base_uri,
                        .next_token_id = state.minting.next_token_id(),
                        .total_minted = state.minting.total_minted(),
                        .collected = registry_.collected(),
                        .royalty = state.royalty.state()}));

  auto& owners = keyspace(key::kOwnerKeyPrefix);
  for (const auto& [token_id, owner] : state.ledger.owners()) {
    owners.emplace_back(key::make_owner_key(encoder_, token_id),
                        encoder_.encode(owner));
  }

  auto& approvals = keyspace(key::kApprovalKeyPrefix);
  for (const auto& [token_id, spender] : state.delegations.approvals()) {
    approvals.emplace_back(key::make_approval_key(encoder_, token_id),
                           encoder_.encode(spender));
  }

  auto& operators = keyspace(key::kOperatorKeyPrefix);
  for (const auto& [holder, operator_id] : state.delegations.operators()) {
    operators.emplace_back(
        key::make_operator_key(encoder_, holder, operator_id),
        encoder_.encode(true));
  }

  auto& artifacts = keyspace(key::kArtifactKeyPrefix);
  for (const auto& [token_id, record] : state.artifacts.records()) {
    artifacts.emplace_back(key::make_artifact_key(encoder_, token_id),
                           encoder_.encode(record));
  }

  auto& cooldowns = keyspace(key::kCooldownKeyPrefix);
  for (const auto& [caller, last_mint] : state.minting.last_mint()) {
    cooldowns.emplace_back(key::make_cooldown_key(encoder_, caller),
                           encoder_.encode(last_mint));
  }

  for (auto& row : rows) {
    std::ranges::sort(row.entries);
  }
  return rows;
}

hash32_t engine::compute_state_root(
    const std::vector<mosaic::storage::prefix_replacement_t>& rows) const {
  auto material = bytes_t{};
  for (const auto& row : rows) {
    for (const auto& [key, value] : row.entries) {
      encoder_.encode(std::tuple{key, value}, material);
    }
  }
  return mosaic::blake3::hash(make_bytes_view(material));
}

void engine::load_persisted_state() {
  namespace key = mosaic::schema::key;
  spdlog::debug("Loading persisted engine state");

  signature_verifier_ = mosaic::crypto::verify_signature;
  if (!options_.require_strict_crypto) {
    signature_verifier_ = [](const bytes_view_t&, const ed25519_public_key_t&,
                             const ed25519_signature_t&) { return true; };
  }

  auto committed = storage_.load_committed_state();
  if (!committed) {
    last_committed_state_root_ = compute_state_root(make_state_rows());
    pending_state_root_ = last_committed_state_root_;
    spdlog::info("No committed state found; starting a fresh registry");
    return;
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;
  pending_state_root_ = committed->state_root;

  auto meta_key = key::make_registry_meta_key(encoder_);
  auto meta = storage_.get<encoder_t, registry_meta_t>(
      encoder_, make_bytes_view(meta_key));
  if (!meta) {
    mosaic::common::critical("committed state has no registry meta row");
  }
  if (!is_zero_address(options_.registry.controller) &&
      options_.registry.controller != meta->controller) {
    spdlog::warn("Configured controller {} ignored; registry controller is {}",
                 to_hex(options_.registry.controller),
                 to_hex(meta->controller));
  }

  auto owners = std::map<token_id_t, address_t>{};
  for (auto& [token_id, owner] :
       load_rows<token_id_t, address_t>(encoder_, storage_,
                                        key::kOwnerKeyPrefix)) {
    owners.emplace(token_id, owner);
  }
  auto approvals = std::map<token_id_t, address_t>{};
  for (auto& [token_id, spender] :
       load_rows<token_id_t, address_t>(encoder_, storage_,
                                        key::kApprovalKeyPrefix)) {
    approvals.emplace(token_id, spender);
  }
  auto operators = std::set<mosaic::registry::operator_grant_t>{};
  for (auto& [grant, approved] :
       load_rows<std::tuple<address_t, address_t>, bool>(
           encoder_, storage_, key::kOperatorKeyPrefix)) {
    if (approved) {
      operators.insert({std::get<0>(grant), std::get<1>(grant)});
    }
  }
  auto records = std::map<token_id_t, artifact_record_t>{};
  for (auto& [token_id, record] :
       load_rows<token_id_t, artifact_record_t>(encoder_, storage_,
                                                key::kArtifactKeyPrefix)) {
    records.emplace(token_id, record);
  }
  auto last_mint = std::map<address_t, block_height_t>{};
  for (auto& [caller, height] :
       load_rows<address_t, block_height_t>(encoder_, storage_,
                                            key::kCooldownKeyPrefix)) {
    last_mint.emplace(caller, height);
  }
  nonces_.clear();
  for (auto& [signer, nonce] :
       load_rows<address_t, uint64_t>(encoder_, storage_,
                                      key::kNonceKeyPrefix)) {
    nonces_.emplace(signer, nonce);
  }

  registry_ = mosaic::registry::registry{mosaic::registry::registry_state{
      .controller = meta->controller,
      .base_uri = meta->base_uri,
      .ledger = mosaic::registry::identity_ledger{owners},
      .delegations = mosaic::registry::delegation_table{std::move(approvals),
                                                        std::move(operators)},
      .artifacts = mosaic::registry::artifact_store{std::move(records)},
      .minting = mosaic::registry::mint_gate{meta->next_token_id,
                                             meta->total_minted,
                                             meta->collected,
                                             std::move(last_mint)},
      .royalty = mosaic::registry::royalty_policy{meta->royalty}}};

  if (compute_state_root(make_state_rows()) != last_committed_state_root_) {
    mosaic::common::critical(
        "state root mismatch after reloading height {}", last_committed_height_);
  }
}

uint64_t engine::last_nonce(const address_t& signer) const {
  auto it = nonces_.find(signer);
  if (it == std::end(nonces_)) {
    return 0;
  }
  return it->second;
}

}  // namespace mosaic::execution
