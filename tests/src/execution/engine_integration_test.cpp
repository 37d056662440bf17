#include <mosaic/crypto/verify.hpp>
#include <mosaic/execution/engine.hpp>
#include <mosaic/execution/signing.hpp>
#include <mosaic/registry/constants.hpp>
#include <mosaic/registry/receiver.hpp>
#include <mosaic/schema/envelope_error_code.hpp>
#include <mosaic/schema/registry_info.hpp>
#include <mosaic/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using mosaic::schema::address_t;
using mosaic::schema::amount_t;
using mosaic::schema::hash32_t;
using mosaic::schema::registry_error_code;
using mosaic::schema::token_id_t;
using mosaic::testing::encode_tx;
using mosaic::testing::execution_fixture;
using mosaic::testing::make_address;
using mosaic::testing::make_hash;
using mosaic::testing::make_signer;
using mosaic::testing::make_tx;
using mosaic::testing::mint_price;
using mosaic::testing::signer_address;

namespace {

const auto kController = make_signer(0x10);
const auto kAlice = make_signer(0x20);
const auto kBob = make_signer(0x30);

mosaic::schema::transaction_payload_t mint_payload(const address_t& to,
                                                   const uint32_t layers = 4) {
  return mosaic::schema::mint_artifact_t{
      .recipient = to, .trait_commitment = make_hash(0x77), .layer_count = layers};
}

std::tuple<int64_t, hash32_t, hash32_t> engine_info(
    mosaic::execution::engine& engine) {
  auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = mosaic::testing::scale_encoder_t{};
  return encoder.decode<std::tuple<int64_t, hash32_t, hash32_t>>(
      mosaic::schema::make_bytes_view(query.value));
}

std::optional<std::string> attribute_of(
    const mosaic::schema::transaction_event_t& event,
    const std::string& key) {
  auto it = std::ranges::find_if(event.attributes, [&](const auto& attribute) {
    return attribute.key == key;
  });
  if (it == std::end(event.attributes)) {
    return std::nullopt;
  }
  return it->value;
}

class rejecting_receiver final : public mosaic::registry::artifact_receiver {
 public:
  bool on_artifact_received(const address_t&,
                            const std::optional<address_t>&,
                            const token_id_t) override {
    return false;
  }
};

class throwing_receiver final : public mosaic::registry::artifact_receiver {
 public:
  bool on_artifact_received(const address_t&,
                            const std::optional<address_t>&,
                            const token_id_t) override {
    throw std::runtime_error{"gallery offline"};
  }
};

/// Calls back into the engine while a transfer to its account is in flight.
class reentrant_receiver final : public mosaic::registry::artifact_receiver {
 public:
  reentrant_receiver(mosaic::execution::engine& engine,
                     mosaic::schema::bytes_t nested_tx)
      : engine_{engine}, nested_tx_{std::move(nested_tx)} {}

  bool on_artifact_received(const address_t&,
                            const std::optional<address_t>&,
                            const token_id_t token_id) override {
    auto encoder = mosaic::testing::scale_encoder_t{};
    auto key = encoder.encode(token_id);
    auto owner =
        engine_.query("/registry/owner", mosaic::schema::make_bytes_view(key));
    owner_code = owner.code;
    observed_owner = encoder.try_decode<address_t>(
        mosaic::schema::make_bytes_view(owner.value));
    nested_block = engine_.finalize_block(99, {nested_tx_});
    nested_commit = engine_.commit();
    return true;
  }

  uint32_t owner_code{};
  std::optional<address_t> observed_owner;
  mosaic::schema::block_result_t nested_block;
  mosaic::schema::commit_result_t nested_commit;

 private:
  mosaic::execution::engine& engine_;
  mosaic::schema::bytes_t nested_tx_;
};

}  // namespace

TEST(engine_integration, fresh_engine_reports_chain_and_zero_height) {
  auto fixture =
      execution_fixture{"mosaic_engine_fresh", signer_address(kController)};
  auto [height, root, chain_id] = engine_info(fixture.engine());
  EXPECT_EQ(height, 0);
  EXPECT_EQ(chain_id, mosaic::testing::test_chain_id());
  EXPECT_EQ(fixture.engine().info().last_block_state_root, root);
}

TEST(engine_integration, mint_executes_and_is_queryable) {
  auto fixture =
      execution_fixture{"mosaic_engine_mint", signer_address(kController)};
  auto alice = signer_address(kAlice);

  auto result = fixture.run_single(
      make_tx(1, kAlice, mint_payload(alice), mint_price()));
  ASSERT_EQ(result.code, 0u) << result.log;
  auto token = fixture.encoder().decode<token_id_t>(
      mosaic::schema::make_bytes_view(result.data));
  EXPECT_EQ(token, mosaic::registry::kFirstTokenId);

  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_EQ(result.events[0].type, "transfer");
  EXPECT_EQ(attribute_of(result.events[0], "from"), std::string{});
  EXPECT_EQ(attribute_of(result.events[0], "to"), mosaic::schema::to_hex(alice));
  EXPECT_EQ(result.events[1].type, "artifact_issued");
  EXPECT_EQ(attribute_of(result.events[1], "payment"), mint_price().str());

  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token), alice);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/balance", alice), 1u);
  auto record = fixture.query_value<mosaic::schema::artifact_record_t>(
      "/registry/artifact", token);
  EXPECT_EQ(record.layer_count, 4u);
  EXPECT_EQ(record.issued_at, fixture.height());

  auto info = fixture.query_value<mosaic::schema::registry_info_t>(
      "/registry/info");
  EXPECT_EQ(info.name, mosaic::registry::kName);
  EXPECT_EQ(info.total_minted, 1u);
  EXPECT_EQ(info.remaining_supply, mosaic::registry::kSupplyCap - 1);
  EXPECT_EQ(info.collected, mint_price());
  EXPECT_EQ(info.controller, signer_address(kController));
}

TEST(engine_integration, envelope_checks_reject_before_execution) {
  auto fixture =
      execution_fixture{"mosaic_engine_envelope", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto& engine = fixture.engine();

  auto garbage = mosaic::schema::bytes_t{0xFF, 0x01};
  auto check = engine.check_transaction(mosaic::schema::make_bytes_view(garbage));
  EXPECT_EQ(check.code, 1u);
  EXPECT_EQ(check.codespace, "mosaic.checktx");

  auto wrong_version = make_tx(1, kAlice, mint_payload(alice), mint_price());
  wrong_version.version = 2;
  EXPECT_EQ(fixture.run_single(wrong_version).code, 2u);

  auto wrong_chain = make_tx(1, kAlice, mint_payload(alice), mint_price());
  wrong_chain.chain_id = make_hash(0x01);
  auto chain_result = fixture.run_single(wrong_chain);
  EXPECT_EQ(chain_result.code, 3u);
  EXPECT_EQ(chain_result.codespace, "mosaic.finalize");

  auto wrong_nonce = make_tx(2, kAlice, mint_payload(alice), mint_price());
  EXPECT_EQ(fixture.run_single(wrong_nonce).code, 4u);

  auto zero_signer = make_tx(1, mosaic::schema::ed25519_public_key_t{},
                             mint_payload(alice), mint_price());
  EXPECT_EQ(fixture.run_single(zero_signer).code, 5u);

  EXPECT_EQ(fixture.query_value<uint64_t>("/engine/nonce", alice), 0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/balance", alice), 0u);
}

TEST(engine_integration, check_tx_does_not_consume_nonce) {
  auto fixture =
      execution_fixture{"mosaic_engine_checktx", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto raw = encode_tx(make_tx(1, kAlice, mint_payload(alice), mint_price()));
  auto bytes = mosaic::schema::make_bytes_view(raw);
  EXPECT_EQ(fixture.engine().check_transaction(bytes).code, 0u);
  EXPECT_EQ(fixture.engine().check_transaction(bytes).code, 0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/engine/nonce", alice), 0u);
}

TEST(engine_integration, failed_registry_call_consumes_nonce) {
  auto fixture =
      execution_fixture{"mosaic_engine_nonce", signer_address(kController)};
  auto alice = signer_address(kAlice);

  auto underpaid = fixture.run_single(make_tx(1, kAlice, mint_payload(alice)));
  EXPECT_EQ(underpaid.code,
            static_cast<uint32_t>(registry_error_code::payment_too_low));
  EXPECT_EQ(underpaid.codespace, "mosaic.registry");
  EXPECT_EQ(underpaid.log, "payment_too_low");
  EXPECT_TRUE(underpaid.events.empty());
  EXPECT_EQ(fixture.query_value<uint64_t>("/engine/nonce", alice), 1u);

  EXPECT_EQ(fixture.run_single(make_tx(1, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            4u);
  EXPECT_EQ(fixture.run_single(make_tx(2, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
}

TEST(engine_integration, cooldown_is_measured_in_blocks) {
  auto fixture =
      execution_fixture{"mosaic_engine_cooldown", signer_address(kController)};
  auto alice = signer_address(kAlice);

  ASSERT_EQ(fixture.run_single(make_tx(1, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
  // Reported for the next block: minted at 1, height 2 is next.
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/cooldown", alice),
            mosaic::registry::kMintCooldown - 1);

  auto blocked = fixture.run_single(
      make_tx(2, kAlice, mint_payload(alice), mint_price()));
  EXPECT_EQ(blocked.code,
            static_cast<uint32_t>(registry_error_code::cooldown_active));

  // Mint landed at height 1, the blocked attempt at 2; 3..18 are empty.
  fixture.skip_blocks(mosaic::registry::kMintCooldown - 2);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/cooldown", alice), 0u);
  EXPECT_EQ(fixture.run_single(make_tx(3, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/balance", alice), 2u);
}

TEST(engine_integration, transfers_and_delegation_flow) {
  auto fixture =
      execution_fixture{"mosaic_engine_transfer", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto bob = signer_address(kBob);
  auto carol = make_address(0x40);

  auto block = fixture.run_block(
      {make_tx(1, kAlice, mint_payload(alice), mint_price()),
       make_tx(2, kAlice,
               mosaic::schema::set_operator_approval_t{.operator_id = bob,
                                                       .approved = true}),
       make_tx(1, kBob,
               mosaic::schema::transfer_artifact_t{
                   .from = alice, .to = carol, .token_id = 1, .safe = false})});
  for (const auto& result : block.tx_results) {
    EXPECT_EQ(result.code, 0u) << result.log;
  }
  ASSERT_FALSE(block.tx_results[1].events.empty());
  EXPECT_EQ(block.tx_results[1].events[0].type, "approval_for_all");
  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token_id_t{1}),
            carol);
  EXPECT_TRUE(fixture.query_value<bool>("/registry/operator",
                                        std::tuple{alice, bob}));

  auto denied = fixture.run_single(make_tx(
      3, kAlice,
      mosaic::schema::transfer_artifact_t{
          .from = carol, .to = alice, .token_id = 1, .safe = false}));
  EXPECT_EQ(denied.code, static_cast<uint32_t>(
                             registry_error_code::caller_not_owner_nor_approved));
}

TEST(engine_integration, receiver_hook_rejection_is_reported) {
  auto fixture =
      execution_fixture{"mosaic_engine_receiver", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto gallery = make_address(0x50);
  fixture.engine().register_receiver(gallery,
                                     std::make_shared<rejecting_receiver>());

  ASSERT_EQ(fixture.run_single(make_tx(1, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
  auto rejected = fixture.run_single(make_tx(
      2, kAlice,
      mosaic::schema::transfer_artifact_t{
          .from = alice, .to = gallery, .token_id = 1, .safe = true}));
  EXPECT_EQ(rejected.code,
            static_cast<uint32_t>(registry_error_code::unsafe_recipient));
  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token_id_t{1}),
            alice);

  auto plain = fixture.run_single(make_tx(
      3, kAlice,
      mosaic::schema::transfer_artifact_t{
          .from = alice, .to = gallery, .token_id = 1, .safe = false}));
  EXPECT_EQ(plain.code, 0u);
}

TEST(engine_integration, controller_operations) {
  auto fixture =
      execution_fixture{"mosaic_engine_controller", signer_address(kController)};
  auto payee = make_address(0x60);

  auto denied = fixture.run_single(make_tx(
      1, kAlice,
      mosaic::schema::update_base_uri_t{.base_uri = "ar://hijack/"}));
  EXPECT_EQ(denied.code,
            static_cast<uint32_t>(registry_error_code::not_controller));

  auto block = fixture.run_block(
      {make_tx(1, kController,
               mosaic::schema::configure_royalty_t{.payee = payee,
                                                   .basis_points = 750}),
       make_tx(2, kController,
               mosaic::schema::update_base_uri_t{.base_uri = "ar://next/"})});
  EXPECT_EQ(block.tx_results[0].code, 0u);
  ASSERT_EQ(block.tx_results[1].code, 0u);
  ASSERT_EQ(block.tx_results[1].events.size(), 1u);
  EXPECT_EQ(block.tx_results[1].events[0].type, "base_uri_changed");

  auto royalty = fixture.query_value<mosaic::schema::royalty_state_t>(
      "/registry/royalty");
  EXPECT_EQ(royalty.payee, payee);
  EXPECT_EQ(royalty.basis_points, 750u);
  auto [to, amount] = fixture.query_value<std::tuple<address_t, amount_t>>(
      "/registry/royalty", amount_t{10'000});
  EXPECT_EQ(to, payee);
  EXPECT_EQ(amount, amount_t{750});

  auto info = fixture.query_value<mosaic::schema::registry_info_t>(
      "/registry/info");
  EXPECT_EQ(info.base_uri, "ar://next/");
}

TEST(engine_integration, query_errors_are_coded) {
  auto fixture =
      execution_fixture{"mosaic_engine_queries", signer_address(kController)};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();

  auto unsupported = engine.query("/registry/unknown", {});
  EXPECT_EQ(unsupported.code, 3u);
  EXPECT_EQ(unsupported.codespace, "mosaic.query");

  auto short_key = mosaic::schema::bytes_t{0x01};
  auto invalid = engine.query("/registry/balance",
                              mosaic::schema::make_bytes_view(short_key));
  EXPECT_EQ(invalid.code, 1u);

  auto token = encoder.encode(token_id_t{42});
  auto missing =
      engine.query("/registry/owner", mosaic::schema::make_bytes_view(token));
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(registry_error_code::invalid_token));
  EXPECT_EQ(missing.codespace, "mosaic.registry");

  auto zero = encoder.encode(mosaic::schema::make_zero_address());
  auto zero_balance =
      engine.query("/registry/balance", mosaic::schema::make_bytes_view(zero));
  EXPECT_EQ(zero_balance.code,
            static_cast<uint32_t>(registry_error_code::zero_address));

  EXPECT_TRUE(fixture.query_value<bool>("/registry/interface",
                                        mosaic::registry::kRoyaltyInfoId));
  EXPECT_FALSE(fixture.query_value<bool>(
      "/registry/interface", mosaic::registry::kInvalidInterfaceId));
}

TEST(engine_integration, state_root_is_deterministic) {
  auto first =
      execution_fixture{"mosaic_engine_root_a", signer_address(kController)};
  auto second =
      execution_fixture{"mosaic_engine_root_b", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto txs = std::vector{make_tx(1, kAlice, mint_payload(alice), mint_price())};

  auto empty_root = first.engine().info().last_block_state_root;
  auto a = first.run_block(txs);
  auto b = second.run_block(txs);
  EXPECT_EQ(a.state_root, b.state_root);
  EXPECT_NE(a.state_root, empty_root);
  EXPECT_EQ(first.engine().info().last_block_state_root, a.state_root);
}

TEST(engine_integration, committed_state_survives_restart) {
  auto db = mosaic::testing::make_db_path("mosaic_engine_restart");
  auto alice = signer_address(kAlice);
  auto bob = signer_address(kBob);
  auto committed_root = hash32_t{};
  {
    auto encoder = mosaic::testing::scale_encoder_t{};
    auto storage = mosaic::storage::make_storage<
        mosaic::storage::rocksdb_storage_tag>(db);
    auto engine = mosaic::execution::engine{
        encoder, storage,
        mosaic::testing::make_engine_options(signer_address(kController))};
    auto block = engine.finalize_block(
        1, {encode_tx(make_tx(1, kAlice, mint_payload(alice), mint_price())),
            encode_tx(make_tx(2, kAlice,
                              mosaic::schema::approve_spender_t{
                                  .spender = bob, .token_id = 1}))});
    ASSERT_EQ(block.tx_results[0].code, 0u);
    ASSERT_EQ(block.tx_results[1].code, 0u);
    committed_root = engine.commit().state_root;
  }
  {
    auto encoder = mosaic::testing::scale_encoder_t{};
    auto storage = mosaic::storage::make_storage<
        mosaic::storage::rocksdb_storage_tag>(db);
    // A different configured controller does not override the stored one.
    auto engine = mosaic::execution::engine{
        encoder, storage,
        mosaic::testing::make_engine_options(make_address(0x99))};
    EXPECT_EQ(engine.info().last_block_height, 1);
    EXPECT_EQ(engine.info().last_block_state_root, committed_root);

    auto token = encoder.encode(token_id_t{1});
    auto owner =
        engine.query("/registry/owner", mosaic::schema::make_bytes_view(token));
    ASSERT_EQ(owner.code, 0u);
    EXPECT_EQ(encoder.decode<address_t>(
                  mosaic::schema::make_bytes_view(owner.value)),
              alice);
    auto approved = engine.query("/registry/approved",
                                 mosaic::schema::make_bytes_view(token));
    EXPECT_EQ(encoder.decode<address_t>(
                  mosaic::schema::make_bytes_view(approved.value)),
              bob);

    // Nonces and cooldowns were persisted too.
    auto next = engine.finalize_block(
        2, {encode_tx(make_tx(3, kAlice, mint_payload(alice), mint_price()))});
    EXPECT_EQ(next.tx_results[0].code,
              static_cast<uint32_t>(registry_error_code::cooldown_active));
    engine.commit();

    auto info = engine.query("/registry/info", {});
    auto decoded = encoder.decode<mosaic::schema::registry_info_t>(
        mosaic::schema::make_bytes_view(info.value));
    EXPECT_EQ(decoded.controller, signer_address(kController));
    EXPECT_EQ(decoded.total_minted, 1u);
  }
  mosaic::testing::remove_path(db);
}

TEST(engine_integration, strict_crypto_verifies_signatures) {
  if (!mosaic::crypto::available()) {
    GTEST_SKIP() << "OpenSSL build lacks ed25519";
  }
  auto db = mosaic::testing::make_db_path("mosaic_engine_strict");
  {
    auto encoder = mosaic::testing::scale_encoder_t{};
    auto storage = mosaic::storage::make_storage<
        mosaic::storage::rocksdb_storage_tag>(db);
    auto seed = make_hash(0x05);
    auto public_key = mosaic::crypto::derive_public_key(seed);
    ASSERT_TRUE(public_key.has_value());
    auto holder = signer_address(*public_key);
    auto engine = mosaic::execution::engine{
        encoder, storage,
        mosaic::testing::make_engine_options(signer_address(kController),
                                             true)};

    auto tx = make_tx(1, *public_key, mint_payload(holder), mint_price());
    auto unsigned_check = engine.check_transaction(
        mosaic::schema::make_bytes_view(encode_tx(tx)));
    EXPECT_EQ(unsigned_check.code, 6u);

    auto message = mosaic::execution::make_signing_payload(encoder, tx);
    auto signature =
        mosaic::crypto::sign(mosaic::schema::make_bytes_view(message), seed);
    ASSERT_TRUE(signature.has_value());
    tx.signature = *signature;
    auto raw = encode_tx(tx);
    EXPECT_EQ(engine.check_transaction(mosaic::schema::make_bytes_view(raw)).code,
              0u);

    auto block = engine.finalize_block(1, {raw});
    EXPECT_EQ(block.tx_results[0].code, 0u) << block.tx_results[0].log;
  }
  mosaic::testing::remove_path(db);
}

TEST(engine_integration, receiver_hook_can_read_but_not_execute_blocks) {
  auto fixture =
      execution_fixture{"mosaic_engine_reentry", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto gallery = make_address(0x50);
  auto receiver = std::make_shared<reentrant_receiver>(
      fixture.engine(),
      encode_tx(make_tx(3, kAlice,
                        mosaic::schema::approve_spender_t{.spender = gallery,
                                                          .token_id = 1})));
  fixture.engine().register_receiver(gallery, receiver);

  ASSERT_EQ(fixture.run_single(make_tx(1, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
  auto moved = fixture.run_single(make_tx(
      2, kAlice,
      mosaic::schema::transfer_artifact_t{
          .from = alice, .to = gallery, .token_id = 1, .safe = true}));
  EXPECT_EQ(moved.code, 0u) << moved.log;

  // Reads inside the hook see the transfer in progress.
  EXPECT_EQ(receiver->owner_code, 0u);
  ASSERT_TRUE(receiver->observed_owner.has_value());
  EXPECT_EQ(*receiver->observed_owner, gallery);

  ASSERT_EQ(receiver->nested_block.tx_results.size(), 1u);
  EXPECT_EQ(receiver->nested_block.tx_results[0].code,
            static_cast<uint32_t>(registry_error_code::reentrancy));
  EXPECT_EQ(receiver->nested_block.tx_results[0].codespace, "mosaic.registry");
  EXPECT_EQ(receiver->nested_commit.committed_height, 1);

  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token_id_t{1}),
            gallery);
  EXPECT_EQ(fixture.query_value<address_t>("/registry/approved", token_id_t{1}),
            mosaic::schema::make_zero_address());
  EXPECT_EQ(fixture.query_value<uint64_t>("/engine/nonce", alice), 2u);
  EXPECT_EQ(std::get<0>(engine_info(fixture.engine())), 2);
}

TEST(engine_integration, throwing_receiver_fails_only_its_transaction) {
  auto fixture =
      execution_fixture{"mosaic_engine_throwing", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto bob = signer_address(kBob);
  auto gallery = make_address(0x50);
  fixture.engine().register_receiver(gallery,
                                     std::make_shared<throwing_receiver>());

  auto block = fixture.run_block(
      {make_tx(1, kAlice, mint_payload(alice), mint_price()),
       make_tx(2, kAlice,
               mosaic::schema::transfer_artifact_t{
                   .from = alice, .to = gallery, .token_id = 1, .safe = true}),
       make_tx(1, kBob, mint_payload(bob), mint_price())});
  ASSERT_EQ(block.tx_results.size(), 3u);
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(block.tx_results[1].code,
            static_cast<uint32_t>(registry_error_code::unsafe_recipient));
  EXPECT_EQ(block.tx_results[1].codespace, "mosaic.registry");
  EXPECT_TRUE(block.tx_results[1].events.empty());
  EXPECT_EQ(block.tx_results[2].code, 0u);

  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token_id_t{1}),
            alice);
  EXPECT_EQ(fixture.query_value<address_t>("/registry/owner", token_id_t{2}),
            bob);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/balance", gallery), 0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/engine/nonce", alice), 2u);
  EXPECT_EQ(std::get<0>(engine_info(fixture.engine())), 1);

  auto plain = fixture.run_single(make_tx(
      3, kAlice,
      mosaic::schema::transfer_artifact_t{
          .from = alice, .to = gallery, .token_id = 1, .safe = false}));
  EXPECT_EQ(plain.code, 0u);
}

TEST(engine_integration, block_height_zero_is_rejected) {
  auto fixture =
      execution_fixture{"mosaic_engine_height_zero", signer_address(kController)};
  auto alice = signer_address(kAlice);
  auto root = fixture.engine().info().last_block_state_root;

  auto block = fixture.engine().finalize_block(
      0, {encode_tx(make_tx(1, kAlice, mint_payload(alice), mint_price()))});
  ASSERT_EQ(block.tx_results.size(), 1u);
  EXPECT_EQ(block.tx_results[0].code,
            static_cast<uint32_t>(
                mosaic::schema::envelope_error_code::invalid_block_height));
  EXPECT_EQ(block.tx_results[0].codespace, "mosaic.finalize");
  EXPECT_EQ(block.state_root, root);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/balance", alice), 0u);

  // Nothing ran, so the nonce and the cooldown are both still free.
  EXPECT_EQ(fixture.run_single(make_tx(1, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            0u);
  EXPECT_EQ(fixture.run_single(make_tx(2, kAlice, mint_payload(alice),
                                       mint_price()))
                .code,
            static_cast<uint32_t>(registry_error_code::cooldown_active));
}
