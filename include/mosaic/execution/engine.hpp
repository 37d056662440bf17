#pragma once

#include <mosaic/execution/signature_verifier.hpp>
#include <mosaic/registry/registry.hpp>
#include <mosaic/schema/app_info.hpp>
#include <mosaic/schema/block_result.hpp>
#include <mosaic/schema/commit_result.hpp>
#include <mosaic/schema/encoding/scale/encoder.hpp>
#include <mosaic/schema/primitives.hpp>
#include <mosaic/schema/query_result.hpp>
#include <mosaic/schema/transaction.hpp>
#include <mosaic/schema/transaction_result.hpp>
#include <mosaic/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace mosaic::execution {

struct engine_options final {
  mosaic::schema::hash32_t chain_id{};
  /// When false every signature is accepted.
  bool require_strict_crypto{true};
  /// Used only when the database holds no registry yet.
  mosaic::registry::registry_config registry{};
};

/// Deterministic registry state machine driven by the node service.
///
/// The engine validates transaction envelopes, executes payloads against the
/// registry, persists committed state to RocksDB and serves read queries.
class engine final {
 public:
  /// Construct the engine and load any committed state from storage.
  engine(mosaic::schema::encoding::scale_encoder_t& encoder,
         mosaic::storage::storage<mosaic::storage::rocksdb_storage_tag>& storage,
         engine_options options);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode and envelope checks only; does not mutate state.
  mosaic::schema::transaction_result_t check_transaction(
      const mosaic::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions run in order at `now = height`; per-tx results are returned
  /// even on failures. Height 0 is rejected. Receiver hooks run on the calling
  /// thread and may read through query() and info(); a block finalized from
  /// inside a hook fails every transaction with reentrancy.
  mosaic::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<mosaic::schema::bytes_t>& txs);

  /// Persist the latest finalized block state. Called from inside a receiver
  /// hook it persists nothing and reports the last committed block.
  mosaic::schema::commit_result_t commit();

  /// Latest committed height and state root.
  mosaic::schema::app_info_t info() const;

  /// Execute a read-path query by route. `data` is the SCALE-encoded request.
  mosaic::schema::query_result_t query(std::string_view path,
                                       const mosaic::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Attach an in-process receiver hook to an account.
  void register_receiver(
      const mosaic::schema::address_t& account,
      std::shared_ptr<mosaic::registry::artifact_receiver> receiver);

 private:
  /// Check version, chain id, nonce and signature.
  mosaic::schema::transaction_result_t validate_transaction(
      const mosaic::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Dispatch a validated payload into the registry.
  mosaic::schema::transaction_result_t execute_operation(
      const mosaic::schema::transaction_t& tx,
      const mosaic::registry::call_context& context);

  /// Current registry state and nonces as storage rows, grouped by keyspace.
  std::vector<mosaic::storage::prefix_replacement_t> make_state_rows() const;
  mosaic::schema::hash32_t compute_state_root(
      const std::vector<mosaic::storage::prefix_replacement_t>& rows) const;

  mosaic::schema::query_result_t query_registry(
      std::string_view path,
      const mosaic::schema::bytes_view_t& data);

  /// Rebuild registry and nonces from committed storage at startup.
  void load_persisted_state();

  uint64_t last_nonce(const mosaic::schema::address_t& signer) const;

  // Recursive so receiver hooks can read back through the engine.
  mutable std::recursive_mutex mutex_;
  mosaic::schema::encoding::scale_encoder_t& encoder_;
  mosaic::storage::storage<mosaic::storage::rocksdb_storage_tag>& storage_;
  engine_options options_;
  mosaic::registry::registry registry_;
  mosaic::registry::single_flight block_in_flight_;
  std::map<mosaic::schema::address_t, uint64_t> nonces_;
  int64_t last_committed_height_{};
  mosaic::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  mosaic::schema::hash32_t pending_state_root_{};
  signature_verifier_t signature_verifier_;
};

}  // namespace mosaic::execution
