#pragma once

#include <mosaic/execution/engine.hpp>
#include <mosaic/node/v1/node.grpc.pb.h>

namespace mosaic::node {

/// Node callback listener used by the consensus driver.
///
/// Quick reference:
/// - Info: handshake, last committed height and state root.
/// - CheckTx: mempool admission; no state mutation.
/// - FinalizeBlock: execute block, return tx results and state root.
/// - Commit: persist finalized state.
/// - Query: read-path routes of the engine.
struct listener final : public mosaic::node::v1::Node::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(mosaic::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const mosaic::node::v1::RequestInfo* request,
      mosaic::node::v1::ResponseInfo* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const mosaic::node::v1::RequestCheckTx* request,
      mosaic::node::v1::ResponseCheckTx* response) override final;

  /// Execute ordered block transactions and return results + state root.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const mosaic::node::v1::RequestFinalizeBlock* request,
      mosaic::node::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const mosaic::node::v1::RequestCommit* request,
      mosaic::node::v1::ResponseCommit* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const mosaic::node::v1::RequestQuery* request,
      mosaic::node::v1::ResponseQuery* response) override final;

  mosaic::execution::engine& execution_engine_;
};

/// Copy an engine result into its protobuf form.
void populate_tx_result(const mosaic::schema::transaction_result_t& source,
                        mosaic::node::v1::TxResult* destination);

}  // namespace mosaic::node
