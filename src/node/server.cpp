#include <spdlog/spdlog.h>
#include <mosaic/node/server.hpp>
#include <vector>

using namespace mosaic::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

}  // namespace

namespace mosaic::node {

void populate_tx_result(const transaction_result_t& source,
                        mosaic::node::v1::TxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* attr = out->add_attributes();
      attr->set_key(attribute.key);
      attr->set_value(attribute.value);
      attr->set_index(attribute.index);
    }
  }
}

listener::listener(mosaic::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const mosaic::node::v1::RequestInfo* /*request*/,
    mosaic::node::v1::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(
      make_string(bytes_view_t{info.last_block_state_root}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const mosaic::node::v1::RequestCheckTx* request,
    mosaic::node::v1::ResponseCheckTx* response) {
  auto check = execution_engine_.check_transaction(make_bytes_view(request->tx()));
  populate_tx_result(check, response->mutable_result());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const mosaic::node::v1::RequestFinalizeBlock* request,
    mosaic::node::v1::ResponseFinalizeBlock* response) {
  if (request->height() <= 0) {
    spdlog::warn("FinalizeBlock with non-positive height {}",
                 request->height());
    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                 "height must be positive"});
    return reactor;
  }
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(bytes_view_t{execution.state_root}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const mosaic::node::v1::RequestCommit* /*request*/,
    mosaic::node::v1::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_string(bytes_view_t{commit.state_root}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const mosaic::node::v1::RequestQuery* request,
    mosaic::node::v1::ResponseQuery* response) {
  auto query =
      execution_engine_.query(request->path(), make_bytes_view(request->data()));
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

}  // namespace mosaic::node
