#include <mosaic/execution/events.hpp>
#include <string>

using namespace mosaic::schema;

namespace mosaic::execution {

namespace {

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = true) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace

transaction_event_t make_transaction_event(const registry_event_t& event) {
  auto out = transaction_event_t{};
  std::visit(
      overloaded{
          [&](const transfer_event& value) {
            out.type = "transfer";
            out.attributes = {
                attribute("from", value.from ? to_hex(*value.from) : ""),
                attribute("to", to_hex(value.to)),
                attribute("token_id", std::to_string(value.token_id))};
          },
          [&](const approval_event& value) {
            out.type = "approval";
            out.attributes = {
                attribute("holder", to_hex(value.holder)),
                attribute("spender", to_hex(value.spender)),
                attribute("token_id", std::to_string(value.token_id))};
          },
          [&](const approval_for_all_event& value) {
            out.type = "approval_for_all";
            out.attributes = {
                attribute("holder", to_hex(value.holder)),
                attribute("operator", to_hex(value.operator_id)),
                attribute("approved", value.approved ? "true" : "false")};
          },
          [&](const artifact_issued_event& value) {
            out.type = "artifact_issued";
            out.attributes = {
                attribute("recipient", to_hex(value.recipient)),
                attribute("token_id", std::to_string(value.token_id)),
                attribute("trait_commitment", to_hex(value.trait_commitment),
                          false),
                attribute("layer_count", std::to_string(value.layer_count),
                          false),
                attribute("payment", value.payment.str(), false)};
          },
          [&](const royalty_configured_event& value) {
            out.type = "royalty_configured";
            out.attributes = {
                attribute("payee", to_hex(value.payee)),
                attribute("basis_points", std::to_string(value.basis_points),
                          false)};
          },
          [&](const base_uri_changed_event& value) {
            out.type = "base_uri_changed";
            out.attributes = {attribute("previous", value.previous, false),
                              attribute("current", value.current, false)};
          }},
      event);
  return out;
}

std::vector<transaction_event_t> make_transaction_events(
    const std::vector<registry_event_t>& events) {
  auto out = std::vector<transaction_event_t>{};
  out.reserve(events.size());
  for (const auto& event : events) {
    out.push_back(make_transaction_event(event));
  }
  return out;
}

}  // namespace mosaic::execution
