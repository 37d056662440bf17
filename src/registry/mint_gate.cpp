#include <mosaic/common/critical.hpp>
#include <mosaic/registry/constants.hpp>
#include <mosaic/registry/mint_gate.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

mint_gate::mint_gate(const token_id_t next_token_id,
                     const uint64_t total_minted,
                     amount_t collected,
                     std::map<address_t, block_height_t> last_mint)
    : next_token_id_{next_token_id},
      total_minted_{total_minted},
      collected_{std::move(collected)},
      last_mint_{std::move(last_mint)} {}

outcome<token_id_t> mint_gate::mint(const call_context& context,
                                    const mint_request& request,
                                    artifact_store& artifacts,
                                    transfer_authorizer& authorizer,
                                    event_buffer_t& events) {
  if (is_zero_address(request.to)) {
    return fail<token_id_t>(registry_error_code::mint_to_zero);
  }
  if (total_minted_ >= kSupplyCap) {
    return fail<token_id_t>(registry_error_code::supply_cap_exceeded);
  }
  if (context.value < mint_price()) {
    return fail<token_id_t>(registry_error_code::payment_too_low);
  }
  if (request.layer_count > kMaxLayersPerArtifact) {
    return fail<token_id_t>(registry_error_code::layer_index_out_of_range);
  }
  if (cooldown_remaining(context.caller, context.now) > 0) {
    return fail<token_id_t>(registry_error_code::cooldown_active);
  }

  auto token_id = next_token_id_;
  auto issued = authorizer.issue(request.to, token_id);
  if (issued != registry_error_code::ok) {
    return fail<token_id_t>(issued);
  }

  last_mint_[context.caller] = context.now;
  ++next_token_id_;
  ++total_minted_;
  collected_ += context.value;
  auto recorded = artifacts.record(
      token_id, artifact_record_t{.trait_commitment = request.trait_commitment,
                                  .layer_count = request.layer_count,
                                  .issued_at = context.now});
  if (!recorded) {
    mosaic::common::critical("artifact {} already has a record", token_id);
  }
  events.emplace_back(artifact_issued_event{
      .recipient = request.to,
      .token_id = token_id,
      .trait_commitment = request.trait_commitment,
      .layer_count = request.layer_count,
      .payment = context.value});
  return succeed(token_id);
}

block_height_t mint_gate::cooldown_remaining(const address_t& caller,
                                             const block_height_t now) const {
  auto it = last_mint_.find(caller);
  if (it == std::end(last_mint_) || it->second == 0) {
    return 0;
  }
  auto ready_at = it->second + kMintCooldown;
  return now < ready_at ? ready_at - now : 0;
}

token_id_t mint_gate::next_token_id() const {
  return next_token_id_;
}

uint64_t mint_gate::total_minted() const {
  return total_minted_;
}

uint64_t mint_gate::remaining_supply() const {
  return total_minted_ >= kSupplyCap ? 0 : kSupplyCap - total_minted_;
}

const amount_t& mint_gate::collected() const {
  return collected_;
}

const std::map<address_t, block_height_t>& mint_gate::last_mint() const {
  return last_mint_;
}

}  // namespace mosaic::registry
