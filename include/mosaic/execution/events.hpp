#pragma once

#include <mosaic/schema/registry_event.hpp>
#include <mosaic/schema/transaction_event.hpp>
#include <vector>

namespace mosaic::execution {

/// Wire form of a registry event. Addresses and hashes are lowercase hex,
/// integers are decimal. An issuance carries an empty "from".
mosaic::schema::transaction_event_t make_transaction_event(
    const mosaic::schema::registry_event_t& event);

std::vector<mosaic::schema::transaction_event_t> make_transaction_events(
    const std::vector<mosaic::schema::registry_event_t>& events);

}  // namespace mosaic::execution
