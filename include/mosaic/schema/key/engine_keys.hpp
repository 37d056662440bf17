#pragma once

#include <mosaic/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for persisted registry state.
namespace mosaic::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRegistryMetaKeyPrefix{"SYS|STATE|META|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kApprovalKeyPrefix{"SYS|STATE|APPROVAL|"};
inline constexpr std::string_view kOperatorKeyPrefix{"SYS|STATE|OPERATOR|"};
inline constexpr std::string_view kArtifactKeyPrefix{"SYS|STATE|ARTIFACT|"};
inline constexpr std::string_view kCooldownKeyPrefix{"SYS|STATE|COOLDOWN|"};

// Order is the state-root order.
inline constexpr std::array<std::string_view, 7> kEngineKeyspaces{
    kNonceKeyPrefix,    kRegistryMetaKeyPrefix, kOwnerKeyPrefix,
    kApprovalKeyPrefix, kOperatorKeyPrefix,     kArtifactKeyPrefix,
    kCooldownKeyPrefix};

template <typename Encoder, typename T>
mosaic::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
mosaic::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

/// Decode the id part of a key built by make_prefixed_key.
template <typename T, typename Encoder>
std::optional<T> parse_prefixed_key(Encoder& encoder,
                                    std::string_view prefix,
                                    const mosaic::schema::bytes_view_t& key) {
  auto encoded_prefix = make_prefix_key(encoder, prefix);
  if (key.size() < encoded_prefix.size() ||
      !std::equal(std::begin(encoded_prefix), std::end(encoded_prefix),
                  std::begin(key))) {
    return std::nullopt;
  }
  return encoder.template try_decode<T>(key.subspan(encoded_prefix.size()));
}

template <typename Encoder>
mosaic::schema::bytes_t make_nonce_key(Encoder& encoder,
                                       const mosaic::schema::address_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
mosaic::schema::bytes_t make_registry_meta_key(Encoder& encoder) {
  return make_prefix_key(encoder, kRegistryMetaKeyPrefix);
}

template <typename Encoder>
mosaic::schema::bytes_t make_owner_key(Encoder& encoder,
                                       const mosaic::schema::token_id_t id) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, id);
}

template <typename Encoder>
mosaic::schema::bytes_t make_approval_key(Encoder& encoder,
                                          const mosaic::schema::token_id_t id) {
  return make_prefixed_key(encoder, kApprovalKeyPrefix, id);
}

template <typename Encoder>
mosaic::schema::bytes_t make_operator_key(
    Encoder& encoder,
    const mosaic::schema::address_t& holder,
    const mosaic::schema::address_t& operator_id) {
  return make_prefixed_key(encoder, kOperatorKeyPrefix,
                           std::tuple{holder, operator_id});
}

template <typename Encoder>
mosaic::schema::bytes_t make_artifact_key(Encoder& encoder,
                                          const mosaic::schema::token_id_t id) {
  return make_prefixed_key(encoder, kArtifactKeyPrefix, id);
}

template <typename Encoder>
mosaic::schema::bytes_t make_cooldown_key(
    Encoder& encoder,
    const mosaic::schema::address_t& caller) {
  return make_prefixed_key(encoder, kCooldownKeyPrefix, caller);
}

}  // namespace mosaic::schema::key
