#pragma once
#include <mosaic/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mosaic::storage {

using key_value_entry_t =
    std::pair<mosaic::schema::bytes_t, mosaic::schema::bytes_t>;

/// All entries that should live under one key prefix after a replacement.
struct prefix_replacement_t final {
  mosaic::schema::bytes_t prefix;
  std::vector<key_value_entry_t> entries;
};

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  mosaic::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const mosaic::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const mosaic::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const mosaic::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const mosaic::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Replace several prefixes and the committed checkpoint in one write.
  void replace_by_prefixes(const std::vector<prefix_replacement_t>& replacements,
                           const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace mosaic::storage
