#include <mosaic/common/critical.hpp>
#include <mosaic/storage/rocksdb/storage.hpp>

namespace mosaic::storage {

namespace {

using encoder_t = mosaic::schema::encoding::scale_encoder_t;

std::string encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    mosaic::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_database() const {
  if (!database) {
    mosaic::common::critical("RocksDB database is not initialized");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_database();
  auto committed_raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    mosaic::common::critical("failed to load committed state");
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, mosaic::schema::hash32_t>>(
          mosaic::schema::make_bytes_view(committed_raw));
  if (!decoded.has_value()) {
    mosaic::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_database();
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              std::string{detail::kCommittedStateKey},
                              encode_committed_state(state));
  if (!status.ok()) {
    spdlog::error("Failed to persist committed state: {}", status.ToString());
    mosaic::common::critical("failed to persist committed state");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const mosaic::schema::bytes_view_t& prefix) const {
  require_database();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    mosaic::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::stage_prefix_replacement(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const mosaic::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      mosaic::common::critical("failed deleting key during prefix replacement");
    }
  }

  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(mosaic::schema::make_bytes_view(key)),
                  detail::to_slice(mosaic::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      mosaic::common::critical("failed writing key during prefix replacement");
    }
  }
}

void storage<rocksdb_storage_tag>::write(
    ROCKSDB_NAMESPACE::WriteBatch& batch) const {
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to write batch: {}", write_status.ToString());
    mosaic::common::critical("failed to commit prefix replacement");
  }
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const mosaic::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  require_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_prefix_replacement(batch, prefix, entries);
  write(batch);
}

void storage<rocksdb_storage_tag>::replace_by_prefixes(
    const std::vector<prefix_replacement_t>& replacements,
    const committed_state& state) const {
  require_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& replacement : replacements) {
    stage_prefix_replacement(
        batch, mosaic::schema::make_bytes_view(replacement.prefix),
        replacement.entries);
  }
  auto put_status =
      batch.Put(std::string{detail::kCommittedStateKey},
                encode_committed_state(state));
  if (!put_status.ok()) {
    mosaic::common::critical("failed staging committed state");
  }
  write(batch);
}

}  // namespace mosaic::storage
