#include <mosaic/registry/artifact_store.hpp>

using namespace mosaic::schema;

namespace mosaic::registry {

artifact_store::artifact_store(std::map<token_id_t, artifact_record_t> records)
    : records_{std::move(records)} {}

bool artifact_store::record(const token_id_t token_id,
                            const artifact_record_t& record) {
  return records_.emplace(token_id, record).second;
}

std::optional<artifact_record_t> artifact_store::find(
    const token_id_t token_id) const {
  auto it = records_.find(token_id);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return it->second;
}

const std::map<token_id_t, artifact_record_t>& artifact_store::records() const {
  return records_;
}

}  // namespace mosaic::registry
