#pragma once

#include <mosaic/schema/artifact_record.hpp>
#include <map>
#include <optional>

namespace mosaic::registry {

/// Write-once trait data per artifact.
class artifact_store final {
 public:
  artifact_store() = default;
  explicit artifact_store(
      std::map<mosaic::schema::token_id_t, mosaic::schema::artifact_record_t>
          records);

  /// Returns false, leaving the existing record untouched, when the id
  /// already has one.
  bool record(mosaic::schema::token_id_t token_id,
              const mosaic::schema::artifact_record_t& record);

  std::optional<mosaic::schema::artifact_record_t> find(
      mosaic::schema::token_id_t token_id) const;

  const std::map<mosaic::schema::token_id_t, mosaic::schema::artifact_record_t>&
  records() const;

 private:
  std::map<mosaic::schema::token_id_t, mosaic::schema::artifact_record_t>
      records_;
};

}  // namespace mosaic::registry
