#pragma once

#include <map>
#include <utility>
#include <vector>

#include "internal/model/manifest_row.hpp"

namespace curator::model {

/*
  Full snapshot of a discovery run.

  Rows are kept in a vector so orphan rows for two cameras of the same key
  and unparsed (-1) rows can coexist; lookups by key go through
  TrajectoryIndex(), which only covers parsed trajectory-bearing rows.
*/
class Manifest {
 public:
  Manifest() = default;
  explicit Manifest(std::vector<ManifestRow> rows) : rows_(std::move(rows)) {
  }

  const std::vector<ManifestRow>& rows() const {
    return rows_;
  }
  std::vector<ManifestRow>& mutable_rows() {
    return rows_;
  }

  size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }

  void Append(ManifestRow row) {
    rows_.push_back(std::move(row));
  }

  // (chunk, episode_index), then front orphan before wrist orphan, then uri
  void SortDeterministic();

  std::map<ManifestKey, const ManifestRow*> TrajectoryIndex() const;

 private:
  std::vector<ManifestRow> rows_;
};

} // namespace curator::model
