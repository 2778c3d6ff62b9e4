#pragma once

#include <arrow/table.h>

#include <memory>

#include "internal/model/manifest.hpp"

namespace curator::manifest {

/*
  Manifest <-> Arrow table.

  Column layout (one row per ManifestRow):

      episode_index    int64
      chunk            utf8
      parquet_uri      utf8   nullable
      video_front_uri  utf8   nullable
      video_wrist_uri  utf8   nullable
      exists_front     bool
      exists_wrist     bool
      bytes_total      int64
      fingerprint      utf8   nullable
      fingerprint_algo utf8
      discovered_at    utf8
      status           utf8   (NEW, CHANGED, ...)
      errors           utf8   nullable
*/
std::shared_ptr<arrow::Schema> ManifestSchema();

std::shared_ptr<arrow::Table> ToTable(const model::Manifest& manifest);

// Throws std::runtime_error on missing columns, wrong types or bad values.
model::Manifest FromTable(const arrow::Table& table);

} // namespace curator::manifest
