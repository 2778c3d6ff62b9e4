#include "manifest_codec.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/type.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/manifest/arrow_utils.hpp"

namespace curator::manifest {

namespace {

void AppendOptional(arrow::StringBuilder& builder, const std::optional<std::string>& value) {
  if (value) {
    Unwrap(builder.Append(*value));
  } else {
    Unwrap(builder.AppendNull());
  }
}

template <typename ArrayType>
std::shared_ptr<ArrayType> Column(const arrow::Table& table, const std::string& name) {
  auto column = table.GetColumnByName(name);
  if (!column) {
    throw std::runtime_error("manifest column missing: " + name);
  }
  if (column->num_chunks() != 1) {
    throw std::runtime_error("manifest column not contiguous: " + name);
  }
  auto array = std::dynamic_pointer_cast<ArrayType>(column->chunk(0));
  if (!array) {
    throw std::runtime_error("manifest column has unexpected type: " + name + " (" + column->type()->ToString() + ")");
  }
  return array;
}

std::optional<std::string> OptionalString(const arrow::StringArray& array, int64_t i) {
  if (array.IsNull(i)) return std::nullopt;
  return array.GetString(i);
}

std::string RequiredString(const arrow::StringArray& array, int64_t i, const char* name) {
  if (array.IsNull(i)) {
    throw std::runtime_error(std::string("manifest column ") + name + " is null at row " + std::to_string(i));
  }
  return array.GetString(i);
}

} // namespace

std::shared_ptr<arrow::Schema> ManifestSchema() {
  return arrow::schema({
      arrow::field("episode_index", arrow::int64(), false),
      arrow::field("chunk", arrow::utf8(), false),
      arrow::field("parquet_uri", arrow::utf8(), true),
      arrow::field("video_front_uri", arrow::utf8(), true),
      arrow::field("video_wrist_uri", arrow::utf8(), true),
      arrow::field("exists_front", arrow::boolean(), false),
      arrow::field("exists_wrist", arrow::boolean(), false),
      arrow::field("bytes_total", arrow::int64(), false),
      arrow::field("fingerprint", arrow::utf8(), true),
      arrow::field("fingerprint_algo", arrow::utf8(), false),
      arrow::field("discovered_at", arrow::utf8(), false),
      arrow::field("status", arrow::utf8(), false),
      arrow::field("errors", arrow::utf8(), true),
  });
}

std::shared_ptr<arrow::Table> ToTable(const model::Manifest& manifest) {
  arrow::Int64Builder   episode_index;
  arrow::StringBuilder  chunk;
  arrow::StringBuilder  parquet_uri;
  arrow::StringBuilder  video_front_uri;
  arrow::StringBuilder  video_wrist_uri;
  arrow::BooleanBuilder exists_front;
  arrow::BooleanBuilder exists_wrist;
  arrow::Int64Builder   bytes_total;
  arrow::StringBuilder  fingerprint;
  arrow::StringBuilder  fingerprint_algo;
  arrow::StringBuilder  discovered_at;
  arrow::StringBuilder  status;
  arrow::StringBuilder  errors;

  for (const auto& row : manifest.rows()) {
    Unwrap(episode_index.Append(row.episode_index));
    Unwrap(chunk.Append(row.chunk));
    AppendOptional(parquet_uri, row.parquet_uri);
    AppendOptional(video_front_uri, row.video_front_uri);
    AppendOptional(video_wrist_uri, row.video_wrist_uri);
    Unwrap(exists_front.Append(row.exists_front));
    Unwrap(exists_wrist.Append(row.exists_wrist));
    Unwrap(bytes_total.Append(row.bytes_total));
    AppendOptional(fingerprint, row.fingerprint);
    Unwrap(fingerprint_algo.Append(row.fingerprint_algo));
    Unwrap(discovered_at.Append(row.discovered_at));
    Unwrap(status.Append(std::string(model::ToString(row.status))));
    AppendOptional(errors, row.errors);
  }

  std::vector<std::shared_ptr<arrow::Array>> columns = {
      Unwrap(episode_index.Finish()), Unwrap(chunk.Finish()),         Unwrap(parquet_uri.Finish()),
      Unwrap(video_front_uri.Finish()), Unwrap(video_wrist_uri.Finish()), Unwrap(exists_front.Finish()),
      Unwrap(exists_wrist.Finish()),  Unwrap(bytes_total.Finish()),   Unwrap(fingerprint.Finish()),
      Unwrap(fingerprint_algo.Finish()), Unwrap(discovered_at.Finish()), Unwrap(status.Finish()),
      Unwrap(errors.Finish()),
  };

  return arrow::Table::Make(ManifestSchema(), std::move(columns), static_cast<int64_t>(manifest.size()));
}

model::Manifest FromTable(const arrow::Table& input) {
  model::Manifest manifest;
  if (input.num_rows() == 0) {
    return manifest;
  }

  const auto table = Unwrap(input.CombineChunks());

  const auto episode_index    = Column<arrow::Int64Array>(*table, "episode_index");
  const auto chunk            = Column<arrow::StringArray>(*table, "chunk");
  const auto parquet_uri      = Column<arrow::StringArray>(*table, "parquet_uri");
  const auto video_front_uri  = Column<arrow::StringArray>(*table, "video_front_uri");
  const auto video_wrist_uri  = Column<arrow::StringArray>(*table, "video_wrist_uri");
  const auto exists_front     = Column<arrow::BooleanArray>(*table, "exists_front");
  const auto exists_wrist     = Column<arrow::BooleanArray>(*table, "exists_wrist");
  const auto bytes_total      = Column<arrow::Int64Array>(*table, "bytes_total");
  const auto fingerprint      = Column<arrow::StringArray>(*table, "fingerprint");
  const auto fingerprint_algo = Column<arrow::StringArray>(*table, "fingerprint_algo");
  const auto discovered_at    = Column<arrow::StringArray>(*table, "discovered_at");
  const auto status           = Column<arrow::StringArray>(*table, "status");
  const auto errors           = Column<arrow::StringArray>(*table, "errors");

  auto& rows = manifest.mutable_rows();
  rows.reserve(static_cast<size_t>(table->num_rows()));

  for (int64_t i = 0; i < table->num_rows(); ++i) {
    if (episode_index->IsNull(i) || exists_front->IsNull(i) || exists_wrist->IsNull(i) || bytes_total->IsNull(i)) {
      throw std::runtime_error("manifest row " + std::to_string(i) + " has null required fields");
    }

    model::ManifestRow row;
    row.episode_index    = episode_index->Value(i);
    row.chunk            = RequiredString(*chunk, i, "chunk");
    row.parquet_uri      = OptionalString(*parquet_uri, i);
    row.video_front_uri  = OptionalString(*video_front_uri, i);
    row.video_wrist_uri  = OptionalString(*video_wrist_uri, i);
    row.exists_front     = exists_front->Value(i);
    row.exists_wrist     = exists_wrist->Value(i);
    row.bytes_total      = bytes_total->Value(i);
    row.fingerprint      = OptionalString(*fingerprint, i);
    row.fingerprint_algo = RequiredString(*fingerprint_algo, i, "fingerprint_algo");
    row.discovered_at    = RequiredString(*discovered_at, i, "discovered_at");
    row.errors           = OptionalString(*errors, i);

    const auto status_text = RequiredString(*status, i, "status");
    const auto parsed      = model::StatusFromString(status_text);
    if (!parsed) {
      throw std::runtime_error("manifest row " + std::to_string(i) + " has unknown status: " + status_text);
    }
    row.status = *parsed;

    rows.push_back(std::move(row));
  }

  return manifest;
}

} // namespace curator::manifest
