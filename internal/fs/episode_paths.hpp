#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/fs/layout.hpp"

namespace curator::fs {

/*
  "episode_000042.parquet" -> 42

  The stem after the last '_' must be a non-empty run of decimal digits.
*/
inline std::optional<int64_t> ParseEpisodeIndex(const std::filesystem::path& path) {
  const auto stem = path.stem().string();
  const auto pos  = stem.rfind('_');
  if (pos == std::string::npos || pos + 1 >= stem.size()) {
    return std::nullopt;
  }

  const auto digits = stem.substr(pos + 1);
  if (digits.size() > 18) {
    return std::nullopt;
  }
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  return std::stoll(digits);
}

inline std::string EpisodeFileName(int64_t episode_index, const std::string& extension) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%06lld", kEpisodePrefix, static_cast<long long>(episode_index));
  return std::string(buf) + extension;
}

inline bool MatchesEpisodeFile(const std::filesystem::path& path, const std::string& extension) {
  const auto name = path.filename().string();
  const auto prefix = std::string(kEpisodePrefix);
  return name.size() > prefix.size() + extension.size() && name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}

} // namespace curator::fs
