#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace curator::fingerprint {

struct FileFingerprint {
  uint64_t    size     = 0;
  int64_t     mtime_ns = 0;
  std::string digest;  // lower-case hex SHA-256

  bool operator==(const FileFingerprint& other) const {
    return size == other.size && mtime_ns == other.mtime_ns && digest == other.digest;
  }
};

// logical name ("parquet", "front", "wrist") -> file identity
using FingerprintParts = std::map<std::string, FileFingerprint>;

/*
  Content identity for episode files.

  Sampled mode hashes the first sample_bytes and, when the file is larger
  than twice that, the last sample_bytes. Full mode streams the whole file.
  Size and mtime always take part through Combine().
*/
class Fingerprinter {
 public:
  static constexpr uint64_t kDefaultSampleBytes = 64 * 1024;

  Fingerprinter() = default;
  explicit Fingerprinter(uint64_t sample_bytes);

  // Throws util::IoError when the file cannot be stat'ed, opened or read.
  FileFingerprint FingerprintFile(const std::filesystem::path& path, bool full_hash) const;

  // Order-independent: parts are serialized with sorted keys.
  static std::string Combine(const FingerprintParts& parts);

  // Tag recorded next to every fingerprint; differs between modes.
  std::string AlgorithmTag(bool full_hash) const;

  uint64_t sample_bytes() const {
    return sample_bytes_;
  }

 private:
  uint64_t sample_bytes_ = kDefaultSampleBytes;
};

// Exposed for tests and for the canonical serialization.
std::string Sha256Hex(const std::string& data);
std::string CanonicalText(const FingerprintParts& parts);

} // namespace curator::fingerprint
