#include "fingerprinter.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/fs/file_stat.hpp"
#include "internal/util/errors.hpp"

namespace curator::fingerprint {

namespace {

constexpr std::streamsize kFullHashReadBytes = 1024 * 1024;

/*
  RAII wrapper over an EVP SHA-256 context.
*/
class Sha256 {
 public:
  Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("failed to initialize SHA-256 context");
    }
  }

  void Update(const char* data, size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("failed to update SHA-256 digest");
    }
  }

  std::string HexDigest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int  length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &length) != 1) {
      throw std::runtime_error("failed to finalize SHA-256 digest");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string           out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
      out.push_back(kHex[(hash[i] >> 4) & 0x0F]);
      out.push_back(kHex[hash[i] & 0x0F]);
    }
    return out;
  }

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

void HashRange(std::ifstream& in, const std::filesystem::path& path, uint64_t offset, uint64_t length, Sha256& sha) {
  in.seekg(static_cast<std::streamoff>(offset));
  if (!in) {
    throw util::IoError("seek failed for " + path.string());
  }

  std::vector<char> buffer(static_cast<size_t>(length));
  in.read(buffer.data(), static_cast<std::streamsize>(length));
  // a short read means the file shrank under us; hash what was there
  const auto got = in.gcount();
  if (in.bad()) {
    throw util::IoError("read failed for " + path.string());
  }
  sha.Update(buffer.data(), static_cast<size_t>(got));
  in.clear();
}

} // namespace

Fingerprinter::Fingerprinter(uint64_t sample_bytes) : sample_bytes_(sample_bytes == 0 ? kDefaultSampleBytes : sample_bytes) {
}

FileFingerprint Fingerprinter::FingerprintFile(const std::filesystem::path& path, bool full_hash) const {
  const auto stat = fs::StatFile(path);
  if (!stat) {
    throw util::IoError("file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IoError("cannot open " + path.string());
  }

  Sha256 sha;
  if (full_hash) {
    std::vector<char> buffer(static_cast<size_t>(kFullHashReadBytes));
    while (in) {
      in.read(buffer.data(), kFullHashReadBytes);
      sha.Update(buffer.data(), static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
      throw util::IoError("read failed for " + path.string());
    }
  } else {
    const uint64_t head = std::min(stat->size, sample_bytes_);
    HashRange(in, path, 0, head, sha);
    if (stat->size > 2 * sample_bytes_) {
      HashRange(in, path, stat->size - sample_bytes_, sample_bytes_, sha);
    }
  }

  FileFingerprint result;
  result.size     = stat->size;
  result.mtime_ns = stat->mtime_ns;
  result.digest   = sha.HexDigest();
  return result;
}

std::string CanonicalText(const FingerprintParts& parts) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [name, part] : parts) {
    if (!first) out << ',';
    first = false;
    out << '"' << name << "\":{\"mtime_ns\":" << part.mtime_ns << ",\"sha\":\"" << part.digest << "\",\"size\":" << part.size << '}';
  }
  out << '}';
  return out.str();
}

std::string Sha256Hex(const std::string& data) {
  Sha256 sha;
  sha.Update(data.data(), data.size());
  return sha.HexDigest();
}

std::string Fingerprinter::Combine(const FingerprintParts& parts) {
  return Sha256Hex(CanonicalText(parts));
}

std::string Fingerprinter::AlgorithmTag(bool full_hash) const {
  if (full_hash) {
    return "size+mtime+sha256(full)-v1";
  }
  return "size+mtime+sha256(head|tail:" + std::to_string(sample_bytes_) + ")-v1";
}

} // namespace curator::fingerprint
