#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <json/json.h>
#include <openssl/evp.h>
#include <rocksdb/status.h>

namespace sessionvault::internal {

// Monotonic timestamp helper for metrics and latency (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp in milliseconds since epoch. Used for anything that is
// persisted or compared against a TTL.
inline uint64_t WallClockMillis() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  static std::array<uint8_t, kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, kDigestBytes> out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx) {
      if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
          EVP_DigestUpdate(ctx, data.data(), data.size()) &&
          EVP_DigestFinal_ex(ctx, out.data(), &len)) {
        // Success
      }
      EVP_MD_CTX_free(ctx);
    }

    return out;
  }

  // Lowercase hex digest, the form used as a content address.
  static std::string HexDigest(std::string_view data) {
    auto digest = Digest(data);
    return ToHex(digest.data(), digest.size());
  }

  static std::string ToHex(const uint8_t* p, size_t n) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
      out.push_back(kHex[p[i] >> 4]);
      out.push_back(kHex[p[i] & 0x0f]);
    }
    return out;
  }
};

// A content address is 64 lowercase hex characters.
inline bool IsValidHash(std::string_view hash) {
  if (hash.size() != Sha256::kDigestBytes * 2) return false;
  for (char c : hash) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

// Blob storage key: {hash-prefix}/{full-hash}
inline std::string BlobKey(std::string_view hash) {
  std::string key;
  key.reserve(3 + hash.size());
  key.append(hash.substr(0, 2));
  key.push_back('/');
  key.append(hash);
  return key;
}

// Short form of a hash for log lines.
inline std::string_view ShortHash(std::string_view hash) {
  return hash.substr(0, 8);
}

inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// Map RocksDB statuses to low-cardinality strings for logs and metrics.
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsTryAgain()) return "try_again";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

// ---------------------------------------------------------------------------
// JSON helpers (jsoncpp)
// ---------------------------------------------------------------------------

// Compact single-line JSON encoding.
inline std::string WriteJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

inline bool ParseJson(std::string_view text, Json::Value* out, std::string* errors = nullptr) {
  if (!out) return false;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  bool ok = reader->parse(text.data(), text.data() + text.size(), out, &errs);
  if (errors) *errors = std::move(errs);
  return ok;
}

}  // namespace sessionvault::internal
