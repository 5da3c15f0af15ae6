#include "dgate/store.hpp"

#include <utility>

#include "dgate/hash.hpp"

#if defined(DGATE_WITH_ZSTD)
#include <zstd.h>
#endif

namespace dgate {

namespace {

#if defined(DGATE_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

std::optional<Runpack> miss(GateError* err, ErrorCode code, std::string message,
                            const std::string& fingerprint) {
  fail(err, code, std::move(message), {fingerprint});
  return std::nullopt;
}

}  // namespace

InMemoryRunpackStore::InMemoryRunpackStore(std::string compression)
    : compression_(std::move(compression)) {}

bool InMemoryRunpackStore::put_runpack(const Runpack& pack, GateError* err) {
  if (!pack.sealed()) {
    return fail(err, ErrorCode::lifecycle_violation, "only sealed runpacks can be stored");
  }
  const auto check = verify_runpack(pack);
  if (!check.ok) {
    return fail(err, ErrorCode::runpack_integrity_failed, "refusing to store: " + check.reason,
                {pack.fingerprint()});
  }

  const std::string data = runpack_to_json(pack);
  const std::string content_hash = pack_content_hash(data);

  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(pack.fingerprint());
  if (it != entries_.end()) {
    if (it->second.info.content_hash == content_hash) return true;
    return fail(err, ErrorCode::store_io, "different content already stored under fingerprint",
                {pack.fingerprint()});
  }

  Entry entry;
  entry.blob = data;
  entry.info.encoding = "identity";
#if defined(DGATE_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      entry.blob = std::move(c);
      entry.info.encoding = "zstd";
    }
  }
#endif
  entry.info.fingerprint = pack.fingerprint();
  entry.info.scenario_id = pack.scenario_id();
  entry.info.original_size = data.size();
  entry.info.stored_size = entry.blob.size();
  entry.info.content_hash = content_hash;
  entry.info.stored_blob_hash = blake3_hex(entry.blob);
  entries_.emplace(pack.fingerprint(), std::move(entry));
  return true;
}

std::optional<Runpack> InMemoryRunpackStore::get_runpack(const std::string& fingerprint,
                                                         GateError* err) const {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
      return miss(err, ErrorCode::store_not_found, "no runpack stored under fingerprint", fingerprint);
    }
    entry = it->second;
  }

  if (blake3_hex(entry.blob) != entry.info.stored_blob_hash) {
    return miss(err, ErrorCode::store_io, "stored blob hash mismatch", fingerprint);
  }
  std::string data = std::move(entry.blob);
#if defined(DGATE_WITH_ZSTD)
  if (entry.info.encoding == "zstd") data = decompress_zstd(data, entry.info.original_size);
#endif
  if (entry.info.encoding != "identity" && entry.info.encoding != "zstd") {
    return miss(err, ErrorCode::store_io, "unknown encoding " + entry.info.encoding, fingerprint);
  }
  if (pack_content_hash(data) != entry.info.content_hash) {
    return miss(err, ErrorCode::store_io, "stored content hash mismatch", fingerprint);
  }

  auto pack = runpack_from_json(data, err);
  if (!pack) return std::nullopt;
  const auto check = verify_runpack(*pack);
  if (!check.ok || pack->fingerprint() != fingerprint) {
    return miss(err, ErrorCode::runpack_integrity_failed,
                check.ok ? "fingerprint does not match key" : check.reason, fingerprint);
  }
  return pack;
}

bool InMemoryRunpackStore::contains(const std::string& fingerprint) const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.count(fingerprint) != 0;
}

std::optional<StoredRunpackInfo> InMemoryRunpackStore::info(const std::string& fingerprint) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) return std::nullopt;
  return it->second.info;
}

std::size_t InMemoryRunpackStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::vector<std::string> InMemoryRunpackStore::fingerprints() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [fp, unused] : entries_) {
    (void)unused;
    out.push_back(fp);
  }
  return out;
}

bool InMemoryRunpackStore::overwrite_blob(const std::string& fingerprint,
                                          const std::string& blob) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) return false;
  it->second.blob = blob;
  return true;
}

}  // namespace dgate
