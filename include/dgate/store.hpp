#pragma once

// dgate/store.hpp — Runpack persistence contract and the in-memory reference
// store.
//
// DESIGN INVARIANTS (must hold for every implementation):
//   1. Key = runpack fingerprint. A stored pack is retrievable only under the
//      fingerprint its own chain produces.
//   2. Only sealed packs that pass verify_runpack() are accepted.
//   3. Reads verify integrity: the stored blob hash, then the content hash,
//      then the chain itself. Any mismatch returns nullopt with an error,
//      never a corrupted pack.
//   4. put_runpack() is idempotent for identical content.
//
// EXTENSION_POINT: persistent_backends
//   Embedded, relational and object-storage backends implement
//   IRunpackStore outside the core. They store runpack_to_json() bytes as
//   opaque content plus the metadata in StoredRunpackInfo.

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dgate/runpack.hpp"
#include "dgate/types.hpp"

namespace dgate {

struct StoredRunpackInfo {
  std::string fingerprint;
  std::string scenario_id;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string content_hash;      // pack: domain, over original bytes
  std::string stored_blob_hash;  // plain BLAKE3 over stored bytes
};

// Thread-safety: all implementations MUST be safe for concurrent calls.
class IRunpackStore {
 public:
  virtual ~IRunpackStore() = default;

  virtual bool put_runpack(const Runpack& pack, GateError* err) = 0;
  virtual std::optional<Runpack> get_runpack(const std::string& fingerprint, GateError* err) const = 0;
  virtual bool contains(const std::string& fingerprint) const = 0;
  virtual std::optional<StoredRunpackInfo> info(const std::string& fingerprint) const = 0;
  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

class InMemoryRunpackStore : public IRunpackStore {
 public:
  // compression: "off" or "zstd" (honored when built with DGATE_WITH_ZSTD,
  // otherwise packs are stored as identity).
  explicit InMemoryRunpackStore(std::string compression = "off");

  bool put_runpack(const Runpack& pack, GateError* err) override;
  std::optional<Runpack> get_runpack(const std::string& fingerprint, GateError* err) const override;
  bool contains(const std::string& fingerprint) const override;
  std::optional<StoredRunpackInfo> info(const std::string& fingerprint) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "memory"; }

  std::vector<std::string> fingerprints() const;

 protected:
  // Replaces the stored bytes without touching the recorded digests. Fault
  // injection for subclasses; reads of the entry must then fail with store_io.
  bool overwrite_blob(const std::string& fingerprint, const std::string& blob);

 private:
  struct Entry {
    StoredRunpackInfo info;
    std::string blob;
  };

  std::string compression_;
  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
};

}  // namespace dgate
