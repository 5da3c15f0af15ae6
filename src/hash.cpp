#include "dgate/hash.hpp"

// Domain separation: "spec:", "step:", "pack:" prefixes keep a spec digest from
// ever colliding with a step digest over the same bytes. The domain is fed to
// the hasher ahead of the payload, so the preimage is domain || payload.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace dgate {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.backend = "system";
  const char* ver = blake3_version();
  info.version = ver ? ver : "unknown";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string spec_hash(std::string_view canonical_spec_json) {
  return hash_domain(kSpecDomain, canonical_spec_json);
}

std::string step_hash(std::string_view canonical_step_preimage) {
  return hash_domain(kStepDomain, canonical_step_preimage);
}

std::string pack_content_hash(std::string_view raw_bytes) {
  return hash_domain(kPackDomain, raw_bytes);
}

bool is_hex_digest(std::string_view digest) {
  if (digest.size() != 64) return false;
  for (char c : digest) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace dgate
