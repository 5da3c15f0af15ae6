#include "dgate/version.hpp"

#include <sstream>

#include "dgate/hash.hpp"
#include "dgate/jsonlite.hpp"

#ifndef DGATE_VERSION
#define DGATE_VERSION "0.0.0"
#endif

namespace dgate {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = DGATE_VERSION;
  const auto info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_backend = info.backend;
#if defined(DGATE_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << jsonlite::escape(m.engine_semver) << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_backend\":\"" << jsonlite::escape(m.hash_backend) << "\""
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"runpack_format\":" << m.runpack_format
    << ",\"spec_format\":" << m.spec_format
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << "}";
  return o.str();
}

CompatibilityResult check_runpack_format(uint32_t format_version) {
  CompatibilityResult r;
  if (format_version == 0 || format_version > RUNPACK_FORMAT_VERSION) {
    r.ok = false;
    r.error_code = "runpack_format_mismatch";
    r.description = "runpack format " + std::to_string(format_version) +
                    " is not readable by this engine (supports 1.." +
                    std::to_string(RUNPACK_FORMAT_VERSION) + ")";
  }
  return r;
}

}  // namespace version
}  // namespace dgate
