#include "gradebox/version.hpp"

#include <sstream>

namespace gradebox {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? "0.1.0" : engine_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"protocol_framing\":" << m.protocol_framing
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"snapshot_format\":" << m.snapshot_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t peer_protocol_version) {
  CompatibilityResult r;
  if (peer_protocol_version != PROTOCOL_FRAMING_VERSION) {
    r.ok          = false;
    r.error_code  = "protocol_version_mismatch";
    r.description = "Worker protocol version " + std::to_string(peer_protocol_version) +
                    " != host protocol version " + std::to_string(PROTOCOL_FRAMING_VERSION) +
                    ". Rebuild gradebox_worker alongside the host.";
    r.actual_protocol = peer_protocol_version;
  }
  return r;
}

}  // namespace version
}  // namespace gradebox
