#pragma once

// gradebox/version.hpp — Version manifest for every format that crosses a
// process boundary: the worker frame protocol, the marker payload and the
// digest scheme. The host and worker are separate executables, so the host
// checks the worker's advertised protocol version in the init handshake.

#include <cstdint>
#include <string>

namespace gradebox {
namespace version {

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// Host <-> worker frames: 4-byte big-endian length + JSON body with
// {type, id, ...}. Adding or removing required fields requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with "req:"/"res:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// SNAPSHOT_FORMAT_VERSION
// Marker payload schema {diagramType, structureKind, structure, markers,
// truncated, stateSnapshot}.
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t snapshot_format{SNAPSHOT_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");
std::string manifest_to_json(const VersionManifest& m);

// Never throws. On mismatch ok=false with a structured error.
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  uint32_t required_protocol{PROTOCOL_FRAMING_VERSION};
  uint32_t actual_protocol{PROTOCOL_FRAMING_VERSION};
};

CompatibilityResult check_compatibility(uint32_t peer_protocol_version);

}  // namespace version
}  // namespace gradebox
