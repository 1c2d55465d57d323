#pragma once

#include <string>
#include <string_view>

#include "gradebox/types.hpp"

namespace gradebox {

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
std::string blake3_version_string();

// Domain-separated hashing. Prefixes in use:
//   "req:" execution requests, "res:" guest outcomes.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Canonical request text: sorted-key JSON of {source, tests, limits}.
std::string canonical_request_json(const ExecutionRequest& request);

// Identifies a request. Used as the execution id in events and results.
std::string request_digest(const ExecutionRequest& request);

// Digest over the deterministic part of a result: exit reason, post-processed
// streams, per-test pass/received/error and the visualization payload.
// Durations are excluded so two runs of the same program compare equal.
std::string outcome_digest(const ExecutionResult& result);

}  // namespace gradebox
