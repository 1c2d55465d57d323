#include "gradebox/hash.hpp"

// BLAKE3 is the only hash primitive. Domain prefixes keep request digests
// and outcome digests from colliding even for identical payload bytes.
//
// MICRO_OPT: to_hex() uses a 16-entry lookup table rather than snprintf.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace gradebox {
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

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_version_string() {
  const char* v = blake3_version();
  return v ? v : "unknown";
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

std::string canonical_request_json(const ExecutionRequest& request) {
  jsonlite::Object o;
  o["source"] = request.source_text;
  jsonlite::Array tests;
  for (const auto& tc : request.test_cases) tests.push_back(test_case_to_json(tc));
  o["tests"] = std::move(tests);
  o["timeLimitMs"] = static_cast<std::uint64_t>(request.time_limit_ms);
  o["memLimitMb"] = static_cast<std::uint64_t>(request.mem_limit_mb);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::string request_digest(const ExecutionRequest& request) {
  return hash_domain("req:", canonical_request_json(request));
}

std::string outcome_digest(const ExecutionResult& result) {
  jsonlite::Object o;
  o["exitReason"] = to_string(result.exit_reason);
  o["stdout"] = result.stdout_text;
  o["stderr"] = result.stderr_text;
  jsonlite::Array outcomes;
  for (const auto& t : result.outcomes) {
    jsonlite::Object e;
    e["id"] = t.id;
    e["passed"] = t.passed;
    if (t.received_value) e["receivedValue"] = *t.received_value;
    if (t.error_text) e["errorText"] = *t.error_text;
    outcomes.push_back(jsonlite::Value{std::move(e)});
  }
  o["outcomes"] = std::move(outcomes);
  if (result.visualization) o["visualization"] = *result.visualization;
  return hash_domain("res:", jsonlite::to_json(jsonlite::Value{std::move(o)}));
}

}  // namespace gradebox
