#pragma once

// gradebox/engine.hpp — Host entry points.
//
// Engine wraps one WorkerSupervisor and adds what every caller needs around
// it: request validation, the request digest (execution id), the outcome
// digest, and one ExecutionEvent per call.
//
// run_test_cases() is the consumer contract: it runs against a process-wide
// Engine created on first use from EngineConfig::from_env(). Callers treat
// the returned ExecutionResult as a plain value.

#include <string>
#include <vector>

#include "gradebox/config.hpp"
#include "gradebox/supervisor.hpp"
#include "gradebox/types.hpp"

namespace gradebox {

class Engine {
 public:
  explicit Engine(EngineConfig config);

  // Idempotent. Uses config().image.
  InitStatus initialize();

  // Initializes on first use. Never throws.
  ExecutionResult execute(const ExecutionRequest& request);

  bool ping(const std::string& nonce);
  void terminate();

  const EngineConfig& config() const { return supervisor_.config(); }
  WorkerSupervisor& supervisor() { return supervisor_; }

 private:
  WorkerSupervisor supervisor_;
};

// Empty string when the request may be dispatched, otherwise the reason.
std::string validate_request(const ExecutionRequest& request);

// {source|code, tests|testCases, timeLimitMs, memLimitMb}. Limits default
// from `defaults`. On error returns a default request and sets *error.
ExecutionRequest parse_request_json(const std::string& json_payload, const ExecutionLimits& defaults,
                                    std::string* error);

Engine& global_engine();

ExecutionResult run_test_cases(const std::string& source_text, const std::vector<TestCase>& test_cases,
                               const ExecutionLimits& limits = {});

}  // namespace gradebox
