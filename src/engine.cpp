#include "gradebox/engine.hpp"

#include <chrono>
#include <memory>
#include <mutex>

#include "gradebox/hash.hpp"
#include "gradebox/observability.hpp"

namespace gradebox {

namespace {

// Upper bounds a request must respect before it is sent to the worker.
constexpr std::size_t kMaxSourceBytes = 1 * 1024 * 1024;
constexpr std::size_t kMaxTestCases = 1000;
constexpr std::uint64_t kMaxTimeLimitMs = 10 * 60 * 1000;
constexpr std::uint64_t kMaxMemLimitMb = 64 * 1024;

ExecutionResult rejected(ErrorCode code, const std::string& message) {
  ExecutionResult r;
  r.ok = false;
  r.error_code = code;
  r.error_message = message;
  r.exit_reason = ExitReason::runtime_error;
  return r;
}

void emit_event(const ExecutionRequest& request, const ExecutionResult& result, std::uint64_t duration_ns) {
  ExecutionEvent ev;
  ev.execution_id = result.request_digest;
  if (result.ok) ev.outcome_digest = outcome_digest(result);
  ev.duration_ns = duration_ns;
  ev.worker_ns = static_cast<uint64_t>(result.duration_ms * 1e6);
  ev.bytes_in = request.source_text.size();
  ev.bytes_stdout = result.stdout_text.size();
  ev.bytes_stderr = result.stderr_text.size();
  ev.tests_total = result.outcomes.size();
  for (const auto& o : result.outcomes) {
    if (o.passed) ++ev.tests_passed;
  }
  ev.ok = result.ok;
  ev.error_code = to_string(result.error_code);
  ev.exit_reason = result.exit_reason;
  ev.timed_out = result.timed_out;
  ev.memory_exceeded = result.memory_exceeded;
  ev.worker_restarted = result.worker_restarted;
  emit_execution_event(ev);
}

}  // namespace

Engine::Engine(EngineConfig config) : supervisor_(std::move(config)) {}

InitStatus Engine::initialize() { return supervisor_.initialize(supervisor_.config().image); }

ExecutionResult Engine::execute(const ExecutionRequest& request) {
  const auto start = std::chrono::steady_clock::now();
  const std::string digest = request_digest(request);

  ExecutionResult result;
  if (std::string why = validate_request(request); !why.empty()) {
    result = rejected(ErrorCode::invalid_request, why);
  } else if (InitStatus init = initialize(); !init.ok) {
    result = rejected(ErrorCode::init_failed, init.message);
  } else {
    result = supervisor_.execute(request);
  }
  result.request_digest = digest;

  const auto elapsed = std::chrono::steady_clock::now() - start;
  emit_event(request, result,
             static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
  return result;
}

bool Engine::ping(const std::string& nonce) {
  if (!initialize().ok) return false;
  return supervisor_.ping(nonce);
}

void Engine::terminate() { supervisor_.terminate(); }

std::string validate_request(const ExecutionRequest& request) {
  if (request.source_text.size() > kMaxSourceBytes) {
    return "source exceeds " + std::to_string(kMaxSourceBytes) + " bytes";
  }
  if (request.test_cases.size() > kMaxTestCases) {
    return "more than " + std::to_string(kMaxTestCases) + " test cases";
  }
  if (request.time_limit_ms == 0 || request.time_limit_ms > kMaxTimeLimitMs) {
    return "time limit must be in [1, " + std::to_string(kMaxTimeLimitMs) + "] ms";
  }
  if (request.mem_limit_mb == 0 || request.mem_limit_mb > kMaxMemLimitMb) {
    return "memory limit must be in [1, " + std::to_string(kMaxMemLimitMb) + "] MB";
  }
  // Malformed individual cases are not a request error: the harness fails
  // each of them on its own.
  return "";
}

ExecutionRequest parse_request_json(const std::string& json_payload, const ExecutionLimits& defaults,
                                    std::string* error) {
  ExecutionRequest req;
  req.time_limit_ms = defaults.time_limit_ms;
  req.mem_limit_mb = defaults.mem_limit_mb;

  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(json_payload, &err);
  if (err) {
    if (error) *error = "invalid request JSON: " + err->message;
    return ExecutionRequest{};
  }

  req.source_text = jsonlite::find(obj, "source") ? jsonlite::get_string(obj, "source")
                                                  : jsonlite::get_string(obj, "code");
  const jsonlite::Value* tests = jsonlite::find(obj, "tests");
  if (!tests) tests = jsonlite::find(obj, "testCases");
  if (tests && !tests->is_null()) {
    if (!tests->is_array()) {
      if (error) *error = "tests must be an array";
      return ExecutionRequest{};
    }
    for (const auto& t : tests->as_array()) req.test_cases.push_back(test_case_from_json(t));
  }
  req.time_limit_ms = jsonlite::get_u64(obj, "timeLimitMs", req.time_limit_ms);
  req.mem_limit_mb = jsonlite::get_u64(obj, "memLimitMb", req.mem_limit_mb);
  return req;
}

Engine& global_engine() {
  static std::once_flag once;
  static std::unique_ptr<Engine> engine;
  std::call_once(once, [] { engine = std::make_unique<Engine>(EngineConfig::from_env()); });
  return *engine;
}

ExecutionResult run_test_cases(const std::string& source_text, const std::vector<TestCase>& test_cases,
                               const ExecutionLimits& limits) {
  ExecutionRequest req;
  req.source_text = source_text;
  req.test_cases = test_cases;
  req.time_limit_ms = limits.time_limit_ms;
  req.mem_limit_mb = limits.mem_limit_mb;
  return global_engine().execute(req);
}

}  // namespace gradebox
