#pragma once

// gradebox/types.hpp — Core data structures for the gradebox execution engine.
//
// OWNERSHIP:
//   - Every type here is a value type. ExecutionRequest is immutable once
//     dispatched; ExecutionResult is produced once per request and returned
//     by value. No raw pointer members in any public API type.
//   - Guest values that cross the worker boundary (arguments, expected and
//     received values) are carried as jsonlite::Value.
//
// ERROR MODEL:
//   - ExitReason classifies what the GUEST program did. A failing guest
//     program is the common case and is an ordinary result.
//   - ErrorCode classifies HOST-level failures (worker could not start, was
//     killed, protocol broke). Only ErrorCode::init_failed aborts the chain.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gradebox/jsonlite.hpp"

namespace gradebox {

enum class ErrorCode {
  none,
  init_failed,
  spawn_failed,
  protocol_error,
  worker_busy,
  worker_crashed,
  terminated,
  invalid_request,
};

std::string to_string(ErrorCode code);

enum class ExitReason {
  success,
  policy_violation,
  compile_error,
  timeout,
  memory_exceeded,
  runtime_error,
  test_failure,
};

std::string to_string(ExitReason reason);

// Process-style exit codes reported as `exitCode` in result JSON.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitTimeout = 124;
constexpr int kExitMemory = 137;

int exit_code_for(ExitReason reason);

enum class EntryKind {
  plain_function,
  instance_method,
  operation_sequence,
};

std::string to_string(EntryKind kind);
std::optional<EntryKind> entry_kind_from_string(const std::string& s);

struct TestCase {
  std::string id;
  EntryKind entry_kind{EntryKind::plain_function};
  std::string target_name;
  std::string class_name;       // instance_method only
  jsonlite::Array arguments;    // operation_sequence: [operations, argument_lists]
  std::optional<jsonlite::Value> expected_value;
  // Non-empty when the case description itself was unusable. The case then
  // fails with this text without guest code being called; the other cases
  // still run.
  std::string metadata_error;
};

// Accepts both the native shape {id, entryKind, targetName, className,
// arguments, expectedValue} and the legacy runner shape {id, fn, className,
// args, expected} where fn == "__design__" marks an operation sequence.
// Never rejects: an unusable description sets metadata_error.
TestCase test_case_from_json(const jsonlite::Value& v);
jsonlite::Value test_case_to_json(const TestCase& tc);

struct TestOutcome {
  std::string id;
  std::string target_name;
  bool passed{false};
  std::optional<jsonlite::Value> received_value;
  std::optional<jsonlite::Value> expected_value;
  std::optional<std::string> error_text;
  double duration_ms{0.0};
};

jsonlite::Value test_outcome_to_json(const TestOutcome& o);
TestOutcome test_outcome_from_json(const jsonlite::Object& obj);

// Result of one entry of the guest-authored USER_TESTS collection.
struct UserTestOutcome {
  std::string name;
  std::string status;  // "pass" | "fail" | "error"
  std::optional<std::string> error_text;
};

jsonlite::Value user_test_to_json(const UserTestOutcome& u);
UserTestOutcome user_test_from_json(const jsonlite::Object& obj);

struct ExecutionLimits {
  std::uint64_t time_limit_ms{2000};
  std::uint64_t mem_limit_mb{128};
};

struct ExecutionRequest {
  std::string source_text;
  std::vector<TestCase> test_cases;
  std::uint64_t time_limit_ms{2000};
  std::uint64_t mem_limit_mb{128};
};

struct TruncationFlags {
  bool stdout_truncated{false};
  bool stderr_truncated{false};
};

// What the worker sends back before post-processing: raw captured streams
// (markers still embedded) plus harness outcomes.
struct RawRunResult {
  std::string stdout_text;
  std::string stderr_text;
  std::vector<TestOutcome> outcomes;
  std::vector<UserTestOutcome> user_tests;
  bool interrupted{false};
  double duration_ms{0.0};
};

jsonlite::Value raw_result_to_json(const RawRunResult& r);
RawRunResult raw_result_from_json(const jsonlite::Object& obj);

struct ExecutionResult {
  // Host-level status. ok=false means no guest verdict could be produced.
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;

  ExitReason exit_reason{ExitReason::success};
  std::string stdout_text;
  std::string stderr_text;
  std::vector<TestOutcome> outcomes;
  std::vector<UserTestOutcome> user_tests;
  // Parsed marker payload (StructureSnapshot JSON), if any.
  std::optional<jsonlite::Value> visualization;
  double duration_ms{0.0};
  TruncationFlags truncation;
  bool timed_out{false};
  bool memory_exceeded{false};
  bool worker_restarted{false};
  std::string request_digest;
};

jsonlite::Value result_to_json_value(const ExecutionResult& r);
std::string result_to_json(const ExecutionResult& r);

}  // namespace gradebox
