#include "gradebox/types.hpp"

namespace gradebox {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::init_failed: return "init_failed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::protocol_error: return "protocol_error";
    case ErrorCode::worker_busy: return "worker_busy";
    case ErrorCode::worker_crashed: return "worker_crashed";
    case ErrorCode::terminated: return "terminated";
    case ErrorCode::invalid_request: return "invalid_request";
  }
  return "unknown";
}

std::string to_string(ExitReason reason) {
  switch (reason) {
    case ExitReason::success: return "SUCCESS";
    case ExitReason::policy_violation: return "POLICY_VIOLATION";
    case ExitReason::compile_error: return "COMPILATION_ERROR";
    case ExitReason::timeout: return "TIMEOUT";
    case ExitReason::memory_exceeded: return "MEMORY";
    case ExitReason::runtime_error: return "RUNTIME_ERROR";
    case ExitReason::test_failure: return "TEST_FAILURE";
  }
  return "RUNTIME_ERROR";
}

int exit_code_for(ExitReason reason) {
  switch (reason) {
    case ExitReason::success: return kExitOk;
    case ExitReason::timeout: return kExitTimeout;
    case ExitReason::memory_exceeded: return kExitMemory;
    default: return kExitError;
  }
}

std::string to_string(EntryKind kind) {
  switch (kind) {
    case EntryKind::plain_function: return "plain-function";
    case EntryKind::instance_method: return "instance-method";
    case EntryKind::operation_sequence: return "operation-sequence";
  }
  return "plain-function";
}

std::optional<EntryKind> entry_kind_from_string(const std::string& s) {
  if (s == "plain-function") return EntryKind::plain_function;
  if (s == "instance-method") return EntryKind::instance_method;
  if (s == "operation-sequence") return EntryKind::operation_sequence;
  return std::nullopt;
}

namespace {

std::optional<Value> optional_value(const Object& obj, const std::string& key) {
  const Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) return std::nullopt;
  return *v;
}

std::string id_text(const Object& obj) {
  const Value* v = jsonlite::find(obj, "id");
  if (!v) return "";
  if (v->is_string()) return v->as_string();
  if (v->is_int()) return std::to_string(v->as_int());
  return "";
}

}  // namespace

TestCase test_case_from_json(const Value& v) {
  TestCase tc;
  if (!v.is_object()) {
    tc.metadata_error = "test case must be an object";
    return tc;
  }
  const Object& obj = v.as_object();
  tc.id = id_text(obj);

  if (jsonlite::find(obj, "entryKind")) {
    const std::string kind_text = jsonlite::get_string(obj, "entryKind");
    if (auto kind = entry_kind_from_string(kind_text)) {
      tc.entry_kind = *kind;
    } else {
      tc.metadata_error = "unknown entryKind: " + kind_text;
    }
    tc.target_name = jsonlite::get_string(obj, "targetName");
    tc.class_name = jsonlite::get_string(obj, "className");
    if (const Value* a = jsonlite::find(obj, "arguments"); a && a->is_array()) tc.arguments = a->as_array();
    tc.expected_value = optional_value(obj, "expectedValue");
  } else {
    // Legacy runner shape.
    if (!jsonlite::find(obj, "fn")) tc.metadata_error = "Test metadata missing fn";
    tc.target_name = jsonlite::get_string(obj, "fn");
    tc.class_name = jsonlite::get_string(obj, "className");
    if (const Value* a = jsonlite::find(obj, "args"); a && a->is_array()) tc.arguments = a->as_array();
    tc.expected_value = optional_value(obj, "expected");
    if (tc.target_name == "__design__") {
      tc.entry_kind = EntryKind::operation_sequence;
    } else if (!tc.class_name.empty()) {
      tc.entry_kind = EntryKind::instance_method;
    } else {
      tc.entry_kind = EntryKind::plain_function;
    }
  }

  if (tc.entry_kind == EntryKind::operation_sequence && tc.target_name.empty()) tc.target_name = "__design__";
  // Echoed back by the worker for cases the host already found malformed.
  if (tc.metadata_error.empty()) tc.metadata_error = jsonlite::get_string(obj, "metadataError");
  return tc;
}

Value test_case_to_json(const TestCase& tc) {
  Object o;
  o["id"] = tc.id;
  o["entryKind"] = to_string(tc.entry_kind);
  o["targetName"] = tc.target_name;
  if (!tc.class_name.empty()) o["className"] = tc.class_name;
  o["arguments"] = tc.arguments;
  if (tc.expected_value) o["expectedValue"] = *tc.expected_value;
  if (!tc.metadata_error.empty()) o["metadataError"] = tc.metadata_error;
  return Value{std::move(o)};
}

Value test_outcome_to_json(const TestOutcome& t) {
  Object o;
  o["id"] = t.id;
  o["targetName"] = t.target_name;
  o["passed"] = t.passed;
  if (t.received_value) o["receivedValue"] = *t.received_value;
  if (t.expected_value) o["expectedValue"] = *t.expected_value;
  if (t.error_text) o["errorText"] = *t.error_text;
  o["durationMs"] = t.duration_ms;
  return Value{std::move(o)};
}

TestOutcome test_outcome_from_json(const Object& obj) {
  TestOutcome t;
  t.id = jsonlite::get_string(obj, "id");
  t.target_name = jsonlite::get_string(obj, "targetName");
  t.passed = jsonlite::get_bool(obj, "passed");
  if (const Value* v = jsonlite::find(obj, "receivedValue")) t.received_value = *v;
  if (const Value* v = jsonlite::find(obj, "expectedValue")) t.expected_value = *v;
  if (const Value* v = jsonlite::find(obj, "errorText"); v && v->is_string()) t.error_text = v->as_string();
  t.duration_ms = jsonlite::get_double(obj, "durationMs");
  return t;
}

Value user_test_to_json(const UserTestOutcome& u) {
  Object o;
  o["name"] = u.name;
  o["status"] = u.status;
  if (u.error_text) o["errorText"] = *u.error_text;
  return Value{std::move(o)};
}

UserTestOutcome user_test_from_json(const Object& obj) {
  UserTestOutcome u;
  u.name = jsonlite::get_string(obj, "name", "unknown");
  u.status = jsonlite::get_string(obj, "status", "error");
  if (const Value* v = jsonlite::find(obj, "errorText"); v && v->is_string()) u.error_text = v->as_string();
  return u;
}

Value raw_result_to_json(const RawRunResult& r) {
  Object o;
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;
  Array outcomes;
  for (const auto& t : r.outcomes) outcomes.push_back(test_outcome_to_json(t));
  o["outcomes"] = std::move(outcomes);
  Array users;
  for (const auto& u : r.user_tests) users.push_back(user_test_to_json(u));
  o["userTests"] = std::move(users);
  o["interrupted"] = r.interrupted;
  o["durationMs"] = r.duration_ms;
  return Value{std::move(o)};
}

RawRunResult raw_result_from_json(const Object& obj) {
  RawRunResult r;
  r.stdout_text = jsonlite::get_string(obj, "stdout");
  r.stderr_text = jsonlite::get_string(obj, "stderr");
  if (const Value* v = jsonlite::find(obj, "outcomes"); v && v->is_array()) {
    for (const auto& item : v->as_array()) {
      if (item.is_object()) r.outcomes.push_back(test_outcome_from_json(item.as_object()));
    }
  }
  if (const Value* v = jsonlite::find(obj, "userTests"); v && v->is_array()) {
    for (const auto& item : v->as_array()) {
      if (item.is_object()) r.user_tests.push_back(user_test_from_json(item.as_object()));
    }
  }
  r.interrupted = jsonlite::get_bool(obj, "interrupted");
  r.duration_ms = jsonlite::get_double(obj, "durationMs");
  return r;
}

Value result_to_json_value(const ExecutionResult& r) {
  Object o;
  o["ok"] = r.ok;
  if (r.error_code != ErrorCode::none) {
    o["errorCode"] = to_string(r.error_code);
    o["errorMessage"] = r.error_message;
  }
  o["exitReason"] = to_string(r.exit_reason);
  o["exitCode"] = exit_code_for(r.exit_reason);
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;

  Array outcomes;
  int passed = 0;
  for (const auto& t : r.outcomes) {
    if (t.passed) ++passed;
    outcomes.push_back(test_outcome_to_json(t));
  }
  Object summary;
  summary["total"] = static_cast<std::int64_t>(r.outcomes.size());
  summary["passed"] = passed;
  summary["failed"] = static_cast<std::int64_t>(r.outcomes.size()) - passed;
  o["outcomes"] = std::move(outcomes);
  o["summary"] = std::move(summary);

  if (!r.user_tests.empty()) {
    Array users;
    for (const auto& u : r.user_tests) users.push_back(user_test_to_json(u));
    o["userTests"] = std::move(users);
  }
  if (r.visualization) o["visualization"] = *r.visualization;
  o["durationMs"] = r.duration_ms;

  Object trunc;
  trunc["stdout"] = r.truncation.stdout_truncated;
  trunc["stderr"] = r.truncation.stderr_truncated;
  o["truncation"] = std::move(trunc);
  o["timedOut"] = r.timed_out;
  o["memoryExceeded"] = r.memory_exceeded;
  if (!r.request_digest.empty()) o["requestDigest"] = r.request_digest;
  return Value{std::move(o)};
}

std::string result_to_json(const ExecutionResult& r) {
  return jsonlite::to_json(result_to_json_value(r));
}

}  // namespace gradebox
