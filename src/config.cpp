#include "gradebox/config.hpp"

#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <set>

namespace gradebox {

namespace {

bool env_u64(const char* name, std::uint64_t& out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(e, &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  out = static_cast<std::uint64_t>(v);
  return true;
}

std::string env_string(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : std::string();
}

struct NumericKey {
  const char* key;
  std::uint64_t min;
  std::uint64_t max;
};

// Bounds reject values that cannot work at all, not merely unusual ones.
constexpr NumericKey kNumericKeys[] = {
    {"time_limit_ms", 1, 3600000},
    {"mem_limit_mb", 1, 1048576},
    {"kill_grace_ms", 0, 600000},
    {"sample_interval_ms", 1, 60000},
    {"init_timeout_ms", 1, 3600000},
    {"max_stdout", 0, 1u << 30},
    {"max_stderr", 0, 1u << 30},
    {"worker_address_space_mb", 0, 1048576},
};

constexpr const char* kStringKeys[] = {"worker_path", "image", "runtime_lib_prefix", "event_log",
                                       "config_version"};

}  // namespace

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  c.worker_path = env_string("GRADEBOX_WORKER_PATH");
  if (c.worker_path.empty()) c.worker_path = default_worker_path();
  c.image = env_string("GRADEBOX_IMAGE");
  env_u64("GRADEBOX_TIME_LIMIT_MS", c.time_limit_ms);
  env_u64("GRADEBOX_MEM_LIMIT_MB", c.mem_limit_mb);
  env_u64("GRADEBOX_KILL_GRACE_MS", c.kill_grace_ms);
  env_u64("GRADEBOX_SAMPLE_INTERVAL_MS", c.sample_interval_ms);
  env_u64("GRADEBOX_INIT_TIMEOUT_MS", c.init_timeout_ms);
  std::uint64_t v = 0;
  if (env_u64("GRADEBOX_MAX_STDOUT", v)) c.max_stdout = static_cast<std::size_t>(v);
  if (env_u64("GRADEBOX_MAX_STDERR", v)) c.max_stderr = static_cast<std::size_t>(v);
  env_u64("GRADEBOX_WORKER_ADDRESS_SPACE_MB", c.worker_address_space_mb);
  c.runtime_lib_prefix = env_string("GRADEBOX_RUNTIME_LIB_PREFIX");
  c.event_log = env_string("GRADEBOX_EVENT_LOG");
  if (c.sample_interval_ms == 0) c.sample_interval_ms = 50;
  return c;
}

EngineConfig EngineConfig::from_json(const jsonlite::Object& obj) {
  EngineConfig c;
  c.worker_path = jsonlite::get_string(obj, "worker_path");
  if (c.worker_path.empty()) c.worker_path = default_worker_path();
  c.image = jsonlite::get_string(obj, "image");
  c.time_limit_ms = jsonlite::get_u64(obj, "time_limit_ms", c.time_limit_ms);
  c.mem_limit_mb = jsonlite::get_u64(obj, "mem_limit_mb", c.mem_limit_mb);
  c.kill_grace_ms = jsonlite::get_u64(obj, "kill_grace_ms", c.kill_grace_ms);
  c.sample_interval_ms = jsonlite::get_u64(obj, "sample_interval_ms", c.sample_interval_ms);
  c.init_timeout_ms = jsonlite::get_u64(obj, "init_timeout_ms", c.init_timeout_ms);
  c.max_stdout = static_cast<std::size_t>(jsonlite::get_u64(obj, "max_stdout", c.max_stdout));
  c.max_stderr = static_cast<std::size_t>(jsonlite::get_u64(obj, "max_stderr", c.max_stderr));
  c.worker_address_space_mb =
      jsonlite::get_u64(obj, "worker_address_space_mb", c.worker_address_space_mb);
  c.runtime_lib_prefix = jsonlite::get_string(obj, "runtime_lib_prefix");
  c.event_log = jsonlite::get_string(obj, "event_log");
  if (c.sample_interval_ms == 0) c.sample_interval_ms = 50;
  return c;
}

std::string default_worker_path() {
  char buf[PATH_MAX];
  ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n <= 0) return "gradebox_worker";
  std::string self(buf, static_cast<std::size_t>(n));
  auto slash = self.rfind('/');
  if (slash == std::string::npos) return "gradebox_worker";
  return self.substr(0, slash + 1) + "gradebox_worker";
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back("parse_error: " + err->message);
    return r;
  }

  r.config_version = jsonlite::get_string(obj, "config_version", "1");
  if (r.config_version != "1") {
    r.warnings.push_back("unrecognized config_version " + r.config_version);
  }

  std::set<std::string> known;
  for (const auto& k : kNumericKeys) {
    known.insert(k.key);
    const jsonlite::Value* v = jsonlite::find(obj, k.key);
    if (!v) continue;
    if (!v->is_int() || v->as_int() < 0) {
      r.errors.push_back(std::string(k.key) + ": expected non-negative integer");
      continue;
    }
    const auto n = static_cast<std::uint64_t>(v->as_int());
    if (n < k.min || n > k.max) {
      r.errors.push_back(std::string(k.key) + ": out of range [" + std::to_string(k.min) + ", " +
                         std::to_string(k.max) + "]");
    }
  }
  for (const char* k : kStringKeys) {
    known.insert(k);
    const jsonlite::Value* v = jsonlite::find(obj, k);
    if (v && !v->is_string()) r.errors.push_back(std::string(k) + ": expected string");
  }
  for (const auto& [key, _] : obj) {
    if (!known.count(key)) r.warnings.push_back("unknown key: " + key);
  }

  // The hard kill must land after the cooperative interrupt had its chance.
  const jsonlite::Value* grace = jsonlite::find(obj, "kill_grace_ms");
  if (grace && grace->is_int() && grace->as_int() == 0) {
    r.warnings.push_back("kill_grace_ms=0: worker is killed without a cooperative interrupt window");
  }

  r.ok = r.errors.empty();
  return r;
}

std::string config_to_json(const EngineConfig& c) {
  jsonlite::Object o;
  o["worker_path"] = c.worker_path;
  o["image"] = c.image;
  o["time_limit_ms"] = c.time_limit_ms;
  o["mem_limit_mb"] = c.mem_limit_mb;
  o["kill_grace_ms"] = c.kill_grace_ms;
  o["sample_interval_ms"] = c.sample_interval_ms;
  o["init_timeout_ms"] = c.init_timeout_ms;
  o["max_stdout"] = static_cast<std::uint64_t>(c.max_stdout);
  o["max_stderr"] = static_cast<std::uint64_t>(c.max_stderr);
  o["worker_address_space_mb"] = c.worker_address_space_mb;
  o["runtime_lib_prefix"] = c.runtime_lib_prefix;
  o["event_log"] = c.event_log;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace gradebox
