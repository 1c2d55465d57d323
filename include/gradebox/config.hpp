#pragma once

// gradebox/config.hpp — Engine configuration.
//
// Values come from GRADEBOX_* environment variables (EngineConfig::from_env)
// or from a JSON config document (EngineConfig::from_json). validate_config()
// reports structured errors and warnings without applying anything.

#include <cstdint>
#include <string>
#include <vector>

#include "gradebox/jsonlite.hpp"

namespace gradebox {

struct EngineConfig {
  std::string worker_path;             // GRADEBOX_WORKER_PATH
  std::string image;                   // GRADEBOX_IMAGE, empty = interpreter default
  std::uint64_t time_limit_ms{2000};   // GRADEBOX_TIME_LIMIT_MS
  std::uint64_t mem_limit_mb{128};     // GRADEBOX_MEM_LIMIT_MB
  std::uint64_t kill_grace_ms{1000};   // GRADEBOX_KILL_GRACE_MS
  std::uint64_t sample_interval_ms{50};  // GRADEBOX_SAMPLE_INTERVAL_MS
  std::uint64_t init_timeout_ms{20000};  // GRADEBOX_INIT_TIMEOUT_MS
  std::size_t max_stdout{20000};       // GRADEBOX_MAX_STDOUT
  std::size_t max_stderr{10000};       // GRADEBOX_MAX_STDERR
  std::uint64_t worker_address_space_mb{0};  // GRADEBOX_WORKER_ADDRESS_SPACE_MB, 0 = no RLIMIT_AS
  std::string runtime_lib_prefix;      // frames under this path are stripped from compile errors
  std::string event_log;               // GRADEBOX_EVENT_LOG

  static EngineConfig from_env();
  // Missing keys keep the defaults above. Ill-typed keys are ignored; run
  // validate_config() first to surface them.
  static EngineConfig from_json(const jsonlite::Object& obj);
};

// Where gradebox_worker lives when GRADEBOX_WORKER_PATH is unset: next to
// the running executable.
std::string default_worker_path();

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);

std::string config_to_json(const EngineConfig& config);

}  // namespace gradebox
