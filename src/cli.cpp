#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "gradebox/config.hpp"
#include "gradebox/engine.hpp"
#include "gradebox/hash.hpp"
#include "gradebox/jsonlite.hpp"
#include "gradebox/observability.hpp"
#include "gradebox/version.hpp"

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

void write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
}

void print_error(const std::string& code, const std::string& message) {
  std::cout << "{\"ok\":false,\"error_code\":\"" << gradebox::jsonlite::escape(code)
            << "\",\"error\":\"" << gradebox::jsonlite::escape(message) << "\"}\n";
}

int usage() {
  std::cerr << "usage: gradebox <command>\n"
               "  run <request.json> [--out <result.json>]\n"
               "  ping\n"
               "  health\n"
               "  config show\n"
               "  config validate <config.json>\n"
               "  version\n";
  return 2;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  const std::string cmd = argv[1];

  // ---------------------------------------------------------------------------
  // run — one request file, result JSON on stdout (or --out).
  // Exit: 0 success verdict, 1 any other verdict, 2 host-level failure.
  // ---------------------------------------------------------------------------
  if (cmd == "run") {
    std::string in, out;
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--out" && i + 1 < argc) {
        out = argv[++i];
      } else if (in.empty()) {
        in = arg;
      }
    }
    if (in.empty()) return usage();

    std::string payload;
    if (!read_file(in, &payload)) {
      print_error("invalid_request", "cannot read " + in);
      return 2;
    }

    gradebox::Engine& engine = gradebox::global_engine();
    gradebox::ExecutionLimits defaults;
    defaults.time_limit_ms = engine.config().time_limit_ms;
    defaults.mem_limit_mb = engine.config().mem_limit_mb;

    std::string err;
    auto req = gradebox::parse_request_json(payload, defaults, &err);
    if (!err.empty()) {
      print_error("invalid_request", err);
      return 2;
    }

    auto res = engine.execute(req);
    const std::string json = gradebox::result_to_json(res);
    if (out.empty()) {
      std::cout << json << "\n";
    } else {
      write_file(out, json);
    }
    engine.terminate();
    if (!res.ok) return 2;
    return res.exit_reason == gradebox::ExitReason::success ? 0 : 1;
  }

  if (cmd == "ping") {
    gradebox::Engine& engine = gradebox::global_engine();
    const auto init = engine.initialize();
    if (!init.ok) {
      print_error(gradebox::to_string(init.error_code), init.message);
      return 2;
    }
    const bool ok = engine.ping("cli");
    std::cout << "{\"ok\":" << (ok ? "true" : "false") << ",\"runtime\":\""
              << gradebox::jsonlite::escape(init.runtime_version) << "\",\"worker_pid\":"
              << engine.supervisor().worker_pid() << "}\n";
    engine.terminate();
    return ok ? 0 : 2;
  }

  // health — worker bring-up plus aggregated counters. Does not run guest code.
  if (cmd == "health") {
    gradebox::Engine& engine = gradebox::global_engine();
    const auto init = engine.initialize();
    std::ostringstream o;
    o << "{"
      << "\"ok\":" << (init.ok ? "true" : "false")
      << ",\"engine_version\":\"" << PROJECT_VERSION << "\""
      << ",\"hash_primitive\":\"blake3\""
      << ",\"hash_version\":\"" << gradebox::jsonlite::escape(gradebox::blake3_version_string()) << "\""
      << ",\"worker_path\":\"" << gradebox::jsonlite::escape(engine.config().worker_path) << "\""
      << ",\"runtime\":\"" << gradebox::jsonlite::escape(init.runtime_version) << "\"";
    if (!init.ok) {
      o << ",\"error_code\":\"" << gradebox::to_string(init.error_code) << "\""
        << ",\"error\":\"" << gradebox::jsonlite::escape(init.message) << "\"";
    }
    o << ",\"stats\":" << gradebox::global_engine_stats().to_json() << "}\n";
    std::cout << o.str();
    engine.terminate();
    return init.ok ? 0 : 2;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    std::cout << gradebox::config_to_json(gradebox::EngineConfig::from_env()) << "\n";
    return 0;
  }

  if (cmd == "config" && argc >= 4 && std::string(argv[2]) == "validate") {
    std::string payload;
    if (!read_file(argv[3], &payload)) {
      print_error("config_unreadable", std::string("cannot read ") + argv[3]);
      return 2;
    }
    const auto r = gradebox::validate_config(payload);
    gradebox::jsonlite::Array errors, warnings;
    for (const auto& e : r.errors) errors.push_back(e);
    for (const auto& w : r.warnings) warnings.push_back(w);
    gradebox::jsonlite::Object o;
    o["ok"] = r.ok;
    o["config_version"] = r.config_version;
    o["errors"] = std::move(errors);
    o["warnings"] = std::move(warnings);
    std::cout << gradebox::jsonlite::to_json(o) << "\n";
    return r.ok ? 0 : 1;
  }

  if (cmd == "version") {
    auto manifest = gradebox::version::current_manifest(PROJECT_VERSION);
    auto result = gradebox::version::check_compatibility(gradebox::version::PROTOCOL_FRAMING_VERSION);
    std::cout << "{"
              << "\"ok\":" << (result.ok ? "true" : "false")
              << ",\"manifest\":" << gradebox::version::manifest_to_json(manifest) << "}\n";
    return 0;
  }

  return usage();
}
