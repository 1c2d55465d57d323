#include "gradebox/postprocess.hpp"

#include <cstring>
#include <sstream>

namespace gradebox {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool contains(const std::string& hay, const char* needle) {
  return hay.find(needle) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    auto nl = s.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

bool is_runtime_frame(const std::string& trimmed_line, const std::string& lib_prefix) {
  if (trimmed_line.rfind("File \"", 0) != 0) return false;
  const std::string path = trimmed_line.substr(6);
  if (!lib_prefix.empty()) return path.rfind(lib_prefix, 0) == 0;
  return path.rfind("/usr/lib/python", 0) == 0 || path.rfind("/usr/local/lib/python", 0) == 0 ||
         path.rfind("/lib/python", 0) == 0 || path.rfind("<frozen ", 0) == 0;
}

}  // namespace

std::optional<std::string> last_payload_text(const std::string& stdout_text) {
  const std::size_t start_len = std::strlen(kVizStartMarker);
  const std::size_t end_len = std::strlen(kVizEndMarker);
  std::optional<std::string> last;
  std::size_t from = 0;
  while (true) {
    auto s = stdout_text.find(kVizStartMarker, from);
    if (s == std::string::npos) break;
    auto e = stdout_text.find(kVizEndMarker, s + start_len);
    if (e == std::string::npos) break;
    last = trim(stdout_text.substr(s + start_len, e - s - start_len));
    from = e + end_len;
  }
  return last;
}

std::optional<jsonlite::Value> normalize_payload(const std::string& payload_text) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Value v = jsonlite::parse_value(payload_text, &err);
  if (err || !v.is_object()) return std::nullopt;
  const jsonlite::Object& p = v.as_object();

  const jsonlite::Value* diagram = jsonlite::find(p, "diagramType");
  const jsonlite::Value* structure = jsonlite::find(p, "structure");
  const jsonlite::Value* state = jsonlite::find(p, "stateSnapshot");
  const bool has_structure = structure && !structure->is_null();
  const bool has_state = state && !state->is_null();

  jsonlite::Object out;
  if (diagram && diagram->is_string() && !diagram->as_string().empty() &&
      (has_structure || has_state)) {
    out["diagramType"] = diagram->as_string();
    out["structureKind"] = diagram->as_string();
    out["structure"] = has_structure ? *structure : jsonlite::Value{jsonlite::Object{}};
    const jsonlite::Value* markers = jsonlite::find(p, "markers");
    out["markers"] = (markers && markers->is_object()) ? *markers : jsonlite::Value{jsonlite::Object{}};
    out["truncated"] = jsonlite::get_bool(p, "truncated");
    if (has_state) out["stateSnapshot"] = *state;
    return jsonlite::Value{std::move(out)};
  }

  const jsonlite::Value* nodes = jsonlite::find(p, "nodes");
  if (nodes && nodes->is_array()) {
    const jsonlite::Value* edges = jsonlite::find(p, "edges");
    jsonlite::Object s;
    s["nodes"] = *nodes;
    s["edges"] = (edges && edges->is_array()) ? *edges : jsonlite::Value{jsonlite::Array{}};
    out["diagramType"] = "graph";
    out["structureKind"] = "graph";
    out["structure"] = std::move(s);
    out["markers"] = jsonlite::Object{};
    out["truncated"] = false;
    return jsonlite::Value{std::move(out)};
  }
  return std::nullopt;
}

std::string strip_payload_regions(const std::string& stdout_text) {
  const std::size_t end_len = std::strlen(kVizEndMarker);
  std::string s = stdout_text;
  while (true) {
    auto start = s.find(kVizStartMarker);
    if (start == std::string::npos) break;
    auto end = s.find(kVizEndMarker, start);
    if (end == std::string::npos) break;
    std::size_t block_start = start;
    if (block_start > 0 && s[block_start - 1] == '\n') --block_start;
    std::size_t block_end = end + end_len;
    if (block_end < s.size() && s[block_end] == '\n') ++block_end;
    s.erase(block_start, block_end - block_start);
  }
  return s;
}

bool truncate_stream(std::string& text, std::size_t limit) {
  if (text.size() <= limit) return false;
  const std::size_t total = text.size();
  text.resize(limit);
  text += "\n... [truncated: " + std::to_string(total) + " total chars]";
  return true;
}

ExitReason classify_exit(const std::string& stderr_text, const std::vector<TestOutcome>* outcomes,
                         bool timed_out, bool memory_exceeded) {
  if (timed_out) return ExitReason::timeout;
  if (memory_exceeded) return ExitReason::memory_exceeded;
  if (contains(stderr_text, "Package policy violation") || contains(stderr_text, "ImportError") ||
      contains(stderr_text, "ModuleNotFoundError")) {
    return ExitReason::policy_violation;
  }
  if (contains(stderr_text, "SyntaxError") || contains(stderr_text, "IndentationError")) {
    return ExitReason::compile_error;
  }
  bool any_failed = false;
  if (outcomes) {
    for (const auto& o : *outcomes) {
      if (!o.passed) {
        any_failed = true;
        break;
      }
    }
  }
  if (any_failed && !contains(stderr_text, "Traceback")) return ExitReason::test_failure;
  if (contains(stderr_text, "Traceback") || contains(stderr_text, "Error") ||
      contains(stderr_text, "Exception")) {
    return ExitReason::runtime_error;
  }
  return ExitReason::success;
}

std::string strip_runtime_frames(const std::string& stderr_text, const std::string& lib_prefix) {
  std::vector<std::string> kept;
  bool skipping = false;
  for (const auto& line : split_lines(stderr_text)) {
    const std::string t = trim(line);
    if (is_runtime_frame(t, lib_prefix)) {
      skipping = true;
      continue;
    }
    if (skipping) {
      // Source and caret lines of a dropped frame are indented; the next
      // frame or the final message ends the skip.
      const bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
      if (indented && t.rfind("File \"", 0) != 0) continue;
      skipping = false;
    }
    kept.push_back(line);
  }
  if (kept.empty()) return stderr_text;
  std::ostringstream o;
  for (std::size_t i = 0; i < kept.size(); ++i) {
    if (i) o << '\n';
    o << kept[i];
  }
  return trim(o.str());
}

PostProcessed postprocess(const PostProcessInput& in, const PostProcessOptions& opts) {
  PostProcessed out;

  if (auto text = last_payload_text(in.stdout_text)) out.visualization = normalize_payload(*text);
  out.stdout_text = strip_payload_regions(in.stdout_text);
  out.stderr_text = in.stderr_text;

  if (in.timed_out) {
    out.stderr_text += "\nExecution timed out";
  } else if (in.memory_exceeded) {
    out.stderr_text += "\nMemory limit exceeded";
  }

  out.truncation.stdout_truncated = truncate_stream(out.stdout_text, opts.max_stdout);
  out.truncation.stderr_truncated = truncate_stream(out.stderr_text, opts.max_stderr);

  out.exit_reason = classify_exit(out.stderr_text, in.outcomes, in.timed_out, in.memory_exceeded);
  if (out.exit_reason == ExitReason::compile_error) {
    out.stderr_text = strip_runtime_frames(out.stderr_text, opts.runtime_lib_prefix);
  }
  return out;
}

}  // namespace gradebox
