#pragma once

// gradebox/postprocess.hpp — Turns a raw worker run into the normalized
// ExecutionResult fields: visualization extraction, marker stripping, stream
// truncation, exit-reason classification and compile-error frame cleanup.
//
// Pure functions of their inputs; no guest runtime involved.

#include <optional>
#include <string>
#include <vector>

#include "gradebox/jsonlite.hpp"
#include "gradebox/types.hpp"

namespace gradebox {

constexpr const char* kVizStartMarker = "=== VIZ_PAYLOAD_START ===";
constexpr const char* kVizEndMarker = "=== VIZ_PAYLOAD_END ===";

struct PostProcessOptions {
  std::size_t max_stdout{20000};
  std::size_t max_stderr{10000};
  // Frames whose file starts with this path are runtime-internal. Empty means
  // any "/usr/lib/python" or "/usr/local/lib/python" path.
  std::string runtime_lib_prefix;
};

struct PostProcessInput {
  std::string stdout_text;
  std::string stderr_text;
  const std::vector<TestOutcome>* outcomes{nullptr};
  bool timed_out{false};
  bool memory_exceeded{false};
};

struct PostProcessed {
  std::string stdout_text;
  std::string stderr_text;
  ExitReason exit_reason{ExitReason::success};
  std::optional<jsonlite::Value> visualization;
  TruncationFlags truncation;
};

PostProcessed postprocess(const PostProcessInput& in, const PostProcessOptions& opts);

// Body text of the last complete start/end marker pair, trimmed.
std::optional<std::string> last_payload_text(const std::string& stdout_text);

// Validates a payload: {diagramType, structure|stateSnapshot} is normalized to
// {diagramType, structureKind, structure, markers, truncated[, stateSnapshot]};
// a bare legacy {nodes[, edges]} becomes a graph. Anything else is rejected.
std::optional<jsonlite::Value> normalize_payload(const std::string& payload_text);

// Removes every complete marker region plus one adjacent newline each side.
std::string strip_payload_regions(const std::string& stdout_text);

// Keeps the first `limit` characters and appends
// "\n... [truncated: <N> total chars]". Returns whether it truncated.
bool truncate_stream(std::string& text, std::size_t limit);

ExitReason classify_exit(const std::string& stderr_text, const std::vector<TestOutcome>* outcomes,
                         bool timed_out, bool memory_exceeded);

// Drops traceback frames inside the runtime's library directory together with
// their indented source and caret lines.
std::string strip_runtime_frames(const std::string& stderr_text, const std::string& lib_prefix);

}  // namespace gradebox
