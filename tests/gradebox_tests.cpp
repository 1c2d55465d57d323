#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gradebox/config.hpp"
#include "gradebox/engine.hpp"
#include "gradebox/governor.hpp"
#include "gradebox/guest_value.hpp"
#include "gradebox/hash.hpp"
#include "gradebox/interrupt.hpp"
#include "gradebox/invariants.hpp"
#include "gradebox/jsonlite.hpp"
#include "gradebox/observability.hpp"
#include "gradebox/policy.hpp"
#include "gradebox/postprocess.hpp"
#include "gradebox/protocol.hpp"
#include "gradebox/snapshot.hpp"
#include "gradebox/types.hpp"
#include "gradebox/version.hpp"

namespace fs = std::filesystem;
namespace json = gradebox::jsonlite;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

const json::Object& obj_at(const json::Value& v, const std::string& key) {
  return v.as_object().at(key).as_object();
}

const json::Array& arr_at(const json::Object& o, const std::string& key) { return o.at(key).as_array(); }

// ============================================================================
// Hand-built guest graphs
// ============================================================================

class GraphBuilder {
 public:
  gradebox::GuestGraph graph;

  gradebox::GuestId none() {
    if (!none_id_) {
      gradebox::GuestValue v = base(gradebox::GuestKind::none, "NoneType", "None");
      none_id_ = v.id;
      graph.add(std::move(v));
    }
    return none_id_;
  }

  gradebox::GuestId integer(std::int64_t n) {
    gradebox::GuestValue v = base(gradebox::GuestKind::integer, "int", std::to_string(n));
    v.integer = n;
    v.truthy = n != 0;
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId boolean(bool b) {
    gradebox::GuestValue v = base(gradebox::GuestKind::boolean, "bool", b ? "True" : "False");
    v.integer = b ? 1 : 0;
    v.truthy = b;
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId text(const std::string& s) {
    gradebox::GuestValue v = base(gradebox::GuestKind::text, "str", s);
    v.length = s.size();
    v.truthy = !s.empty();
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId list(const std::vector<gradebox::GuestId>& items) {
    std::string repr = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i) repr += ", ";
      repr += graph.find(items[i])->text;
    }
    repr += "]";
    gradebox::GuestValue v = base(gradebox::GuestKind::sequence, "list", repr);
    v.items = items;
    v.length = items.size();
    v.truthy = !items.empty();
    v.expanded = true;
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId dict(const std::vector<std::pair<gradebox::GuestId, gradebox::GuestId>>& entries) {
    gradebox::GuestValue v = base(gradebox::GuestKind::mapping, "dict", "{...}");
    v.entries = entries;
    v.length = entries.size();
    v.truthy = !entries.empty();
    v.expanded = true;
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId object(const std::string& type_name) {
    gradebox::GuestValue v = base(gradebox::GuestKind::object, type_name, "<" + type_name + " object>");
    v.has_dict = true;
    v.truthy = true;
    v.expanded = true;
    return graph.add(std::move(v)).id;
  }

  gradebox::GuestId callable(const std::string& name) {
    gradebox::GuestValue v = base(gradebox::GuestKind::callable, "method", "<bound method " + name + ">");
    v.truthy = true;
    return graph.add(std::move(v)).id;
  }

  void set_attr(gradebox::GuestId owner, const std::string& name, gradebox::GuestId value,
                std::optional<gradebox::GuestId> call_result = std::nullopt) {
    gradebox::GuestValue* o = graph.find(owner);
    for (auto& a : o->attributes) {
      if (a.name == name) {
        a.value = value;
        a.call_result = call_result;
        return;
      }
    }
    o->attributes.push_back({name, value, true, call_result});
  }

  // Singly linked nodes with `val` and `next`; returns the node ids in order.
  std::vector<gradebox::GuestId> chain(int n) {
    std::vector<gradebox::GuestId> nodes;
    for (int i = 0; i < n; ++i) {
      const auto node = object("Node");
      set_attr(node, "val", integer(i + 1));
      nodes.push_back(node);
    }
    for (int i = 0; i < n; ++i) {
      set_attr(nodes[i], "next", i + 1 < n ? nodes[i + 1] : none());
    }
    return nodes;
  }

 private:
  gradebox::GuestValue base(gradebox::GuestKind kind, const std::string& type_name, const std::string& text) {
    gradebox::GuestValue v;
    v.id = next_id_++;
    v.kind = kind;
    v.type_name = type_name;
    v.text = text;
    return v;
  }

  gradebox::GuestId next_id_{1000};
  gradebox::GuestId none_id_{0};
};

std::optional<json::Value> serialize(const gradebox::GuestGraph& g) {
  gradebox::SnapshotOptions opts;
  gradebox::StructureSerializer s(g, opts);
  return s.build();
}

// ============================================================================
// Phase 1: JSON, hashing, versions
// ============================================================================

void test_json_canonical_output() {
  std::optional<json::JsonError> err;
  auto v = json::parse_value(R"({"b":1,"a":[true,null,"x"],"c":2.5})", &err);
  expect(!err, "valid document must parse");
  expect(json::to_json(v) == R"({"a":[true,null,"x"],"b":1,"c":2.5})", "keys must serialize sorted");
  expect(v.as_object().at("b").is_int(), "integral literal stays integer");
  expect(v.as_object().at("c").is_double(), "fractional literal is double");
}

void test_json_rejects_garbage() {
  std::optional<json::JsonError> err;
  json::parse_value("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing garbage must be rejected");
  err.reset();
  json::parse("[1,2]", &err);
  expect(err.has_value(), "parse() requires an object root");
}

void test_json_escape() {
  json::Value v{std::string("line\n\"quoted\"\t")};
  const std::string out = json::to_json(v);
  expect(out == "\"line\\n\\\"quoted\\\"\\t\"", "control characters and quotes escaped");
  std::optional<json::JsonError> err;
  expect(json::parse_value(out, &err) == v, "escaped text parses back");
}

void test_json_unsigned_range() {
  expect(json::Value(std::uint64_t{5}).is_int(), "small unsigned stays integral");
  const std::uint64_t big = std::numeric_limits<std::uint64_t>::max();
  json::Value v(big);
  expect(v.is_double(), "unsigned past int64 is not wrapped into a negative integer");
  expect(v.as_double() == static_cast<double>(big), "magnitude preserved");
  expect(json::Value(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())).is_int(),
         "int64 max still integral");
}

void test_blake3_known_vectors() {
  expect(gradebox::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(gradebox::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_request_digest() {
  gradebox::ExecutionRequest req;
  req.source_text = "def add(a, b):\n    return a + b\n";
  gradebox::TestCase tc;
  tc.id = "t1";
  tc.target_name = "add";
  tc.arguments = {json::Value(2), json::Value(3)};
  tc.expected_value = json::Value(5);
  req.test_cases.push_back(tc);

  const std::string d1 = gradebox::request_digest(req);
  expect(d1.size() == 64, "request digest must be 64 hex chars");
  expect(d1 == gradebox::request_digest(req), "request digest must be deterministic");

  req.time_limit_ms += 1;
  expect(gradebox::request_digest(req) != d1, "limits are part of the request digest");
  expect(gradebox::hash_domain("req:", "x") != gradebox::hash_domain("res:", "x"), "domains must separate");
}

void test_outcome_digest_ignores_durations() {
  gradebox::ExecutionResult a;
  a.ok = true;
  a.stdout_text = "5\n";
  gradebox::TestOutcome o;
  o.id = "t1";
  o.passed = true;
  o.received_value = json::Value(5);
  o.duration_ms = 1.25;
  a.outcomes.push_back(o);
  a.duration_ms = 10.0;

  gradebox::ExecutionResult b = a;
  b.outcomes[0].duration_ms = 99.0;
  b.duration_ms = 300.0;
  expect(gradebox::outcome_digest(a) == gradebox::outcome_digest(b), "durations excluded from outcome digest");

  b.outcomes[0].passed = false;
  expect(gradebox::outcome_digest(a) != gradebox::outcome_digest(b), "verdict is part of outcome digest");
}

void test_version_compatibility() {
  auto ok = gradebox::version::check_compatibility(gradebox::version::PROTOCOL_FRAMING_VERSION);
  expect(ok.ok, "own protocol version is compatible");
  auto bad = gradebox::version::check_compatibility(gradebox::version::PROTOCOL_FRAMING_VERSION + 1);
  expect(!bad.ok && !bad.error_code.empty(), "foreign protocol version is rejected with a code");

  auto manifest = gradebox::version::current_manifest("9.9.9");
  std::optional<json::JsonError> err;
  auto m = json::parse(gradebox::version::manifest_to_json(manifest), &err);
  expect(!err, "manifest JSON must parse");
  expect(json::get_string(m, "engine_semver") == "9.9.9", "manifest carries engine semver");
}

// ============================================================================
// Phase 2: Frame protocol
// ============================================================================

void test_frame_encoding() {
  const std::string frame = gradebox::protocol::encode_frame("{}");
  expect(frame.size() == 6, "frame = 4 header bytes + body");
  expect(frame[0] == 0 && frame[1] == 0 && frame[2] == 0 && frame[3] == 2, "length is big-endian");
  expect(frame.substr(4) == "{}", "body follows header");
}

void test_frame_decoder_split_feed() {
  const std::string stream = gradebox::protocol::encode_frame("{\"a\":1}") + gradebox::protocol::encode_frame("[]");
  gradebox::protocol::FrameDecoder d;
  for (char c : stream) d.feed(&c, 1);
  auto first = d.next();
  auto second = d.next();
  expect(first && *first == "{\"a\":1}", "first frame reassembled byte by byte");
  expect(second && *second == "[]", "second frame follows");
  expect(!d.next() && d.buffered() == 0, "no residue after both frames");
}

void test_frame_decoder_oversize_poisons() {
  const unsigned char header[4] = {0x7f, 0xff, 0xff, 0xff};
  gradebox::protocol::FrameDecoder d;
  d.feed(reinterpret_cast<const char*>(header), 4);
  expect(!d.next(), "oversize frame is never yielded");
  expect(d.poisoned(), "oversize header poisons the decoder");
  const std::string ok = gradebox::protocol::encode_frame("{}");
  d.feed(ok.data(), ok.size());
  expect(!d.next(), "poisoned decoder yields nothing further");
}

void test_message_roundtrip_over_pipe() {
  int fds[2];
  expect(::pipe(fds) == 0, "pipe");
  json::Object body;
  body["nonce"] = "abc";
  expect(gradebox::protocol::write_frame(fds[1], gradebox::protocol::encode_message("ping", 7, body)),
         "write_frame");

  std::string frame;
  auto st = gradebox::protocol::read_frame(fds[0], frame, std::chrono::steady_clock::now() + std::chrono::seconds(1));
  expect(st == gradebox::protocol::ReadStatus::ok, "read_frame ok");
  std::string err;
  auto msg = gradebox::protocol::decode_message(frame, &err);
  expect(msg && msg->type == "ping" && msg->id == 7, "type and id survive");
  expect(json::get_string(msg->body, "nonce") == "abc", "payload survives");

  st = gradebox::protocol::read_frame(fds[0], frame,
                                      std::chrono::steady_clock::now() + std::chrono::milliseconds(20));
  expect(st == gradebox::protocol::ReadStatus::timeout, "empty channel times out");

  ::close(fds[1]);
  st = gradebox::protocol::read_frame(fds[0], frame, std::nullopt);
  expect(st == gradebox::protocol::ReadStatus::closed, "closed writer reports closed");
  ::close(fds[0]);
}

void test_decode_message_requires_type() {
  std::string err;
  expect(!gradebox::protocol::decode_message("{\"id\":1}", &err), "frame without type rejected");
  expect(err.rfind("malformed frame", 0) == 0, "error names the malformed frame");
  expect(!gradebox::protocol::decode_message("not json", &err), "non-JSON frame rejected");
}

// ============================================================================
// Phase 3: Post-processing
// ============================================================================

std::string block(const std::string& payload) {
  return std::string("\n") + gradebox::kVizStartMarker + "\n" + payload + "\n" + gradebox::kVizEndMarker + "\n\n";
}

void test_last_payload_wins_and_is_stripped() {
  const std::string out = "before\n" +
                          block(R"({"diagramType":"array","structure":{"elements":[]}})") + "middle\n" +
                          block(R"({"diagramType":"tree","structure":{"nodes":[],"edges":[],"rootId":""}})") +
                          "after\n";
  gradebox::PostProcessInput in;
  in.stdout_text = out;
  auto pp = gradebox::postprocess(in, {});
  expect(pp.visualization.has_value(), "payload extracted");
  expect(pp.visualization->as_object().at("diagramType").as_string() == "tree", "last complete payload wins");
  expect(pp.visualization->as_object().at("structureKind").as_string() == "tree", "structureKind mirrors");
  expect(pp.stdout_text.find("VIZ_PAYLOAD") == std::string::npos, "markers stripped");
  expect(pp.stdout_text.find("before") != std::string::npos && pp.stdout_text.find("after") != std::string::npos,
         "surrounding output kept");
  expect(pp.exit_reason == gradebox::ExitReason::success, "clean run is success");
}

void test_invalid_payload_is_dropped() {
  gradebox::PostProcessInput in;
  in.stdout_text = block("{not json");
  auto pp = gradebox::postprocess(in, {});
  expect(!pp.visualization, "malformed payload yields no visualization");
  expect(pp.stdout_text.find("VIZ_PAYLOAD") == std::string::npos, "markers stripped anyway");

  auto legacy = gradebox::normalize_payload(R"({"nodes":[{"id":"a"}]})");
  expect(legacy && legacy->as_object().at("diagramType").as_string() == "graph", "bare nodes become a graph");
  expect(!gradebox::normalize_payload(R"({"diagramType":"array"})"), "diagram without structure rejected");
}

void test_unterminated_marker_left_alone() {
  const std::string out = std::string("x\n") + gradebox::kVizStartMarker + "\n{}";
  expect(!gradebox::last_payload_text(out), "unterminated region has no payload");
  expect(gradebox::strip_payload_regions(out) == out, "unterminated region is not stripped");
}

void test_stdout_truncation_boundary() {
  gradebox::PostProcessInput in;
  in.stdout_text = std::string(25000, 'x');
  auto pp = gradebox::postprocess(in, {});
  const std::string suffix = "\n... [truncated: 25000 total chars]";
  expect(pp.truncation.stdout_truncated, "stdout flagged truncated");
  expect(pp.stdout_text.size() == 20000 + suffix.size(), "exactly 20000 chars plus suffix");
  expect(pp.stdout_text.substr(20000) == suffix, "fixed suffix");
  expect(!pp.truncation.stderr_truncated, "stderr untouched");

  std::string exact(20000, 'y');
  expect(!gradebox::truncate_stream(exact, 20000), "at the limit nothing is cut");
}

void test_exit_classification_order() {
  using gradebox::ExitReason;
  std::vector<gradebox::TestOutcome> failing(1);
  expect(gradebox::classify_exit("SyntaxError", nullptr, true, true) == ExitReason::timeout, "timeout first");
  expect(gradebox::classify_exit("SyntaxError", nullptr, false, true) == ExitReason::memory_exceeded,
         "memory second");
  expect(gradebox::classify_exit("ImportError: Package policy violation: 'x' not allowed\nSyntaxError", nullptr,
                                 false, false) == ExitReason::policy_violation,
         "policy before compile");
  expect(gradebox::classify_exit("  File \"solution.py\"\nIndentationError: x", &failing, false, false) ==
             ExitReason::compile_error,
         "compile before test failure");
  expect(gradebox::classify_exit("", &failing, false, false) == ExitReason::test_failure, "failing case");
  expect(gradebox::classify_exit("Traceback (most recent call last):\nValueError", &failing, false, false) ==
             ExitReason::runtime_error,
         "traceback outranks failing case");
  expect(gradebox::classify_exit("warning only", nullptr, false, false) == ExitReason::success, "plain stderr");
}

void test_timeout_appends_notice() {
  gradebox::PostProcessInput in;
  in.timed_out = true;
  auto pp = gradebox::postprocess(in, {});
  expect(pp.stderr_text.find("Execution timed out") != std::string::npos, "timeout notice appended");
  expect(pp.exit_reason == gradebox::ExitReason::timeout, "timeout verdict");
}

void test_compile_error_frames_stripped() {
  const std::string err =
      "Traceback (most recent call last):\n"
      "  File \"/usr/lib/python3.11/ast.py\", line 50, in parse\n"
      "    return compile(source, filename, mode, flags,\n"
      "           ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^\n"
      "  File \"solution.py\", line 1\n"
      "    def f(:\n"
      "          ^\n"
      "SyntaxError: invalid syntax";
  const std::string out = gradebox::strip_runtime_frames(err, "/usr/lib/python3.11");
  expect(out.find("ast.py") == std::string::npos, "runtime frame dropped");
  expect(out.find("return compile") == std::string::npos, "runtime frame source dropped");
  expect(out.find("solution.py") != std::string::npos, "guest frame kept");
  expect(out.find("SyntaxError: invalid syntax") != std::string::npos, "message kept");
}

// ============================================================================
// Phase 4: Structure serializer
// ============================================================================

void test_serializer_linked_list() {
  GraphBuilder b;
  auto nodes = b.chain(3);
  b.graph.bind("head", nodes[0]);
  auto payload = serialize(b.graph);
  expect(payload.has_value(), "linked list recognized");
  const auto& p = payload->as_object();
  expect(p.at("diagramType").as_string() == "linked-list", "diagramType linked-list");
  const auto& s = obj_at(*payload, "structure");
  expect(arr_at(s, "nodes").size() == 3, "three nodes");
  expect(arr_at(s, "nextPointers").size() == 2, "two next pointers");
  expect(arr_at(s, "nodes")[0].as_object().at("label").as_string() == "1", "label is the node value");
  expect(!p.at("truncated").as_bool(), "small list not truncated");
}

void test_serializer_cycle_terminates_under_cap() {
  GraphBuilder b;
  auto nodes = b.chain(60);
  b.set_attr(nodes.back(), "next", nodes.front());
  b.graph.bind("head", nodes[0]);
  auto payload = serialize(b.graph);
  expect(payload.has_value(), "cyclic list still serialized");
  const auto& s = obj_at(*payload, "structure");
  expect(arr_at(s, "nodes").size() == gradebox::kDefaultMaxNodes, "node cap respected");
  expect(payload->as_object().at("truncated").as_bool(), "ring longer than the cap is truncated");

  GraphBuilder exact;
  auto fifty = exact.chain(static_cast<int>(gradebox::kDefaultMaxNodes));
  exact.set_attr(fifty.back(), "next", fifty.front());
  exact.graph.bind("head", fifty[0]);
  auto p50 = serialize(exact.graph);
  expect(arr_at(obj_at(*p50, "structure"), "nodes").size() == gradebox::kDefaultMaxNodes, "all 50 ring nodes");
  expect(!p50->as_object().at("truncated").as_bool(), "ring of exactly the cap is complete");

  GraphBuilder small;
  auto ring = small.chain(4);
  small.set_attr(ring.back(), "next", ring.front());
  small.graph.bind("head", ring[0]);
  auto p2 = serialize(small.graph);
  const auto& s2 = obj_at(*p2, "structure");
  expect(arr_at(s2, "nodes").size() == 4, "each ring node once");
  expect(arr_at(s2, "nextPointers").size() == 4, "back edge recorded");
  expect(!p2->as_object().at("truncated").as_bool(), "ring under cap not truncated");
}

void test_serializer_long_list_truncated() {
  GraphBuilder b;
  auto nodes = b.chain(60);
  b.graph.bind("head", nodes[0]);
  auto payload = serialize(b.graph);
  const auto& p = payload->as_object();
  expect(p.at("diagramType").as_string() == "linked-list", "diagramType linked-list");
  const auto& s = obj_at(*payload, "structure");
  expect(arr_at(s, "nodes").size() == gradebox::kDefaultMaxNodes, "first 50 nodes kept");
  expect(arr_at(s, "nextPointers").size() == gradebox::kDefaultMaxNodes - 1, "edges between kept nodes only");
  expect(p.at("truncated").as_bool(), "60-node list exceeds the cap");

  // A successor that the capture never recorded also counts as cut off.
  GraphBuilder partial;
  auto short_chain = partial.chain(3);
  partial.set_attr(short_chain.back(), "next", 999999);
  partial.graph.bind("head", short_chain[0]);
  auto p2 = serialize(partial.graph);
  expect(arr_at(obj_at(*p2, "structure"), "nodes").size() == 3, "captured nodes kept");
  expect(p2->as_object().at("truncated").as_bool(), "uncaptured successor sets truncated");
}

void test_serializer_truncates_on_refused_node() {
  GraphBuilder b;
  std::vector<gradebox::GuestId> items;
  for (int i = 0; i < 60; ++i) items.push_back(b.integer(i));
  b.graph.bind("min_heap", b.list(items));
  auto payload = serialize(b.graph);
  const auto& p = payload->as_object();
  expect(p.at("diagramType").as_string() == "heap", "heap-named list is a heap");
  expect(p.at("truncated").as_bool(), "refused additions set truncated");
  expect(arr_at(obj_at(*payload, "structure"), "nodes").size() == gradebox::kDefaultMaxNodes, "capped at 50");
}

void test_serializer_array() {
  GraphBuilder b;
  b.graph.bind("arr", b.list({b.integer(1), b.integer(2), b.integer(3)}));
  auto payload = serialize(b.graph);
  expect(payload && payload->as_object().at("diagramType").as_string() == "array", "array recognized");
  const auto& s = obj_at(*payload, "structure");
  expect(s.at("name").as_string() == "arr", "array name");
  expect(!s.at("is2D").as_bool(), "flat array");
  const auto& elements = arr_at(s, "elements");
  expect(elements.size() == 3, "three elements");
  for (std::size_t i = 0; i < elements.size(); ++i) {
    const auto& e = elements[i].as_object();
    expect(e.at("index").as_int() == static_cast<std::int64_t>(i), "ordered indices");
    expect(e.at("value").as_string() == std::to_string(i + 1), "ordered values");
  }
}

void test_serializer_2d_array() {
  GraphBuilder b;
  auto row1 = b.list({b.integer(1), b.integer(2)});
  auto row2 = b.list({b.integer(3), b.integer(4)});
  b.graph.bind("grid", b.list({row1, row2}));
  auto payload = serialize(b.graph);
  const auto& s = obj_at(*payload, "structure");
  expect(s.at("is2D").as_bool(), "list of lists is 2D");
  expect(arr_at(s, "rows").size() == 2, "two rows");
  expect(arr_at(arr_at(s, "rows")[1].as_object(), "elements")[0].as_object().at("value").as_string() == "3",
         "row elements in order");

  GraphBuilder empty_rows;
  empty_rows.graph.bind("grid", empty_rows.list({empty_rows.list({}), empty_rows.list({})}));
  auto p2 = serialize(empty_rows.graph);
  expect(!obj_at(*p2, "structure").at("is2D").as_bool(), "2D needs a truthy row");
}

void test_serializer_heap() {
  GraphBuilder b;
  b.graph.bind("max_heap", b.list({b.integer(9), b.integer(5), b.integer(7)}));
  auto payload = serialize(b.graph);
  const auto& s = obj_at(*payload, "structure");
  expect(s.at("heapType").as_string() == "max", "max in name gives max heap");
  expect(s.at("rootId").as_string() == "max_heap_0", "root is index 0");
  expect(arr_at(s, "edges").size() == 2, "children of the root");
  const auto& repr = arr_at(s, "arrayRepresentation");
  expect(repr.size() == 3 && repr[0].as_string() == "9", "array representation kept");
}

void test_serializer_graph() {
  GraphBuilder b;
  const auto a = b.text("A");
  const auto bb = b.text("B");
  b.graph.bind("adj", b.dict({{a, b.list({bb})}, {bb, b.list({})}}));
  auto payload = serialize(b.graph);
  expect(payload->as_object().at("diagramType").as_string() == "graph", "adjacency dict is a graph");
  const auto& s = obj_at(*payload, "structure");
  expect(arr_at(s, "nodes").size() == 2, "two vertices");
  const auto& edges = arr_at(s, "edges");
  expect(edges.size() == 1, "one edge");
  expect(edges[0].as_object().at("from").as_string() == "A" && edges[0].as_object().at("to").as_string() == "B",
         "edge A -> B");
}

void test_serializer_tree_and_priority() {
  GraphBuilder b;
  const auto root = b.object("TreeNode");
  const auto left = b.object("TreeNode");
  b.set_attr(root, "val", b.integer(2));
  b.set_attr(left, "val", b.integer(1));
  b.set_attr(root, "left", left);
  b.set_attr(root, "right", b.none());
  b.set_attr(left, "left", b.none());
  b.set_attr(left, "right", b.none());
  b.graph.bind("root", root);
  auto payload = serialize(b.graph);
  const auto& s = obj_at(*payload, "structure");
  expect(payload->as_object().at("diagramType").as_string() == "tree", "left/right is a tree");
  expect(s.at("rootId").as_string() == std::to_string(root), "root has no incoming edge");
  expect(arr_at(s, "edges").size() == 1, "None children not linked");

  // A node with next and val is a list even when it also has left.
  GraphBuilder c;
  auto nodes = c.chain(2);
  c.set_attr(nodes[0], "left", c.none());
  c.graph.bind("node", nodes[0]);
  auto p2 = serialize(c.graph);
  expect(p2->as_object().at("diagramType").as_string() == "linked-list", "linked list outranks tree");
}

void test_serializer_ignores_infrastructure() {
  GraphBuilder b;
  b.graph.bind("_private", b.list({b.integer(1)}));
  b.graph.bind("helper", b.callable("helper"));
  b.graph.bind("test_results", b.list({b.integer(1)}));
  gradebox::SnapshotOptions opts;
  opts.excluded_names = {"test_results"};
  gradebox::StructureSerializer s(b.graph, opts);
  expect(!s.build(), "nothing left to classify");
}

void test_markers() {
  GraphBuilder b;
  b.graph.bind("i", b.integer(3));
  b.graph.bind("j", b.boolean(true));
  b.graph.bind("visited", b.list({b.text("A"), b.text("B")}));
  b.graph.bind("has_cycle", b.boolean(true));
  auto markers = gradebox::detect_markers(b.graph);
  const auto& m = markers.as_object();
  expect(m.at("pointers").as_object().at("i").as_int() == 3, "int pointer recorded");
  expect(!m.at("pointers").as_object().count("j"), "bool is not a pointer");
  expect(arr_at(m, "visitedOrder").size() == 2, "visited order recorded");
  expect(m.at("cycleDetected").as_bool(), "cycle flag recorded");

  GraphBuilder quiet;
  quiet.graph.bind("cycle_found", quiet.boolean(false));
  quiet.graph.bind("find_cycle", quiet.callable("find_cycle"));
  expect(!gradebox::detect_markers(quiet.graph).as_object().count("cycleDetected"),
         "false flag and callables are not cycle markers");
}

void test_shorten_label() {
  expect(gradebox::shorten_label(std::string(50, 'a')).size() == 50, "50 chars kept");
  const std::string s = gradebox::shorten_label(std::string(60, 'a'));
  expect(s.size() == 50 && s.substr(47) == "...", "long label shortened to 47 + ...");
}

void test_clip_text() {
  expect(gradebox::clip_text("short", 10) == "short", "text within the limit unchanged");
  const std::string long_text = gradebox::clip_text(std::string(5000, 'x'), 1000);
  expect(long_text.size() == 1003 && long_text.substr(1000) == "...", "cut to the limit plus ...");
  // "\xC3\xA9" is one code point; a cut after byte 2 would split it.
  const std::string accented = gradebox::clip_text("ab\xC3\xA9cd", 3);
  expect(accented == "ab...", "never cuts inside a UTF-8 sequence");
}

// ============================================================================
// Phase 5: Invariant extraction
// ============================================================================

void test_invariants_linked_list_cycle() {
  GraphBuilder b;
  auto nodes = b.chain(3);
  b.set_attr(nodes[2], "next", nodes[1]);
  const auto list = b.object("LinkedList");
  b.set_attr(list, "head", nodes[0]);
  b.set_attr(list, "tail", nodes[2]);
  b.set_attr(list, "size", b.integer(3));
  auto s = gradebox::extract_invariants(b.graph, *b.graph.find(list));
  expect(s && s->kind == gradebox::InvariantKind::linked_list, "linked list detected");
  expect(s->cycle_detected, "cycle detected");
  expect(s->reachable_nodes == 3, "each node counted once");
  expect(s->stored_size && *s->stored_size == 3, "stored size read");
  expect(s->tail_next_is_null && !*s->tail_next_is_null, "tail.next is not None");

  auto j = gradebox::invariants_to_json(*s);
  expect(j.as_object().at("type").as_string() == "linked-list", "type text");
  expect(!j.as_object().count("capacity"), "capacity omitted for linked lists");
}

void test_invariants_traversal_cap() {
  GraphBuilder b;
  auto nodes = b.chain(250);
  const auto list = b.object("LinkedList");
  b.set_attr(list, "head", nodes[0]);
  b.set_attr(list, "tail", nodes.back());
  auto s = gradebox::extract_invariants(b.graph, *b.graph.find(list));
  expect(s->reachable_nodes == gradebox::kMaxTraversalHops, "traversal capped");
  expect(!s->cycle_detected, "long chain is not a cycle");
  expect(s->tail_next_is_null && *s->tail_next_is_null, "tail.next is None");
  expect(s->tail_is_last_reachable && !*s->tail_is_last_reachable, "tail beyond cap is not last reached");
}

void test_invariants_array_list() {
  GraphBuilder b;
  const auto arr = b.object("ArrayList");
  b.set_attr(arr, "_data", b.list({b.text("a"), b.text("b"), b.none(), b.none()}));
  b.set_attr(arr, "_size", b.integer(2));
  auto s = gradebox::extract_invariants(b.graph, *b.graph.find(arr));
  expect(s && s->kind == gradebox::InvariantKind::array_list, "array list detected");
  expect(s->capacity && *s->capacity == 4, "capacity is the backing length");
  expect(s->size_in_range && *s->size_in_range, "size within capacity");
  expect(s->buffer_preview && (*s->buffer_preview)[2] == "None", "preview of the backing store");
}

void test_invariants_ring_buffer() {
  GraphBuilder b;
  const auto q = b.object("CircularQueue");
  b.set_attr(q, "_buffer", b.list({b.none(), b.integer(4), b.integer(5), b.none()}));
  b.set_attr(q, "_head", b.integer(1));
  b.set_attr(q, "_tail", b.integer(3));
  b.set_attr(q, "_size", b.integer(2));
  auto s = gradebox::extract_invariants(b.graph, *b.graph.find(q));
  expect(s && s->kind == gradebox::InvariantKind::ring_buffer, "ring buffer detected");
  expect(s->indices_in_range && *s->indices_in_range, "indices in range");
  expect(gradebox::invariants_to_json(*s).as_object().at("type").as_string() == "circular-queue", "type text");

  b.set_attr(q, "_head", b.integer(7));
  s = gradebox::extract_invariants(b.graph, *b.graph.find(q));
  expect(s->indices_in_range && !*s->indices_in_range, "head past capacity is out of range");

  // size() as a method resolves through its recorded call result.
  const auto size_fn = b.callable("size");
  b.set_attr(q, "_size", size_fn, b.integer(9));
  s = gradebox::extract_invariants(b.graph, *b.graph.find(q));
  expect(s->stored_size && *s->stored_size == 9, "callable size resolved");
  expect(s->size_in_range && !*s->size_in_range, "size above capacity out of range");
}

void test_snapshot_carries_invariants() {
  GraphBuilder b;
  auto nodes = b.chain(2);
  const auto list = b.object("LinkedList");
  b.set_attr(list, "head", nodes[0]);
  b.set_attr(list, "tail", nodes[1]);
  b.graph.bind("ll", list);
  b.graph.set_subject(list);
  auto payload = serialize(b.graph);
  const auto& p = payload->as_object();
  expect(p.at("diagramType").as_string() == "linked-list", "instance kind drives diagramType");
  expect(p.count("stateSnapshot"), "state snapshot attached");
  expect(obj_at(*payload, "stateSnapshot").at("reachableNodes").as_int() == 2, "two reachable nodes");
}

// ============================================================================
// Phase 6: Policy, config, requests
// ============================================================================

void test_policy_allow_list() {
  expect(!gradebox::find_policy_violation("import math\nfrom collections import deque\n"), "stdlib allowed");
  auto v = gradebox::find_policy_violation("x = 1\nimport numpy as np\n");
  expect(v && v->module == "numpy" && v->line == 2, "numpy rejected on line 2");
  expect(gradebox::policy_violation_message(*v) == "Package policy violation: 'numpy' not allowed", "message");

  v = gradebox::find_policy_violation("import os, requests\n");
  expect(v && v->module == "requests", "every name of a multi-import checked");
  v = gradebox::find_policy_violation("from requests.adapters import HTTPAdapter\n");
  expect(v && v->module == "requests", "root package of from-import checked");
  v = gradebox::find_policy_violation("    import torch\n");
  expect(v && v->module == "torch", "indented imports checked");
  expect(!gradebox::find_policy_violation("# import numpy\n\"\"\"import numpy\n"), "comments skipped");
  v = gradebox::find_policy_violation("from . import sibling\n");
  expect(v && v->module.empty(), "relative import rejected");
}

void test_config_validation() {
  auto ok = gradebox::validate_config(R"({"time_limit_ms":500,"image":"/opt/py"})");
  expect(ok.ok && ok.errors.empty(), "valid config accepted");

  auto bad = gradebox::validate_config(R"({"time_limit_ms":"fast","mem_limit_mb":0,"colour":1})");
  expect(!bad.ok, "invalid config rejected");
  expect(bad.errors.size() == 2, "type and range errors reported");
  expect(bad.warnings.size() == 1 && bad.warnings[0].find("colour") != std::string::npos, "unknown key warns");

  auto broken = gradebox::validate_config("{");
  expect(!broken.ok && !broken.errors.empty(), "parse error reported");

  std::optional<json::JsonError> err;
  auto cfg = gradebox::EngineConfig::from_json(json::parse(R"({"kill_grace_ms":250,"max_stdout":10})", &err));
  expect(cfg.kill_grace_ms == 250 && cfg.max_stdout == 10, "from_json applies values");
  expect(cfg.time_limit_ms == 2000, "missing keys keep defaults");
}

void test_legacy_test_case_shape() {
  std::optional<json::JsonError> err;
  auto design = json::parse_value(
      R"({"id":3,"fn":"__design__","args":[["Queue","push","pop"],[[],[5],[]]],"expected":[null,null,5]})", &err);
  auto tc = gradebox::test_case_from_json(design);
  expect(tc.entry_kind == gradebox::EntryKind::operation_sequence, "__design__ is an operation sequence");
  expect(tc.id == "3", "numeric id becomes text");
  expect(tc.metadata_error.empty(), "well-formed case has no metadata error");

  auto method = json::parse_value(R"({"id":"m","fn":"push","className":"Stack","args":[1]})", &err);
  tc = gradebox::test_case_from_json(method);
  expect(tc.entry_kind == gradebox::EntryKind::instance_method, "className gives an instance method");
  expect(!tc.expected_value, "missing expected stays absent");

  auto missing = json::parse_value(R"({"id":"x","args":[]})", &err);
  tc = gradebox::test_case_from_json(missing);
  expect(tc.id == "x", "malformed case keeps its id");
  expect(tc.metadata_error == "Test metadata missing fn", "missing fn recorded on the case");

  // The recorded problem survives the trip to the worker.
  auto wire = gradebox::test_case_from_json(gradebox::test_case_to_json(tc));
  expect(wire.metadata_error == "Test metadata missing fn", "metadata error carried over the wire");

  tc = gradebox::test_case_from_json(json::Value("not a case"));
  expect(tc.metadata_error == "test case must be an object", "non-object case recorded");
  tc = gradebox::test_case_from_json(json::parse_value(R"({"id":"k","entryKind":"lambda"})", &err));
  expect(tc.metadata_error == "unknown entryKind: lambda", "unknown entry kind recorded");
}

void test_request_parsing_and_validation() {
  gradebox::ExecutionLimits defaults;
  defaults.time_limit_ms = 1500;
  std::string err;
  auto req = gradebox::parse_request_json(
      R"j({"code":"print(1)","testCases":[{"id":"a","entryKind":"plain-function","targetName":"f"}],"memLimitMb":64})j",
      defaults, &err);
  expect(err.empty(), "request parses");
  expect(req.source_text == "print(1)", "code alias accepted");
  expect(req.test_cases.size() == 1 && req.test_cases[0].target_name == "f", "testCases alias accepted");
  expect(req.time_limit_ms == 1500 && req.mem_limit_mb == 64, "limits default and override");
  expect(gradebox::validate_request(req).empty(), "valid request passes validation");

  req.time_limit_ms = 0;
  expect(!gradebox::validate_request(req).empty(), "zero time limit rejected");

  err.clear();
  auto mixed = gradebox::parse_request_json(
      R"({"source":"x","tests":[{"id":"bad","args":[]},{"id":"good","fn":"f","args":[]}]})", defaults, &err);
  expect(err.empty(), "one malformed case does not reject the request");
  expect(mixed.test_cases.size() == 2, "both cases kept");
  expect(mixed.test_cases[0].metadata_error == "Test metadata missing fn", "malformed case flagged");
  expect(mixed.test_cases[1].metadata_error.empty(), "good case untouched");
  expect(gradebox::validate_request(mixed).empty(), "request with a malformed case is dispatchable");

  gradebox::parse_request_json(R"({"source":"x","tests":{}})", defaults, &err);
  expect(!err.empty(), "non-array tests rejected");
}

void test_result_json_exit_code() {
  gradebox::ExecutionResult r;
  r.ok = true;
  r.exit_reason = gradebox::ExitReason::timeout;
  auto doc = gradebox::result_to_json_value(r);
  expect(doc.as_object().at("exitReason").as_string() == "TIMEOUT", "exit reason text");
  expect(doc.as_object().at("exitCode") == json::Value(124), "timeout maps to 124");
  r.exit_reason = gradebox::ExitReason::test_failure;
  expect(gradebox::result_to_json_value(r).as_object().at("exitCode") == json::Value(1), "other verdicts map to 1");
}

void test_invalid_request_never_spawns() {
  gradebox::EngineConfig cfg;
  cfg.worker_path = "/nonexistent/gradebox_worker";
  gradebox::Engine engine(cfg);
  gradebox::ExecutionRequest req;
  req.source_text = "print(1)";
  req.mem_limit_mb = 0;
  const auto spawns = gradebox::global_engine_stats().worker_spawns.load();
  auto res = engine.execute(req);
  expect(!res.ok && res.error_code == gradebox::ErrorCode::invalid_request, "invalid_request reported");
  expect(res.request_digest.size() == 64, "digest attached to rejected requests");
  expect(gradebox::global_engine_stats().worker_spawns.load() == spawns, "no worker spawned");
}

void test_missing_worker_is_init_failure() {
  gradebox::EngineConfig cfg;
  cfg.worker_path = "/nonexistent/gradebox_worker";
  gradebox::Engine engine(cfg);
  auto init = engine.initialize();
  expect(!init.ok && init.error_code == gradebox::ErrorCode::init_failed, "missing worker fails init");
  gradebox::ExecutionRequest req;
  req.source_text = "print(1)";
  auto res = engine.execute(req);
  expect(!res.ok && res.error_code == gradebox::ErrorCode::init_failed, "init failure is permanent");
  expect(!engine.ping("x"), "ping fails without a worker");
}

// ============================================================================
// Phase 7: Governor and interrupt cell
// ============================================================================

void test_interrupt_cell_first_reason_wins() {
  auto cell = gradebox::InterruptCell::create();
  expect(cell.load() == gradebox::InterruptReason::none, "fresh cell is clear");
  expect(cell.set(gradebox::InterruptReason::memory), "first set wins");
  expect(!cell.set(gradebox::InterruptReason::timeout), "second set ignored");
  expect(cell.load() == gradebox::InterruptReason::memory, "first reason kept");
  cell.reset();
  expect(cell.load() == gradebox::InterruptReason::none, "reset clears");
}

void test_governor_deadline() {
  auto cell = gradebox::InterruptCell::create();
  gradebox::GovernorLimits limits;
  limits.time_limit_ms = 30;
  limits.sample_interval_ms = 5;
  gradebox::Governor gov(cell, limits, [] { return std::uint64_t{1000}; });
  gov.arm();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  gov.disarm();
  expect(gov.timed_out(), "deadline fired");
  expect(!gov.memory_exceeded(), "flat RSS is not a memory breach");
  expect(cell.load() == gradebox::InterruptReason::timeout, "cell carries timeout");
}

void test_governor_memory_limit() {
  auto cell = gradebox::InterruptCell::create();
  std::atomic<std::uint64_t> rss{100ull * 1024 * 1024};
  gradebox::GovernorLimits limits;
  limits.time_limit_ms = 5000;
  limits.mem_limit_bytes = 110ull * 1024 * 1024;
  limits.sample_interval_ms = 5;
  gradebox::Governor gov(cell, limits, [&] { return rss.load(); });
  gov.arm();
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  expect(!gov.memory_exceeded(), "resident set under the limit");
  rss = 115ull * 1024 * 1024;
  for (int i = 0; i < 200 && !gov.memory_exceeded(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  gov.disarm();
  expect(gov.memory_exceeded(), "resident set over the limit detected");
  expect(!gov.timed_out(), "deadline not reached");
  expect(cell.load() == gradebox::InterruptReason::memory, "cell carries memory");
  expect(gov.peak_rss() == 115ull * 1024 * 1024, "peak recorded");
}

void test_governor_charges_retained_memory() {
  // The worker already holds more than the limit before the run allocates.
  auto cell = gradebox::InterruptCell::create();
  gradebox::GovernorLimits limits;
  limits.time_limit_ms = 5000;
  limits.mem_limit_bytes = 64ull * 1024 * 1024;
  limits.sample_interval_ms = 5;
  gradebox::Governor gov(cell, limits, [] { return std::uint64_t{80ull * 1024 * 1024}; });
  gov.arm();
  for (int i = 0; i < 200 && !gov.memory_exceeded(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  gov.disarm();
  expect(gov.memory_exceeded(), "memory kept from earlier runs is charged");
  expect(cell.load() == gradebox::InterruptReason::memory, "cell carries memory");
}

void test_governor_disarm_early() {
  auto cell = gradebox::InterruptCell::create();
  gradebox::GovernorLimits limits;
  limits.time_limit_ms = 10000;
  gradebox::Governor gov(cell, limits, nullptr);
  gov.arm();
  const auto start = std::chrono::steady_clock::now();
  gov.disarm();
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(1), "disarm does not wait out the deadline");
  expect(cell.load() == gradebox::InterruptReason::none, "nothing fired");
}

// ============================================================================
// Phase 8: Observability
// ============================================================================

gradebox::ExecutionEvent g_last_event;
std::atomic<int> g_events{0};

void capture_event(const gradebox::ExecutionEvent& ev) {
  g_last_event = ev;
  g_events.fetch_add(1);
}

void test_event_per_execute() {
  gradebox::set_execution_event_hook(capture_event);
  const int before = g_events.load();
  gradebox::EngineConfig cfg;
  cfg.worker_path = "/nonexistent/gradebox_worker";
  gradebox::Engine engine(cfg);
  gradebox::ExecutionRequest req;
  req.source_text = "print(1)";
  req.time_limit_ms = 0;
  auto res = engine.execute(req);
  gradebox::set_execution_event_hook(nullptr);
  expect(g_events.load() == before + 1, "exactly one event");
  expect(g_last_event.execution_id == res.request_digest, "event id is the request digest");
  expect(!g_last_event.ok && g_last_event.error_code == "invalid_request", "event carries the host error");
  expect(g_last_event.bytes_in == req.source_text.size(), "event carries sizes, not content");
  const auto recent = gradebox::global_engine_stats().recent_events_snapshot();
  expect(!recent.empty() && recent.back().execution_id == res.request_digest, "newest event last in the ring");
}

void test_recent_events_ring_order() {
  gradebox::EngineStats stats;
  const std::size_t total = gradebox::EngineStats::kMaxRecentEvents + 3;
  for (std::size_t i = 0; i < total; ++i) {
    gradebox::ExecutionEvent ev;
    ev.execution_id = std::to_string(i);
    stats.record_execution(ev);
  }
  const auto recent = stats.recent_events_snapshot();
  expect(recent.size() == gradebox::EngineStats::kMaxRecentEvents, "ring holds a fixed number of events");
  expect(recent.front().execution_id == "3", "oldest surviving event first");
  expect(recent.back().execution_id == std::to_string(total - 1), "newest event last");

  std::optional<json::JsonError> err;
  auto doc = json::parse(stats.to_json(), &err);
  expect(!err, "stats JSON parses");
  const json::Value* events = json::find(doc, "recent_events");
  expect(events && events->is_array() && events->as_array().size() == recent.size(), "health lists recent events");
}

void test_stats_json() {
  std::optional<json::JsonError> err;
  auto stats = json::parse(gradebox::global_engine_stats().to_json(), &err);
  expect(!err, "stats JSON must parse");
  expect(json::find(stats, "total_executions") != nullptr, "total_executions present");
}

// ============================================================================
// Phase 9: Worker-backed execution
// ============================================================================

std::string worker_path() {
  if (const char* env = std::getenv("GRADEBOX_TEST_WORKER_PATH")) return env;
#ifdef GRADEBOX_TEST_WORKER_PATH
  return GRADEBOX_TEST_WORKER_PATH;
#else
  return gradebox::default_worker_path();
#endif
}

gradebox::EngineConfig worker_config() {
  gradebox::EngineConfig cfg;
  cfg.worker_path = worker_path();
  cfg.kill_grace_ms = 500;
  return cfg;
}

gradebox::TestCase plain(const std::string& id, const std::string& fn, json::Array args,
                         std::optional<json::Value> expected) {
  gradebox::TestCase tc;
  tc.id = id;
  tc.entry_kind = gradebox::EntryKind::plain_function;
  tc.target_name = fn;
  tc.arguments = std::move(args);
  tc.expected_value = std::move(expected);
  return tc;
}

gradebox::ExecutionRequest request(const std::string& source, std::vector<gradebox::TestCase> tests = {},
                                   std::uint64_t time_limit_ms = 2000) {
  gradebox::ExecutionRequest req;
  req.source_text = source;
  req.test_cases = std::move(tests);
  req.time_limit_ms = time_limit_ms;
  return req;
}

void test_worker_plain_function() {
  gradebox::Engine engine(worker_config());
  auto init = engine.initialize();
  expect(init.ok, "worker initializes: " + init.message);
  expect(!init.runtime_version.empty(), "runtime version reported");

  auto res = engine.execute(request("def add(a, b):\n    return a + b\n",
                                    {plain("t1", "add", {json::Value(2), json::Value(3)}, json::Value(5))}));
  expect(res.ok, "execution ok: " + res.error_message);
  expect(res.outcomes.size() == 1 && res.outcomes[0].passed, "add(2, 3) == 5");
  expect(res.outcomes[0].received_value && *res.outcomes[0].received_value == json::Value(5), "received 5");
  expect(res.exit_reason == gradebox::ExitReason::success, "success verdict");
  expect(!res.visualization, "no snapshot when everything passes");
}

void test_worker_runtime_error_without_tests() {
  gradebox::Engine engine(worker_config());
  auto res = engine.execute(request("arr = [1]\nprint(arr[5])\n"));
  expect(res.ok, "execution ok");
  expect(res.exit_reason == gradebox::ExitReason::runtime_error, "runtime error verdict");
  expect(res.stderr_text.find("IndexError") != std::string::npos, "error name on stderr");
  expect(res.outcomes.empty(), "no test cases, no outcomes");
}

void test_worker_operation_sequence() {
  gradebox::Engine engine(worker_config());
  const std::string source =
      "class Queue:\n"
      "    def __init__(self):\n"
      "        self.items = []\n"
      "    def push(self, x):\n"
      "        self.items.append(x)\n"
      "    def pop(self):\n"
      "        return self.items.pop(0)\n";
  gradebox::TestCase tc;
  tc.id = "seq";
  tc.entry_kind = gradebox::EntryKind::operation_sequence;
  tc.target_name = "__design__";
  tc.arguments = {json::Array{"Queue", "push", "pop"}, json::Array{json::Array{}, json::Array{5}, json::Array{}}};
  tc.expected_value = json::Array{nullptr, nullptr, 5};
  auto res = engine.execute(request(source, {tc}));
  expect(res.ok && res.outcomes.size() == 1, "one outcome");
  expect(res.outcomes[0].passed, "push returns None, pop returns 5");

  tc.expected_value = json::Array{nullptr, nullptr, 6};
  res = engine.execute(request(source, {tc}));
  expect(!res.outcomes[0].passed, "wrong expectation fails");
  expect(res.exit_reason == gradebox::ExitReason::test_failure, "test failure verdict");
}

void test_worker_missing_targets() {
  gradebox::Engine engine(worker_config());
  gradebox::TestCase method;
  method.id = "m";
  method.entry_kind = gradebox::EntryKind::instance_method;
  method.class_name = "Stack";
  method.target_name = "push";
  auto res = engine.execute(request("x = 1\n", {plain("f", "solve", {}, json::Value(1)), method}));
  expect(res.ok && res.outcomes.size() == 2, "two outcomes");
  expect(res.outcomes[0].error_text && *res.outcomes[0].error_text == "Function solve not found", "missing function");
  expect(res.outcomes[1].error_text && *res.outcomes[1].error_text == "Class Stack not found", "missing class");
}

void test_worker_timeout() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  const auto start = std::chrono::steady_clock::now();
  auto res = engine.execute(request("while True:\n    pass\n", {plain("t", "f", {}, std::nullopt)}, 1));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(res.ok, "timeout is an ordinary result");
  expect(res.exit_reason == gradebox::ExitReason::timeout && res.timed_out, "timeout verdict");
  expect(res.outcomes.size() == 1 && !res.outcomes[0].passed, "pending case fails");
  expect(elapsed < std::chrono::seconds(3), "overshoot bounded by the kill grace");

  auto again = engine.execute(request("print('ok')\n"));
  expect(again.ok && again.exit_reason == gradebox::ExitReason::success, "worker usable after a timeout");
}

void test_worker_hard_kill() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  const auto kills = gradebox::global_engine_stats().worker_kills.load();
  auto res = engine.execute(
      request("import time\ntime.sleep(30)\n", {plain("t", "f", {}, std::nullopt)}, 100));
  expect(res.ok && res.timed_out, "stuck guest times out");
  expect(res.outcomes.size() == 1 && res.outcomes[0].error_text &&
             *res.outcomes[0].error_text == "Execution timed out",
         "synthesized outcome");
  expect(gradebox::global_engine_stats().worker_kills.load() == kills + 1, "worker killed");

  auto next = engine.execute(request("print(1)\n"));
  expect(next.ok && next.worker_restarted, "next call respawns the worker");
  expect(next.stdout_text == "1\n", "respawned worker runs");
}

void test_worker_memory_limit() {
  gradebox::Engine engine(worker_config());
  gradebox::ExecutionRequest req = request(
      "import time\nchunks = []\nwhile True:\n    chunks.append(bytearray(1024 * 1024))\n    time.sleep(0.002)\n",
      {}, 20000);
  req.mem_limit_mb = 32;
  auto res = engine.execute(req);
  expect(res.ok, "memory breach is an ordinary result");
  expect(res.memory_exceeded && res.exit_reason == gradebox::ExitReason::memory_exceeded, "memory verdict");
  expect(res.stderr_text.find("Memory limit exceeded") != std::string::npos, "memory notice");
}

void test_worker_policy_violation() {
  gradebox::Engine engine(worker_config());
  auto res = engine.execute(request("import numpy\nprint('never')\n", {plain("t", "f", {}, json::Value(1))}));
  expect(res.ok, "execution ok");
  expect(res.exit_reason == gradebox::ExitReason::policy_violation, "policy verdict");
  expect(res.stderr_text.find("Package policy violation: 'numpy' not allowed") != std::string::npos,
         "violation on stderr");
  expect(res.stdout_text.find("never") == std::string::npos, "nothing executed");
  expect(res.outcomes.size() == 1 && !res.outcomes[0].passed, "cases fail with the violation");
}

void test_worker_compile_error() {
  gradebox::Engine engine(worker_config());
  auto res = engine.execute(request("def f(:\n    pass\n"));
  expect(res.ok, "execution ok");
  expect(res.exit_reason == gradebox::ExitReason::compile_error, "compile verdict");
  expect(res.stderr_text.find("SyntaxError") != std::string::npos, "SyntaxError reported");
}

void test_worker_empty_tests_success() {
  gradebox::Engine engine(worker_config());
  auto res = engine.execute(request("print('hi')\n"));
  expect(res.ok && res.exit_reason == gradebox::ExitReason::success, "success");
  expect(res.outcomes.empty(), "no outcomes");
  expect(res.stdout_text == "hi\n", "stdout captured");
}

void test_worker_failure_snapshot() {
  gradebox::Engine engine(worker_config());
  const std::string source =
      "class Node:\n"
      "    def __init__(self, val, next=None):\n"
      "        self.val = val\n"
      "        self.next = next\n"
      "head = Node(1, Node(2, Node(3)))\n"
      "def length(h):\n"
      "    return 0\n";
  auto res = engine.execute(request(source, {plain("len", "length", {}, json::Value(3))}));
  expect(res.ok, "execution ok");
  expect(!res.outcomes.empty() && !res.outcomes[0].passed, "length() is wrong");
  expect(res.visualization.has_value(), "failure dumps a snapshot");
  expect(res.visualization->as_object().at("diagramType").as_string() == "linked-list", "list recognized");
  expect(arr_at(obj_at(*res.visualization, "structure"), "nodes").size() == 3, "three nodes");
  expect(res.stdout_text.find("VIZ_PAYLOAD") == std::string::npos, "markers not shown to the caller");
}

void test_worker_user_tests() {
  gradebox::Engine engine(worker_config());
  const std::string source =
      "def ok():\n    assert 1 == 1\n"
      "def bad():\n    assert 1 == 2, 'nope'\n"
      "def boom():\n    raise ValueError('x')\n"
      "USER_TESTS = [ok, bad, boom]\n";
  auto res = engine.execute(request(source));
  expect(res.ok && res.user_tests.size() == 3, "three user tests");
  expect(res.user_tests[0].status == "pass", "ok passes");
  expect(res.user_tests[1].status == "fail" && res.user_tests[1].error_text == std::optional<std::string>("nope"),
         "assertion fails");
  expect(res.user_tests[2].status == "error", "other exceptions error");
}

void test_worker_idempotence() {
  const auto req = request("def sq(x):\n    print(x)\n    return x * x\n",
                           {plain("a", "sq", {json::Value(4)}, json::Value(16)),
                            plain("b", "sq", {json::Value(3)}, json::Value(10))});
  gradebox::Engine first(worker_config());
  gradebox::Engine second(worker_config());
  auto r1 = first.execute(req);
  auto r2 = second.execute(req);
  expect(r1.ok && r2.ok, "both ok");
  expect(r1.outcomes.size() == 2 && r1.outcomes[0].passed && !r1.outcomes[1].passed, "verdicts");
  expect(r1.request_digest == r2.request_digest, "same execution id");
  r1.visualization.reset();
  r2.visualization.reset();
  expect(gradebox::outcome_digest(r1) == gradebox::outcome_digest(r2), "outcomes equal up to durations");
}

void test_worker_state_isolated_between_runs() {
  gradebox::Engine engine(worker_config());
  auto a = engine.execute(request("leak = 42\n"));
  auto b = engine.execute(request("print('leak' in globals())\n"));
  expect(a.ok && b.ok, "both ok");
  expect(b.stdout_text == "False\n", "fresh namespace per run");
}

void test_worker_busy_and_ping() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  expect(engine.ping("n1"), "idle worker answers ping");

  gradebox::ExecutionResult slow;
  std::thread t([&] { slow = engine.execute(request("import time\ntime.sleep(0.8)\n", {}, 5000)); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  auto busy = engine.execute(request("print(1)\n"));
  expect(!engine.ping("n2"), "ping refused while busy");
  t.join();
  expect(!busy.ok && busy.error_code == gradebox::ErrorCode::worker_busy, "concurrent call fails fast");
  expect(slow.ok && slow.exit_reason == gradebox::ExitReason::success, "in-flight call unaffected");
}

void test_worker_terminate() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  expect(engine.supervisor().worker_alive(), "worker alive");
  engine.terminate();
  expect(!engine.supervisor().worker_alive(), "worker gone");
  auto res = engine.execute(request("print(1)\n"));
  expect(!res.ok && res.error_code == gradebox::ErrorCode::terminated, "terminated supervisor refuses work");
}

void test_worker_terminate_in_flight() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  gradebox::ExecutionResult res;
  std::thread t([&] { res = engine.execute(request("import time\ntime.sleep(2)\n", {}, 5000)); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  const auto start = std::chrono::steady_clock::now();
  engine.terminate();
  t.join();
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(1), "in-flight call returns promptly");
  expect(!res.ok && res.error_code == gradebox::ErrorCode::terminated, "in-flight call reports termination");
  expect(!engine.supervisor().worker_alive(), "worker gone");
}

void test_worker_concurrent_initialize() {
  gradebox::Engine engine(worker_config());
  const auto spawns = gradebox::global_engine_stats().worker_spawns.load();
  gradebox::InitStatus a;
  gradebox::InitStatus b;
  std::thread t1([&] { a = engine.initialize(); });
  std::thread t2([&] { b = engine.initialize(); });
  t1.join();
  t2.join();
  expect(a.ok && b.ok, "both callers see a ready worker");
  expect(a.runtime_version == b.runtime_version, "same worker reported to both");
  expect(gradebox::global_engine_stats().worker_spawns.load() == spawns + 1, "exactly one worker spawned");
}

void test_worker_ping_timeout_replaces_worker() {
  gradebox::Engine engine(worker_config());
  expect(engine.initialize().ok, "worker initializes");
  const pid_t stuck = engine.supervisor().worker_pid();
  expect(stuck > 0 && ::kill(stuck, SIGSTOP) == 0, "worker stopped");
  const auto kills = gradebox::global_engine_stats().worker_kills.load();
  expect(!engine.supervisor().ping("late", 200), "stopped worker misses the ping");
  expect(gradebox::global_engine_stats().worker_kills.load() == kills + 1, "unresponsive worker killed");
  expect(!engine.supervisor().worker_alive(), "no worker until the next call");

  expect(engine.ping("again"), "next ping runs on a fresh worker");
  expect(engine.supervisor().worker_pid() != stuck, "worker replaced");
  auto res = engine.execute(request("print(1)\n"));
  expect(res.ok && res.stdout_text == "1\n", "replacement worker runs code");
}

void test_worker_sequence_missing_method() {
  gradebox::Engine engine(worker_config());
  gradebox::TestCase tc;
  tc.id = "seq";
  tc.entry_kind = gradebox::EntryKind::operation_sequence;
  tc.target_name = "__design__";
  tc.arguments = {json::Array{"Counter", "nope"}, json::Array{json::Array{}, json::Array{}}};
  tc.expected_value = json::Array{nullptr, nullptr};
  auto res = engine.execute(request("class Counter:\n    pass\n", {tc}));
  expect(res.ok && res.outcomes.size() == 1, "one outcome");
  expect(!res.outcomes[0].passed, "case fails");
  expect(res.outcomes[0].error_text && *res.outcomes[0].error_text == "Method nope missing", "missing method named");
}

void test_worker_cyclic_return_value() {
  gradebox::Engine engine(worker_config());
  const std::string source =
      "def f():\n"
      "    a = []\n"
      "    a.append(a)\n"
      "    a.append(a)\n"
      "    return a\n"
      "def g():\n"
      "    return 7\n";
  auto res = engine.execute(
      request(source, {plain("cyc", "f", {}, json::Value(nullptr)), plain("next", "g", {}, json::Value(7))}));
  expect(res.ok && !res.timed_out, "self-referencing result does not hang");
  expect(res.outcomes.size() == 2, "both cases reported");
  expect(!res.outcomes[0].passed, "cyclic result compared and failed");
  const auto& received = res.outcomes[0].received_value;
  expect(received && received->is_array() && received->as_array().size() == 2, "outer list encoded");
  expect(received->as_array()[0] == json::Value("[...]"), "back-reference encoded as a marker");
  expect(res.outcomes[1].passed, "following case still runs");
  expect(res.exit_reason == gradebox::ExitReason::test_failure, "test failure verdict");
}

void test_worker_malformed_case_fails_alone() {
  gradebox::Engine engine(worker_config());
  gradebox::TestCase bad;
  bad.id = "bad";
  bad.metadata_error = "Test metadata missing fn";
  gradebox::TestCase nameless = plain("nameless", "", {}, json::Value(1));
  auto res = engine.execute(request("def one():\n    return 1\n",
                                    {bad, nameless, plain("good", "one", {}, json::Value(1))}));
  expect(res.ok && res.outcomes.size() == 3, "every case reported");
  expect(res.outcomes[0].error_text && *res.outcomes[0].error_text == "Test metadata missing fn",
         "description error reported on its case");
  expect(res.outcomes[1].error_text && *res.outcomes[1].error_text == "test case is missing its target name",
         "nameless case fails");
  expect(res.outcomes[2].passed, "well-formed case still passes");
}

void test_worker_long_text_clipped_in_snapshot() {
  gradebox::Engine engine(worker_config());
  const std::string source =
      "class Node:\n"
      "    def __init__(self, val, next=None):\n"
      "        self.val = val\n"
      "        self.next = next\n"
      "head = Node('x' * 100000, Node(2))\n"
      "def length(h):\n"
      "    return 0\n";
  auto res = engine.execute(request(source, {plain("len", "length", {}, json::Value(2))}));
  expect(res.ok && res.visualization.has_value(), "failure dumps a snapshot");
  const auto& nodes = arr_at(obj_at(*res.visualization, "structure"), "nodes");
  expect(nodes.size() == 2, "two nodes");
  const std::string& label = nodes[0].as_object().at("label").as_string();
  expect(label.size() <= 1003 && label.substr(label.size() - 3) == "...", "long value clipped");
}

void test_run_test_cases_entry_point() {
  ::setenv("GRADEBOX_WORKER_PATH", worker_path().c_str(), 1);
  auto res = gradebox::run_test_cases("def add(a, b):\n    return a + b\n",
                                      {plain("t", "add", {json::Value(1), json::Value(2)}, json::Value(3))});
  expect(res.ok && res.outcomes.size() == 1 && res.outcomes[0].passed, "consumer entry point runs cases");
  expect(&gradebox::global_engine() == &gradebox::global_engine(), "one process-wide engine");
  auto again = gradebox::run_test_cases("print('x')\n", {}, gradebox::ExecutionLimits{500, 64});
  expect(again.ok && again.stdout_text == "x\n", "limits passed through");
}

}  // namespace

int main() {
  std::cout << "=== gradebox Test Suite ===\n";

  std::cout << "\n[Phase 1] JSON, hashing, versions\n";
  run_test("JSON canonical output", test_json_canonical_output);
  run_test("JSON rejects garbage", test_json_rejects_garbage);
  run_test("JSON escape", test_json_escape);
  run_test("JSON unsigned range", test_json_unsigned_range);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("request digest", test_request_digest);
  run_test("outcome digest ignores durations", test_outcome_digest_ignores_durations);
  run_test("version compatibility", test_version_compatibility);

  std::cout << "\n[Phase 2] Frame protocol\n";
  run_test("frame encoding", test_frame_encoding);
  run_test("frame decoder split feed", test_frame_decoder_split_feed);
  run_test("oversize frame poisons decoder", test_frame_decoder_oversize_poisons);
  run_test("message round trip over pipe", test_message_roundtrip_over_pipe);
  run_test("message requires type", test_decode_message_requires_type);

  std::cout << "\n[Phase 3] Post-processing\n";
  run_test("last payload wins and is stripped", test_last_payload_wins_and_is_stripped);
  run_test("invalid payload dropped", test_invalid_payload_is_dropped);
  run_test("unterminated marker left alone", test_unterminated_marker_left_alone);
  run_test("stdout truncation boundary", test_stdout_truncation_boundary);
  run_test("exit classification order", test_exit_classification_order);
  run_test("timeout notice", test_timeout_appends_notice);
  run_test("compile error frames stripped", test_compile_error_frames_stripped);

  std::cout << "\n[Phase 4] Structure serializer\n";
  run_test("linked list", test_serializer_linked_list);
  run_test("cycle terminates under cap", test_serializer_cycle_terminates_under_cap);
  run_test("long linked list truncated", test_serializer_long_list_truncated);
  run_test("refused node sets truncated", test_serializer_truncates_on_refused_node);
  run_test("array", test_serializer_array);
  run_test("2D array", test_serializer_2d_array);
  run_test("heap", test_serializer_heap);
  run_test("graph", test_serializer_graph);
  run_test("tree and classifier priority", test_serializer_tree_and_priority);
  run_test("infrastructure ignored", test_serializer_ignores_infrastructure);
  run_test("markers", test_markers);
  run_test("label shortening", test_shorten_label);
  run_test("text clipping", test_clip_text);

  std::cout << "\n[Phase 5] Invariant extraction\n";
  run_test("linked list cycle", test_invariants_linked_list_cycle);
  run_test("traversal cap", test_invariants_traversal_cap);
  run_test("array list", test_invariants_array_list);
  run_test("ring buffer", test_invariants_ring_buffer);
  run_test("snapshot carries invariants", test_snapshot_carries_invariants);

  std::cout << "\n[Phase 6] Policy, config, requests\n";
  run_test("import allow-list", test_policy_allow_list);
  run_test("config validation", test_config_validation);
  run_test("legacy test case shape", test_legacy_test_case_shape);
  run_test("request parsing and validation", test_request_parsing_and_validation);
  run_test("result JSON exit code", test_result_json_exit_code);
  run_test("invalid request never spawns", test_invalid_request_never_spawns);
  run_test("missing worker is init failure", test_missing_worker_is_init_failure);

  std::cout << "\n[Phase 7] Governor and interrupt cell\n";
  run_test("interrupt cell first reason wins", test_interrupt_cell_first_reason_wins);
  run_test("governor deadline", test_governor_deadline);
  run_test("governor memory limit", test_governor_memory_limit);
  run_test("governor charges retained memory", test_governor_charges_retained_memory);
  run_test("governor early disarm", test_governor_disarm_early);

  std::cout << "\n[Phase 8] Observability\n";
  run_test("one event per execute", test_event_per_execute);
  run_test("stats JSON", test_stats_json);
  run_test("recent event ring order", test_recent_events_ring_order);

  if (!fs::exists(worker_path())) {
    std::cout << "\n[Phase 9] Worker-backed execution: SKIPPED (no worker at " << worker_path() << ")\n";
  } else {
    std::cout << "\n[Phase 9] Worker-backed execution\n";
    run_test("plain function (scenario A)", test_worker_plain_function);
    run_test("runtime error without tests (scenario B)", test_worker_runtime_error_without_tests);
    run_test("operation sequence (scenario C)", test_worker_operation_sequence);
    run_test("missing targets", test_worker_missing_targets);
    run_test("infinite loop timeout (scenario D)", test_worker_timeout);
    run_test("hard kill and respawn", test_worker_hard_kill);
    run_test("memory limit", test_worker_memory_limit);
    run_test("policy violation", test_worker_policy_violation);
    run_test("compile error", test_worker_compile_error);
    run_test("empty tests succeed", test_worker_empty_tests_success);
    run_test("failure snapshot", test_worker_failure_snapshot);
    run_test("USER_TESTS", test_worker_user_tests);
    run_test("idempotence across workers", test_worker_idempotence);
    run_test("fresh namespace per run", test_worker_state_isolated_between_runs);
    run_test("busy rejection and ping", test_worker_busy_and_ping);
    run_test("terminate", test_worker_terminate);
    run_test("terminate during execution", test_worker_terminate_in_flight);
    run_test("concurrent initialize", test_worker_concurrent_initialize);
    run_test("ping timeout replaces worker", test_worker_ping_timeout_replaces_worker);
    run_test("operation sequence missing method", test_worker_sequence_missing_method);
    run_test("cyclic return value", test_worker_cyclic_return_value);
    run_test("malformed case fails alone", test_worker_malformed_case_fails_alone);
    run_test("long text clipped in snapshot", test_worker_long_text_clipped_in_snapshot);
    run_test("run_test_cases entry point", test_run_test_cases_entry_point);
  }

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
