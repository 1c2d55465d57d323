#pragma once

// gradebox/snapshot.hpp — Structure serializer.
//
// Classifies namespace bindings of a GuestGraph into a renderable structure
// (array, linked-list, tree, heap, graph) plus markers and the invariants of
// the last tested instance, and formats the marker-delimited payload the
// worker prints to captured stdout.
//
// NODE BUDGET: the registry holds at most max_nodes nodes. A refused
// addition sets truncated; traversals only descend into newly added nodes,
// so cyclic structures terminate. Edges whose endpoints did not both make it
// into the registry are dropped from the output.

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "gradebox/guest_value.hpp"
#include "gradebox/invariants.hpp"
#include "gradebox/jsonlite.hpp"

namespace gradebox {

constexpr std::size_t kDefaultMaxNodes = 50;

struct SnapshotNode {
  std::string id;
  std::string label;
  std::string type;  // array, ll_node, tree_node, trie_node, heap_node, graph_node, hashmap
};

struct SnapshotEdge {
  std::string from;
  std::string to;
  std::string label;
};

class NodeRegistry {
 public:
  enum class AddStatus { added, existing, refused };

  explicit NodeRegistry(std::size_t max_nodes = kDefaultMaxNodes) : max_nodes_(max_nodes) {}

  AddStatus add_node(const std::string& id, const std::string& label, const std::string& type);
  void add_edge(const std::string& from, const std::string& to, const std::string& label = "");

  bool contains(const std::string& id) const { return ids_.count(id) > 0; }
  bool empty() const { return nodes_.empty(); }
  bool truncated() const { return truncated_; }
  void mark_truncated() { truncated_ = true; }
  bool has_node_type(const std::string& type) const;

  const std::vector<SnapshotNode>& nodes() const { return nodes_; }
  // Edges with both endpoints registered, in insertion order.
  std::vector<SnapshotEdge> edges() const;

 private:
  std::size_t max_nodes_;
  std::vector<SnapshotNode> nodes_;
  std::set<std::string> ids_;
  std::vector<SnapshotEdge> edges_;
  bool truncated_{false};
};

struct SnapshotOptions {
  std::size_t max_nodes{kDefaultMaxNodes};
  // Bindings never classified (harness infrastructure).
  std::set<std::string> excluded_names;
};

class StructureSerializer {
 public:
  StructureSerializer(const GuestGraph& graph, const SnapshotOptions& opts);

  // Full payload {diagramType, structureKind, structure, markers, truncated,
  // stateSnapshot?}, or nullopt when nothing was recognized.
  std::optional<jsonlite::Value> build();

 private:
  struct ArrayRecord {
    std::string name;
    GuestId value;
    bool is_2d;
  };

  std::optional<std::string> classify(const std::string& name, const GuestValue& v, bool nested);
  void serialize_linked_list(const GuestValue& head);
  void serialize_tree(const GuestValue& root);
  void serialize_trie(const GuestValue& root, const std::string& prefix);
  void serialize_graph(const GuestValue& adjacency);
  void serialize_heap(const std::string& name, const GuestValue& data);
  void serialize_array(const std::string& name, const GuestValue& data);
  void add_hashmap(const std::string& name, const GuestValue& data);

  bool is_ll_node(const GuestValue& v) const;
  std::string node_value_text(const GuestValue& v) const;
  jsonlite::Value typed_structure(const std::string& kind) const;

  const GuestGraph& graph_;
  SnapshotOptions opts_;
  NodeRegistry registry_;
  std::vector<ArrayRecord> arrays_;
  std::vector<ArrayRecord> heaps_;
};

// Pointer, visited-order and cycle markers detected from namespace bindings.
jsonlite::Value detect_markers(const GuestGraph& graph);

// "\n=== VIZ_PAYLOAD_START ===\n<json>\n=== VIZ_PAYLOAD_END ===\n\n"
std::string format_payload_block(const jsonlite::Value& payload);

// str() text shortened to 47 characters plus "..." when longer than 50.
std::string shorten_label(const std::string& text);

}  // namespace gradebox
