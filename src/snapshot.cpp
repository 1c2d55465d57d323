#include "gradebox/snapshot.hpp"

#include <algorithm>
#include <cctype>

#include "gradebox/postprocess.hpp"

namespace gradebox {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string id_of(const GuestValue& v) { return std::to_string(v.id); }

bool live(const GuestValue* v) { return v && !v->is_none() && v->truthy; }

bool is_list_or_set(const GuestValue* v) {
  return v && ((v->kind == GuestKind::sequence && !v->tuple) || v->kind == GuestKind::set);
}

}  // namespace

std::string shorten_label(const std::string& text) {
  if (text.size() <= 50) return text;
  return text.substr(0, 47) + "...";
}

// ---------------------------------------------------------------------------
// NodeRegistry
// ---------------------------------------------------------------------------

NodeRegistry::AddStatus NodeRegistry::add_node(const std::string& id, const std::string& label,
                                               const std::string& type) {
  if (ids_.count(id)) return AddStatus::existing;
  if (nodes_.size() >= max_nodes_) {
    truncated_ = true;
    return AddStatus::refused;
  }
  nodes_.push_back({id, label, type});
  ids_.insert(id);
  return AddStatus::added;
}

void NodeRegistry::add_edge(const std::string& from, const std::string& to, const std::string& label) {
  edges_.push_back({from, to, label});
}

bool NodeRegistry::has_node_type(const std::string& type) const {
  return std::any_of(nodes_.begin(), nodes_.end(), [&](const SnapshotNode& n) { return n.type == type; });
}

std::vector<SnapshotEdge> NodeRegistry::edges() const {
  std::vector<SnapshotEdge> out;
  for (const auto& e : edges_) {
    if (contains(e.from) && contains(e.to)) out.push_back(e);
  }
  return out;
}

// ---------------------------------------------------------------------------
// StructureSerializer
// ---------------------------------------------------------------------------

StructureSerializer::StructureSerializer(const GuestGraph& graph, const SnapshotOptions& opts)
    : graph_(graph), opts_(opts), registry_(opts.max_nodes) {}

bool StructureSerializer::is_ll_node(const GuestValue& v) const {
  return graph_.has_attr(v, "next") &&
         (graph_.has_attr(v, "val") || graph_.has_attr(v, "value") || graph_.has_attr(v, "data"));
}

// getattr(node, 'val', getattr(node, 'value', getattr(node, 'data', '?')))
std::string StructureSerializer::node_value_text(const GuestValue& v) const {
  for (const char* name : {"val", "value", "data"}) {
    if (graph_.has_attr(v, name)) {
      const GuestValue* value = graph_.attr(v, name);
      return value ? value->text : "?";
    }
  }
  return "?";
}

void StructureSerializer::serialize_linked_list(const GuestValue& head) {
  const GuestValue* curr = &head;
  std::string prev_id;
  while (live(curr)) {
    const std::string curr_id = id_of(*curr);
    const auto status = registry_.add_node(curr_id, node_value_text(*curr), "ll_node");
    if (status == NodeRegistry::AddStatus::refused) break;  // registry marks truncated
    if (!prev_id.empty()) registry_.add_edge(prev_id, curr_id);
    if (status == NodeRegistry::AddStatus::existing) break;  // revisited: cycle or shared tail
    prev_id = curr_id;
    const GuestAttribute* link = graph_.attribute(*curr, "next");
    curr = link ? graph_.find(link->value) : nullptr;
    if (link && !curr) {
      // The successor exists in the guest but fell outside the captured graph.
      registry_.mark_truncated();
      break;
    }
  }
}

void StructureSerializer::serialize_tree(const GuestValue& root) {
  if (!live(&root)) return;
  const std::string root_id = id_of(root);
  if (registry_.add_node(root_id, node_value_text(root), "tree_node") != NodeRegistry::AddStatus::added) {
    return;
  }
  for (const char* side : {"left", "right"}) {
    const GuestValue* child = graph_.attr(root, side);
    if (!live(child)) continue;
    registry_.add_edge(root_id, id_of(*child), side);
    serialize_tree(*child);
  }
}

void StructureSerializer::serialize_trie(const GuestValue& root, const std::string& prefix) {
  if (!live(&root)) return;
  const std::string root_id = id_of(root);
  const GuestValue* is_end = graph_.has_attr(root, "is_end") ? graph_.attr(root, "is_end")
                                                             : graph_.attr(root, "isEnd");
  const bool end = is_end && is_end->truthy;
  const std::string label = "TrieNode(" + prefix + ")" + (end ? "*" : "");
  if (registry_.add_node(root_id, label, "trie_node") != NodeRegistry::AddStatus::added) return;

  const GuestValue* children = graph_.attr(root, "children");
  if (!children) return;
  if (children->kind == GuestKind::mapping) {
    for (const auto& [key_id, child_id] : children->entries) {
      const GuestValue* key = graph_.find(key_id);
      const GuestValue* child = graph_.find(child_id);
      if (!live(child)) continue;
      const std::string ch = key ? key->text : "?";
      registry_.add_edge(root_id, id_of(*child), ch);
      serialize_trie(*child, prefix + ch);
    }
  } else if (children->kind == GuestKind::sequence && !children->tuple) {
    for (std::size_t i = 0; i < children->items.size(); ++i) {
      const GuestValue* child = graph_.find(children->items[i]);
      if (!live(child)) continue;
      const std::string ch(1, static_cast<char>('a' + static_cast<int>(i % 26)));
      registry_.add_edge(root_id, id_of(*child), ch);
      serialize_trie(*child, prefix + ch);
    }
  }
}

void StructureSerializer::serialize_graph(const GuestValue& adjacency) {
  for (const auto& [key_id, neighbors_id] : adjacency.entries) {
    const GuestValue* key = graph_.find(key_id);
    if (!key) continue;
    const std::string u = key->text;
    registry_.add_node(u, u, "graph_node");
    const GuestValue* neighbors = graph_.find(neighbors_id);
    if (!neighbors || (neighbors->kind != GuestKind::sequence && neighbors->kind != GuestKind::set)) {
      continue;
    }
    for (GuestId nid : neighbors->items) {
      const GuestValue* n = graph_.find(nid);
      if (!n) continue;
      registry_.add_node(n->text, n->text, "graph_node");
      registry_.add_edge(u, n->text);
    }
  }
}

void StructureSerializer::serialize_heap(const std::string& name, const GuestValue& data) {
  if (std::none_of(heaps_.begin(), heaps_.end(), [&](const ArrayRecord& r) { return r.name == name; })) {
    heaps_.push_back({name, data.id, false});
  }
  const std::size_t n = data.items.size();
  for (std::size_t i = 0; i < n; ++i) {
    const GuestValue* item = graph_.find(data.items[i]);
    const std::string node_id = name + "_" + std::to_string(i);
    registry_.add_node(node_id, item ? item->text : "?", "heap_node");
    const std::size_t left = 2 * i + 1;
    const std::size_t right = 2 * i + 2;
    if (left < n) registry_.add_edge(node_id, name + "_" + std::to_string(left));
    if (right < n) registry_.add_edge(node_id, name + "_" + std::to_string(right));
  }
}

void StructureSerializer::serialize_array(const std::string& name, const GuestValue& data) {
  bool any_truthy = false;
  bool all_rows = true;
  for (GuestId id : data.items) {
    const GuestValue* item = graph_.find(id);
    if (!item || !item->truthy) continue;
    any_truthy = true;
    if (item->kind != GuestKind::sequence) all_rows = false;
  }
  const bool is_2d = any_truthy && all_rows;
  const std::string label =
      name + (is_2d ? " (2D Array): " : " (Array): ") + shorten_label(data.text);
  registry_.add_node(name, label, "array");
  if (std::none_of(arrays_.begin(), arrays_.end(), [&](const ArrayRecord& r) { return r.name == name; })) {
    arrays_.push_back({name, data.id, is_2d});
  }
}

void StructureSerializer::add_hashmap(const std::string& name, const GuestValue& data) {
  registry_.add_node(name, name + ": " + shorten_label(data.text), "hashmap");
}

std::optional<std::string> StructureSerializer::classify(const std::string& name, const GuestValue& v,
                                                         bool nested) {
  if (is_ll_node(v)) {
    serialize_linked_list(v);
    return "linked-list";
  }
  if (graph_.has_attr(v, "left") || graph_.has_attr(v, "right")) {
    serialize_tree(v);
    return "tree";
  }
  if (graph_.has_attr(v, "children") && (graph_.has_attr(v, "is_end") || graph_.has_attr(v, "isEnd"))) {
    serialize_trie(v, "");
    return "tree";
  }
  if (v.kind == GuestKind::mapping && v.length > 0 &&
      std::any_of(v.entries.begin(), v.entries.end(),
                  [&](const auto& e) { return is_list_or_set(graph_.find(e.second)); })) {
    serialize_graph(v);
    return "graph";
  }
  if (v.is_list() && lower(name).find("heap") != std::string::npos) {
    serialize_heap(name, v);
    return "heap";
  }
  if (v.kind == GuestKind::sequence) {
    serialize_array(name, v);
    return "array";
  }
  if (v.kind == GuestKind::mapping) {
    if (!nested || v.length > 0) add_hashmap(name, v);
    return std::nullopt;
  }
  if (!nested && v.kind == GuestKind::object && v.has_dict) {
    std::optional<std::string> kind;
    for (const auto& a : v.attributes) {
      if (!a.own || a.name.empty() || a.name[0] == '_') continue;
      const GuestValue* value = graph_.find(a.value);
      if (!value) continue;
      if (auto k = classify(name + "." + a.name, *value, true)) kind = k;
    }
    return kind;
  }
  return std::nullopt;
}

jsonlite::Value StructureSerializer::typed_structure(const std::string& kind) const {
  using jsonlite::Array;
  using jsonlite::Object;
  const auto edges = registry_.edges();

  auto labelled_nodes = [&]() {
    Array nodes;
    for (const auto& n : registry_.nodes()) {
      Object o;
      o["id"] = n.id;
      o["value"] = n.label;
      o["label"] = n.label;
      nodes.push_back(std::move(o));
    }
    return nodes;
  };
  auto edge_array = [&]() {
    Array out;
    for (const auto& e : edges) {
      Object o;
      o["from"] = e.from;
      o["to"] = e.to;
      o["label"] = e.label;
      out.push_back(std::move(o));
    }
    return out;
  };
  auto element_array = [&](const GuestValue& seq) {
    Array out;
    for (std::size_t i = 0; i < seq.items.size(); ++i) {
      const GuestValue* item = graph_.find(seq.items[i]);
      Object e;
      e["index"] = static_cast<std::uint64_t>(i);
      e["value"] = item ? item->text : "?";
      out.push_back(std::move(e));
    }
    return out;
  };
  auto tree_fields = [&]() {
    Object s;
    std::set<std::string> targets;
    for (const auto& e : edges) targets.insert(e.to);
    std::string root_id;
    for (const auto& n : registry_.nodes()) {
      if (!targets.count(n.id)) {
        root_id = n.id;
        break;
      }
    }
    if (root_id.empty() && !registry_.empty()) root_id = registry_.nodes().front().id;
    s["nodes"] = labelled_nodes();
    s["edges"] = edge_array();
    s["rootId"] = root_id;
    return s;
  };

  if (kind == "array" && !arrays_.empty()) {
    const ArrayRecord& first = arrays_.front();
    const GuestValue* data = graph_.find(first.value);
    Object s;
    s["name"] = first.name;
    if (data && first.is_2d) {
      Array rows;
      for (std::size_t r = 0; r < data->items.size(); ++r) {
        const GuestValue* row = graph_.find(data->items[r]);
        if (!row || row->kind != GuestKind::sequence) continue;
        Object ro;
        ro["index"] = static_cast<std::uint64_t>(r);
        ro["elements"] = element_array(*row);
        rows.push_back(std::move(ro));
      }
      s["elements"] = Array{};
      s["is2D"] = true;
      s["rows"] = std::move(rows);
    } else {
      s["elements"] = data ? element_array(*data) : Array{};
      s["is2D"] = false;
    }
    return jsonlite::Value{std::move(s)};
  }
  if (kind == "tree") return jsonlite::Value{tree_fields()};
  if (kind == "heap") {
    Object s = tree_fields();
    Array repr;
    std::string heap_type = "min";
    if (!heaps_.empty()) {
      if (lower(heaps_.front().name).find("max") != std::string::npos) heap_type = "max";
      if (const GuestValue* data = graph_.find(heaps_.front().value)) {
        for (GuestId id : data->items) {
          const GuestValue* item = graph_.find(id);
          repr.push_back(item ? item->text : "?");
        }
      }
    }
    s["heapType"] = heap_type;
    s["arrayRepresentation"] = std::move(repr);
    return jsonlite::Value{std::move(s)};
  }
  if (kind == "linked-list") {
    Object s;
    s["nodes"] = labelled_nodes();
    s["nextPointers"] = edge_array();
    return jsonlite::Value{std::move(s)};
  }

  // graph and fallback: flat nodes/edges
  Object s;
  Array nodes;
  for (const auto& n : registry_.nodes()) {
    Object o;
    o["id"] = n.id;
    o["label"] = n.label;
    o["type"] = n.type;
    nodes.push_back(std::move(o));
  }
  s["nodes"] = std::move(nodes);
  s["edges"] = edge_array();
  return jsonlite::Value{std::move(s)};
}

std::optional<jsonlite::Value> StructureSerializer::build() {
  std::string detected = "graph";
  for (const auto& b : graph_.bindings()) {
    if (b.name.empty() || b.name[0] == '_' || opts_.excluded_names.count(b.name)) continue;
    const GuestValue* v = graph_.find(b.value);
    if (!v || v->is_callable() || v->kind == GuestKind::module) continue;
    if (auto kind = classify(b.name, *v, false)) detected = *kind;
  }

  std::optional<InvariantSnapshot> state;
  std::optional<std::string> instance_kind;
  const GuestValue* inst = graph_.subject();
  if (inst && !inst->is_none()) {
    state = extract_invariants(graph_, *inst);
    if (!state) {
      // A wrapper (e.g. a test fixture) holding the structure under test.
      for (const auto& a : inst->attributes) {
        if (a.name.empty() || a.name[0] == '_') continue;
        const GuestValue* value = graph_.find(a.value);
        if (!value || value->is_callable() || value->is_primitive()) continue;
        if (auto candidate = extract_invariants(graph_, *value)) {
          inst = value;
          state = candidate;
          break;
        }
      }
    }
    if (state) {
      instance_kind = state->kind == InvariantKind::linked_list ? "linked-list" : "array";
    }

    for (const auto& a : inst->attributes) {
      if (!a.own || a.name.empty() || a.name[0] == '_') continue;
      const GuestValue* value = graph_.find(a.value);
      if (!value) continue;
      if (auto kind = classify("instance." + a.name, *value, true)) {
        detected = *kind;
        if (!instance_kind) instance_kind = kind;
      }
    }

    // Private heads (_head) are skipped above; render the list from them.
    if (state && state->kind == InvariantKind::linked_list && !registry_.has_node_type("ll_node")) {
      const GuestValue* head = graph_.attr(*inst, "head");
      if (!live(head)) head = graph_.attr(*inst, "_head");
      if (live(head) && is_ll_node(*head)) serialize_linked_list(*head);
    }
  }

  if (registry_.empty() && !state) return std::nullopt;

  const std::string final_kind = instance_kind ? *instance_kind : detected;
  jsonlite::Value structure{jsonlite::Object{}};
  const bool matching = final_kind != "linked-list" || registry_.has_node_type("ll_node");
  if (!registry_.empty() && matching) {
    structure = typed_structure(final_kind);
  } else if (final_kind == "linked-list") {
    jsonlite::Object empty;
    empty["nodes"] = jsonlite::Array{};
    empty["nextPointers"] = jsonlite::Array{};
    structure = jsonlite::Value{std::move(empty)};
  }

  jsonlite::Object payload;
  payload["diagramType"] = final_kind;
  payload["structureKind"] = final_kind;
  payload["structure"] = std::move(structure);
  payload["markers"] = detect_markers(graph_);
  payload["truncated"] = registry_.truncated();
  if (state) payload["stateSnapshot"] = invariants_to_json(*state);
  return jsonlite::Value{std::move(payload)};
}

// ---------------------------------------------------------------------------
// Markers
// ---------------------------------------------------------------------------

jsonlite::Value detect_markers(const GuestGraph& graph) {
  jsonlite::Object markers;

  for (const char* name : {"visited", "seen", "path", "order"}) {
    const GuestValue* v = graph.binding(name);
    if (!v || (v->kind != GuestKind::sequence && v->kind != GuestKind::set)) continue;
    jsonlite::Array order;
    for (GuestId id : v->items) {
      const GuestValue* item = graph.find(id);
      order.push_back(item ? item->text : "?");
    }
    markers["visitedOrder"] = std::move(order);
    break;
  }

  jsonlite::Object pointers;
  for (const char* name : {"i", "j", "left", "right", "slow", "fast", "lo", "hi", "mid", "current", "prev"}) {
    const GuestValue* v = graph.binding(name);
    if (v && v->is_int()) pointers[name] = v->integer;
  }
  if (!pointers.empty()) markers["pointers"] = std::move(pointers);

  for (const auto& b : graph.bindings()) {
    if (lower(b.name).find("cycle") == std::string::npos) continue;
    const GuestValue* v = graph.find(b.value);
    if (!v || v->is_callable()) continue;
    if ((v->is_bool() && v->integer != 0) || (!v->is_bool() && !v->is_none())) {
      markers["cycleDetected"] = true;
      break;
    }
  }
  return jsonlite::Value{std::move(markers)};
}

std::string format_payload_block(const jsonlite::Value& payload) {
  std::string out;
  out += '\n';
  out += kVizStartMarker;
  out += '\n';
  out += jsonlite::to_json(payload);
  out += '\n';
  out += kVizEndMarker;
  out += "\n\n";
  return out;
}

}  // namespace gradebox
