#include "gradebox/invariants.hpp"

#include <initializer_list>
#include <unordered_set>

namespace gradebox {

std::string to_string(InvariantKind k) {
  switch (k) {
    case InvariantKind::linked_list: return "linked-list";
    case InvariantKind::array_list: return "arraylist";
    case InvariantKind::ring_buffer: return "circular-queue";
  }
  return "linked-list";
}

namespace {

using Names = std::initializer_list<const char*>;

bool has_any(const GuestGraph& g, const GuestValue& v, Names names) {
  for (const char* n : names) {
    if (g.has_attr(v, n)) return true;
  }
  return false;
}

// First attribute present among names.
const GuestAttribute* first_present(const GuestGraph& g, const GuestValue& v, Names names) {
  for (const char* n : names) {
    if (const GuestAttribute* a = g.attribute(v, n)) return a;
  }
  return nullptr;
}

std::optional<std::int64_t> as_int(const GuestValue* v) {
  if (v && (v->is_int() || v->is_bool())) return v->integer;
  return std::nullopt;
}

// Size of the first present attribute among names, calling it if callable.
std::optional<std::int64_t> stored_size(const GuestGraph& g, const GuestValue& v, Names names) {
  const GuestAttribute* a = first_present(g, v, names);
  if (!a) return std::nullopt;
  return as_int(g.attr_resolved(v, a->name));
}

std::optional<std::int64_t> container_length(const GuestValue* v) {
  if (!v) return std::nullopt;
  switch (v->kind) {
    case GuestKind::sequence:
    case GuestKind::set:
    case GuestKind::mapping:
    case GuestKind::text:
      return static_cast<std::int64_t>(v->length);
    default:
      return std::nullopt;
  }
}

std::optional<std::vector<std::string>> preview(const GuestGraph& g, const GuestValue* v) {
  if (!v || v->kind != GuestKind::sequence) return std::nullopt;
  std::vector<std::string> out;
  for (std::size_t i = 0; i < v->items.size() && i < kBufferPreviewLength; ++i) {
    const GuestValue* item = g.find(v->items[i]);
    out.push_back(item ? item->text : "?");
  }
  return out;
}

std::optional<bool> in_range(const std::optional<std::int64_t>& size,
                             const std::optional<std::int64_t>& cap) {
  if (!size || !cap) return std::nullopt;
  return *size >= 0 && *size <= *cap;
}

bool is_live(const GuestValue* v) { return v && !v->is_none() && v->truthy; }

InvariantSnapshot linked_list(const GuestGraph& g, const GuestValue& inst) {
  InvariantSnapshot s;
  s.kind = InvariantKind::linked_list;
  const GuestValue* head = g.attr(inst, "head");
  const GuestValue* tail = g.attr(inst, "tail");
  s.head_exists = head && !head->is_none();
  s.tail_exists = tail && !tail->is_none();
  s.stored_size = stored_size(g, inst, {"size", "_size", "size_", "length", "_length"});

  std::unordered_set<GuestId> seen;
  const GuestValue* last = nullptr;
  const GuestValue* curr = head;
  while (is_live(curr) && !seen.count(curr->id) && s.reachable_nodes < kMaxTraversalHops) {
    seen.insert(curr->id);
    last = curr;
    ++s.reachable_nodes;
    curr = g.attr(*curr, "next");
  }
  s.cycle_detected = curr && !curr->is_none() && seen.count(curr->id) > 0;

  if (is_live(tail)) {
    if (g.has_attr(*tail, "next")) {
      const GuestValue* tail_next = g.attr(*tail, "next");
      s.tail_next_is_null = tail_next && tail_next->is_none();
    } else {
      s.tail_next_is_null = false;
    }
    if (last) s.tail_is_last_reachable = tail->id == last->id;
  }
  return s;
}

InvariantSnapshot array_list(const GuestGraph& g, const GuestValue& inst) {
  InvariantSnapshot s;
  s.kind = InvariantKind::array_list;
  const GuestAttribute* data_attr = first_present(g, inst, {"_data", "data", "_array", "array"});
  const GuestValue* data = data_attr ? g.find(data_attr->value) : nullptr;
  s.stored_size = stored_size(g, inst, {"_size", "size", "size_", "length", "_length"});
  if (data && !data->is_none()) {
    s.capacity = container_length(data);
    s.buffer_preview = preview(g, data);
  }
  s.size_in_range = in_range(s.stored_size, s.capacity);
  return s;
}

// Index attributes are ints, or zero-argument methods that do not look like
// node links.
std::optional<std::int64_t> ring_index(const GuestGraph& g, const GuestValue& inst, Names names) {
  for (const char* n : names) {
    const GuestAttribute* a = g.attribute(inst, n);
    if (!a) continue;
    const GuestValue* v = g.find(a->value);
    if (!v) continue;
    if (v->is_int() || v->is_bool()) return v->integer;
    if (v->is_callable() && !g.has_attr(*v, "next")) {
      return a->call_result ? as_int(g.find(*a->call_result)) : std::nullopt;
    }
  }
  return std::nullopt;
}

InvariantSnapshot ring_buffer(const GuestGraph& g, const GuestValue& inst) {
  InvariantSnapshot s;
  s.kind = InvariantKind::ring_buffer;
  const GuestAttribute* buf_attr = first_present(g, inst, {"_buffer", "_data", "data", "_array", "buffer"});
  const GuestValue* buffer = buf_attr ? g.find(buf_attr->value) : nullptr;
  if (buffer && !buffer->is_none()) {
    s.capacity = container_length(buffer);
    s.buffer_preview = preview(g, buffer);
  }
  s.head_index = ring_index(g, inst, {"_head", "_front", "head", "front"});
  s.tail_index = ring_index(g, inst, {"_tail", "_rear", "tail", "rear"});
  s.stored_size = stored_size(g, inst, {"_size", "size", "size_", "_count", "count"});

  if (s.capacity && *s.capacity > 0) {
    const std::int64_t cap = *s.capacity;
    const bool h_ok = s.head_index && *s.head_index >= 0 && *s.head_index < cap;
    const bool t_ok = s.tail_index && *s.tail_index >= 0 && *s.tail_index < cap;
    s.indices_in_range = h_ok && t_ok;
  }
  s.size_in_range = in_range(s.stored_size, s.capacity);
  return s;
}

}  // namespace

std::optional<InvariantSnapshot> extract_invariants(const GuestGraph& g, const GuestValue& inst) {
  if (inst.is_none()) return std::nullopt;

  if (g.has_attr(inst, "_buffer") ||
      (g.has_attr(inst, "capacity") && has_any(g, inst, {"_data", "data"}) &&
       has_any(g, inst, {"_head", "_front"}))) {
    return ring_buffer(g, inst);
  }
  if (g.has_attr(inst, "head") && !g.has_attr(inst, "_data") && !g.has_attr(inst, "_buffer")) {
    const GuestValue* head = g.attr(inst, "head");
    if (!head || head->is_none() || g.has_attr(*head, "next")) return linked_list(g, inst);
  }
  if (has_any(g, inst, {"_data", "data", "_array", "array"}) &&
      has_any(g, inst, {"_size", "size", "size_", "length", "_length"})) {
    return array_list(g, inst);
  }
  return std::nullopt;
}

jsonlite::Value invariants_to_json(const InvariantSnapshot& s) {
  jsonlite::Object o;
  o["type"] = to_string(s.kind);
  auto put_int = [&](const char* key, const std::optional<std::int64_t>& v) {
    if (v) o[key] = *v;
  };
  auto put_bool = [&](const char* key, const std::optional<bool>& v) {
    if (v) o[key] = *v;
  };
  if (s.kind == InvariantKind::linked_list) {
    o["headExists"] = s.head_exists;
    o["tailExists"] = s.tail_exists;
    put_bool("tailNextIsNull", s.tail_next_is_null);
    put_bool("tailIsLastReachable", s.tail_is_last_reachable);
    o["reachableNodes"] = static_cast<std::uint64_t>(s.reachable_nodes);
    o["cycleDetected"] = s.cycle_detected;
  } else if (s.kind == InvariantKind::ring_buffer) {
    put_int("headIndex", s.head_index);
    put_int("tailIndex", s.tail_index);
    put_bool("indicesInRange", s.indices_in_range);
  }
  put_int("storedSize", s.stored_size);
  if (s.kind != InvariantKind::linked_list) {
    put_int("capacity", s.capacity);
    if (s.buffer_preview) {
      jsonlite::Array a;
      for (const auto& item : *s.buffer_preview) a.push_back(item);
      o["bufferPreview"] = std::move(a);
    }
    put_bool("sizeInRange", s.size_in_range);
  }
  return jsonlite::Value{std::move(o)};
}

}  // namespace gradebox
