#include "gradebox/guest_value.hpp"

#include <algorithm>

namespace gradebox {

std::string to_string(GuestKind k) {
  switch (k) {
    case GuestKind::none: return "none";
    case GuestKind::boolean: return "boolean";
    case GuestKind::integer: return "integer";
    case GuestKind::real: return "real";
    case GuestKind::text: return "text";
    case GuestKind::sequence: return "sequence";
    case GuestKind::set: return "set";
    case GuestKind::mapping: return "mapping";
    case GuestKind::object: return "object";
    case GuestKind::callable: return "callable";
    case GuestKind::type: return "type";
    case GuestKind::module: return "module";
    case GuestKind::other: return "other";
  }
  return "other";
}

GuestValue& GuestGraph::add(GuestValue v) {
  auto it = values_.find(v.id);
  if (it != values_.end()) return it->second;
  const GuestId id = v.id;
  return values_.emplace(id, std::move(v)).first->second;
}

GuestValue* GuestGraph::find(GuestId id) {
  auto it = values_.find(id);
  return it == values_.end() ? nullptr : &it->second;
}

const GuestValue* GuestGraph::find(GuestId id) const {
  auto it = values_.find(id);
  return it == values_.end() ? nullptr : &it->second;
}

void GuestGraph::bind(std::string name, GuestId id) {
  for (auto& b : bindings_) {
    if (b.name == name) {
      b.value = id;
      return;
    }
  }
  bindings_.push_back({std::move(name), id});
}

const GuestValue* GuestGraph::binding(std::string_view name) const {
  for (const auto& b : bindings_) {
    if (b.name == name) return find(b.value);
  }
  return nullptr;
}

const GuestValue* GuestGraph::subject() const {
  return subject_ ? find(*subject_) : nullptr;
}

const GuestAttribute* GuestGraph::attribute(const GuestValue& v, std::string_view name) const {
  for (const auto& a : v.attributes) {
    if (a.name == name) return &a;
  }
  return nullptr;
}

bool GuestGraph::has_attr(const GuestValue& v, std::string_view name) const {
  return attribute(v, name) != nullptr;
}

const GuestValue* GuestGraph::attr(const GuestValue& v, std::string_view name) const {
  const GuestAttribute* a = attribute(v, name);
  return a ? find(a->value) : nullptr;
}

const GuestValue* GuestGraph::attr_resolved(const GuestValue& v, std::string_view name) const {
  const GuestAttribute* a = attribute(v, name);
  if (!a) return nullptr;
  const GuestValue* value = find(a->value);
  if (value && value->is_callable()) {
    return a->call_result ? find(*a->call_result) : nullptr;
  }
  return value;
}

std::string clip_text(std::string text, std::size_t limit) {
  if (text.size() <= limit) return text;
  std::size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  text.resize(cut);
  text += "...";
  return text;
}

const std::vector<std::string>& inspected_attribute_names() {
  static const std::vector<std::string> kNames = {
      "next",   "val",     "value",  "data",     "left",    "right",  "children", "is_end",
      "isEnd",  "head",    "tail",   "_head",    "_tail",   "_front", "_rear",    "front",
      "rear",   "_buffer", "buffer", "_data",    "_array",  "array",  "capacity", "size",
      "_size",  "size_",   "length", "_length",  "_count",  "count",
  };
  return kNames;
}

bool is_size_or_index_attribute(std::string_view name) {
  static constexpr std::string_view kNames[] = {
      "size",  "_size", "size_", "length", "_length", "_count", "count",
      "_head", "_front", "head", "front",  "_tail",   "_rear",  "tail",  "rear",
  };
  return std::find(std::begin(kNames), std::end(kNames), name) != std::end(kNames);
}

}  // namespace gradebox
