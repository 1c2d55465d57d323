#pragma once

// gradebox/guest_value.hpp — Runtime-independent snapshot of guest objects.
//
// The worker walks the guest namespace once (introspect.cpp) and records what
// the structure serializer and the invariant extractor need into a
// GuestGraph: a map from object identity to GuestValue, plus the ordered
// namespace bindings and the last tested instance. Classification then runs
// on plain C++ data, so it is testable without an interpreter and cannot
// re-enter guest code.
//
// Attribute lookups mirror hasattr()/getattr(): an attribute is present if it
// was an instance variable or one of the inspected names resolved on the object.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gradebox {

using GuestId = std::uint64_t;

enum class GuestKind {
  none,
  boolean,
  integer,
  real,
  text,
  sequence,  // list or tuple (see GuestValue::tuple)
  set,
  mapping,
  object,
  callable,
  type,
  module,
  other,
};

std::string to_string(GuestKind k);

struct GuestAttribute {
  std::string name;
  GuestId value{0};
  bool own{false};                     // present in the instance __dict__
  std::optional<GuestId> call_result;  // zero-argument call of a callable size/index attribute
};

struct GuestValue {
  GuestId id{0};
  GuestKind kind{GuestKind::other};
  std::string type_name;
  std::string text;  // str(value)
  bool truthy{false};
  bool tuple{false};
  std::int64_t integer{0};  // integer and boolean kinds
  bool has_dict{false};

  std::vector<GuestId> items;  // sequence/set elements, capped
  std::size_t length{0};       // true element count; code points for text
  std::vector<std::pair<GuestId, GuestId>> entries;  // mapping key -> value, capped
  std::vector<GuestAttribute> attributes;

  bool expanded{false};  // children recorded; false once the capture cap was hit

  bool is_none() const { return kind == GuestKind::none; }
  bool is_int() const { return kind == GuestKind::integer; }
  bool is_bool() const { return kind == GuestKind::boolean; }
  bool is_list() const { return kind == GuestKind::sequence && !tuple; }
  bool is_callable() const { return kind == GuestKind::callable || kind == GuestKind::type; }
  bool is_primitive() const {
    return kind == GuestKind::none || kind == GuestKind::boolean || kind == GuestKind::integer ||
           kind == GuestKind::real || kind == GuestKind::text;
  }
};

struct GuestBinding {
  std::string name;
  GuestId value{0};
};

class GuestGraph {
 public:
  // Inserts v unless a value with the same id is already present. Returns
  // the stored value.
  GuestValue& add(GuestValue v);
  GuestValue* find(GuestId id);
  const GuestValue* find(GuestId id) const;
  std::size_t size() const { return values_.size(); }

  void bind(std::string name, GuestId id);
  const std::vector<GuestBinding>& bindings() const { return bindings_; }
  const GuestValue* binding(std::string_view name) const;

  void set_subject(GuestId id) { subject_ = id; }
  const GuestValue* subject() const;

  bool has_attr(const GuestValue& v, std::string_view name) const;
  const GuestAttribute* attribute(const GuestValue& v, std::string_view name) const;
  // getattr(v, name, None); nullptr when absent or not recorded.
  const GuestValue* attr(const GuestValue& v, std::string_view name) const;
  // The attribute's value, or its zero-argument call result if it is callable.
  const GuestValue* attr_resolved(const GuestValue& v, std::string_view name) const;

 private:
  std::unordered_map<GuestId, GuestValue> values_;
  std::vector<GuestBinding> bindings_;
  std::optional<GuestId> subject_;
};

// Cuts text to at most limit bytes plus a trailing "...", never inside a
// UTF-8 sequence. Text within the limit is returned unchanged.
std::string clip_text(std::string text, std::size_t limit);

// Attribute names recorded on every object in addition to its instance
// variables. Covers node links, container fields, and size/index fields.
const std::vector<std::string>& inspected_attribute_names();

// Inspected names whose callable values are invoked with no arguments.
bool is_size_or_index_attribute(std::string_view name);

}  // namespace gradebox
