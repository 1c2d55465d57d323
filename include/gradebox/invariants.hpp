#pragma once

// gradebox/invariants.hpp — Structural invariants of the last tested instance.
//
// Detection (first match):
//   ring buffer  _buffer, or capacity with _data|data and _head|_front
//   linked list  head without _data and _buffer, head is None or has next
//   array list   _data|data|_array|array with _size|size|size_|length|_length
//
// Every field is optional: absent means "not applicable / not determinable".

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gradebox/guest_value.hpp"
#include "gradebox/jsonlite.hpp"

namespace gradebox {

enum class InvariantKind { linked_list, array_list, ring_buffer };

// "linked-list", "arraylist", "circular-queue"
std::string to_string(InvariantKind k);

constexpr std::size_t kMaxTraversalHops = 200;
constexpr std::size_t kBufferPreviewLength = 20;

struct InvariantSnapshot {
  InvariantKind kind{InvariantKind::linked_list};

  // linked list
  bool head_exists{false};
  bool tail_exists{false};
  std::optional<bool> tail_next_is_null;
  std::optional<bool> tail_is_last_reachable;
  std::size_t reachable_nodes{0};
  bool cycle_detected{false};

  // shared
  std::optional<std::int64_t> stored_size;
  std::optional<std::int64_t> capacity;
  std::optional<std::vector<std::string>> buffer_preview;
  std::optional<bool> size_in_range;

  // ring buffer
  std::optional<std::int64_t> head_index;
  std::optional<std::int64_t> tail_index;
  std::optional<bool> indices_in_range;
};

std::optional<InvariantSnapshot> extract_invariants(const GuestGraph& graph, const GuestValue& instance);

jsonlite::Value invariants_to_json(const InvariantSnapshot& s);

}  // namespace gradebox
