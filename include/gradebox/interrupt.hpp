#pragma once

// gradebox/interrupt.hpp — Shared interrupt cell.
//
// One 32-bit word in a memfd-backed MAP_SHARED mapping, visible to the host
// (writer) and the worker (reader). The host resets it before each run; the
// governor sets it to a reason code; the worker polls it at safe points.
//
// When memfd_create/mmap are unavailable the cell falls back to private
// memory: set()/load() still work inside the host, but the worker cannot see
// them and cancellation degrades to the supervisor's hard kill.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace gradebox {

enum class InterruptReason : std::int32_t {
  none = 0,
  timeout = 1,
  memory = 2,
};

std::string to_string(InterruptReason r);

class InterruptCell {
 public:
  // Host side. Never fails: falls back to a private cell.
  static InterruptCell create();
  // Worker side. fd is the inherited memfd. nullopt if it cannot be mapped.
  static std::optional<InterruptCell> attach(int fd);

  InterruptCell(InterruptCell&& other) noexcept;
  InterruptCell& operator=(InterruptCell&& other) noexcept;
  InterruptCell(const InterruptCell&) = delete;
  InterruptCell& operator=(const InterruptCell&) = delete;
  ~InterruptCell();

  void reset();
  // First reason wins; later calls are ignored until reset().
  bool set(InterruptReason reason);
  InterruptReason load() const;

  bool shared() const { return fd_ >= 0; }
  int fd() const { return fd_; }

 private:
  InterruptCell() = default;
  void release();

  int fd_{-1};
  bool owns_fd_{false};
  std::int32_t* word_{nullptr};
  void* mapping_{nullptr};
  std::unique_ptr<std::int32_t> private_word_;
};

}  // namespace gradebox
