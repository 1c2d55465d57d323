#include "gradebox/interrupt.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <atomic>

namespace gradebox {

std::string to_string(InterruptReason r) {
  switch (r) {
    case InterruptReason::none: return "none";
    case InterruptReason::timeout: return "timeout";
    case InterruptReason::memory: return "memory";
  }
  return "none";
}

InterruptCell InterruptCell::create() {
  InterruptCell cell;
  int fd = memfd_create("gradebox-interrupt", MFD_CLOEXEC);
  if (fd >= 0 && ftruncate(fd, sizeof(std::int32_t)) == 0) {
    void* m = mmap(nullptr, sizeof(std::int32_t), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (m != MAP_FAILED) {
      cell.fd_ = fd;
      cell.owns_fd_ = true;
      cell.mapping_ = m;
      cell.word_ = static_cast<std::int32_t*>(m);
      cell.reset();
      return cell;
    }
  }
  if (fd >= 0) close(fd);
  cell.private_word_ = std::make_unique<std::int32_t>(0);
  cell.word_ = cell.private_word_.get();
  return cell;
}

std::optional<InterruptCell> InterruptCell::attach(int fd) {
  if (fd < 0) return std::nullopt;
  void* m = mmap(nullptr, sizeof(std::int32_t), PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if (m == MAP_FAILED) return std::nullopt;
  InterruptCell cell;
  cell.fd_ = fd;
  cell.owns_fd_ = true;
  cell.mapping_ = m;
  cell.word_ = static_cast<std::int32_t*>(m);
  return cell;
}

InterruptCell::InterruptCell(InterruptCell&& other) noexcept { *this = std::move(other); }

InterruptCell& InterruptCell::operator=(InterruptCell&& other) noexcept {
  if (this == &other) return *this;
  release();
  fd_ = other.fd_;
  owns_fd_ = other.owns_fd_;
  word_ = other.word_;
  mapping_ = other.mapping_;
  private_word_ = std::move(other.private_word_);
  other.fd_ = -1;
  other.owns_fd_ = false;
  other.word_ = nullptr;
  other.mapping_ = nullptr;
  return *this;
}

InterruptCell::~InterruptCell() { release(); }

void InterruptCell::release() {
  if (mapping_) munmap(mapping_, sizeof(std::int32_t));
  if (owns_fd_ && fd_ >= 0) close(fd_);
  mapping_ = nullptr;
  word_ = nullptr;
  fd_ = -1;
  owns_fd_ = false;
  private_word_.reset();
}

void InterruptCell::reset() {
  if (!word_) return;
  std::atomic_ref<std::int32_t>(*word_).store(0, std::memory_order_release);
}

bool InterruptCell::set(InterruptReason reason) {
  if (!word_ || reason == InterruptReason::none) return false;
  std::int32_t expected = 0;
  return std::atomic_ref<std::int32_t>(*word_).compare_exchange_strong(
      expected, static_cast<std::int32_t>(reason), std::memory_order_acq_rel);
}

InterruptReason InterruptCell::load() const {
  if (!word_) return InterruptReason::none;
  return static_cast<InterruptReason>(
      std::atomic_ref<std::int32_t>(*word_).load(std::memory_order_acquire));
}

}  // namespace gradebox
