#include "gradebox/protocol.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>

namespace gradebox {
namespace protocol {

namespace {

void put_u32_be(std::string& out, std::uint32_t v) {
  out.push_back(static_cast<char>((v >> 24) & 0xff));
  out.push_back(static_cast<char>((v >> 16) & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
  out.push_back(static_cast<char>(v & 0xff));
}

std::uint32_t get_u32_be(const char* p) {
  const auto* u = reinterpret_cast<const unsigned char*>(p);
  return (static_cast<std::uint32_t>(u[0]) << 24) | (static_cast<std::uint32_t>(u[1]) << 16) |
         (static_cast<std::uint32_t>(u[2]) << 8) | static_cast<std::uint32_t>(u[3]);
}

// Returns remaining milliseconds for poll(), -1 for no deadline, 0 if passed.
int poll_timeout(const std::optional<std::chrono::steady_clock::time_point>& deadline) {
  if (!deadline) return -1;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) return 0;
  return left.count() > 0x7fffffff ? 0x7fffffff : static_cast<int>(left.count());
}

// Reads exactly n bytes into out.
ReadStatus read_exact(int fd, char* out, std::size_t n,
                      const std::optional<std::chrono::steady_clock::time_point>& deadline) {
  std::size_t got = 0;
  while (got < n) {
    pollfd pfd{fd, POLLIN, 0};
    int timeout = poll_timeout(deadline);
    int pr = poll(&pfd, 1, timeout);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::io_error;
    }
    if (pr == 0) return ReadStatus::timeout;
    ssize_t r = read(fd, out + got, n - got);
    if (r < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return ReadStatus::io_error;
    }
    if (r == 0) return ReadStatus::closed;
    got += static_cast<std::size_t>(r);
  }
  return ReadStatus::ok;
}

}  // namespace

std::string encode_frame(const std::string& body) {
  std::string out;
  out.reserve(body.size() + 4);
  put_u32_be(out, static_cast<std::uint32_t>(body.size()));
  out += body;
  return out;
}

void FrameDecoder::feed(const char* data, std::size_t n) {
  if (poisoned_) return;
  buf_.append(data, n);
}

std::optional<std::string> FrameDecoder::next() {
  if (poisoned_ || buf_.size() < 4) return std::nullopt;
  const std::uint32_t len = get_u32_be(buf_.data());
  if (len > kMaxFrameBytes) {
    poisoned_ = true;
    buf_.clear();
    return std::nullopt;
  }
  if (buf_.size() < 4u + len) return std::nullopt;
  std::string body = buf_.substr(4, len);
  buf_.erase(0, 4u + len);
  return body;
}

std::string to_string(ReadStatus s) {
  switch (s) {
    case ReadStatus::ok: return "ok";
    case ReadStatus::timeout: return "timeout";
    case ReadStatus::closed: return "closed";
    case ReadStatus::oversize: return "oversize";
    case ReadStatus::io_error: return "io_error";
  }
  return "io_error";
}

bool write_frame(int fd, const std::string& body) {
  if (body.size() > kMaxFrameBytes) return false;
  const std::string frame = encode_frame(body);
  std::size_t sent = 0;
  while (sent < frame.size()) {
    ssize_t w = write(fd, frame.data() + sent, frame.size() - sent);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<std::size_t>(w);
  }
  return true;
}

ReadStatus read_frame(int fd, std::string& body,
                      std::optional<std::chrono::steady_clock::time_point> deadline) {
  char header[4];
  ReadStatus st = read_exact(fd, header, sizeof(header), deadline);
  if (st != ReadStatus::ok) return st;
  const std::uint32_t len = get_u32_be(header);
  if (len > kMaxFrameBytes) return ReadStatus::oversize;
  body.assign(len, '\0');
  if (len == 0) return ReadStatus::ok;
  return read_exact(fd, body.data(), len, deadline);
}

std::string encode_message(const std::string& type, std::uint64_t id, jsonlite::Object body) {
  body["type"] = type;
  body["id"] = id;
  return jsonlite::to_json(jsonlite::Value{std::move(body)});
}

std::optional<Message> decode_message(const std::string& frame_body, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(frame_body, &err);
  if (err) {
    if (error) *error = "malformed frame: " + err->message;
    return std::nullopt;
  }
  Message m;
  m.type = jsonlite::get_string(obj, "type");
  if (m.type.empty()) {
    if (error) *error = "malformed frame: missing type";
    return std::nullopt;
  }
  m.id = jsonlite::get_u64(obj, "id");
  m.body = std::move(obj);
  return m;
}

}  // namespace protocol
}  // namespace gradebox
