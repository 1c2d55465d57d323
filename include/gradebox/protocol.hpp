#pragma once

// gradebox/protocol.hpp — Host <-> worker message channel.
//
// FRAMING (PROTOCOL_FRAMING_VERSION = 1):
//   [4-byte big-endian body length][JSON object body]
//   Bodies larger than kMaxFrameBytes are a protocol error; the reader stops
//   consuming the stream and the supervisor replaces the worker.
//
// MESSAGES: every body has {"type": ..., "id": <u64>}. The id correlates a
// response with the request that caused it; replies to a stale id (e.g. a
// result arriving after the host gave up waiting) are discarded.
//
//   host -> worker          worker -> host
//   init  {image}           ready {protocol, runtime, libPrefix}
//   run   {source, tests,   result {stdout, stderr, outcomes, userTests,
//          timeLimitMs,             interrupted, durationMs}
//          memLimitMb}
//   ping  {nonce}           ack   {nonce}
//   (any)                   error {message}

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "gradebox/jsonlite.hpp"

namespace gradebox {
namespace protocol {

constexpr std::uint32_t kMaxFrameBytes = 64u * 1024u * 1024u;

std::string encode_frame(const std::string& body);

// Incremental decoder for a byte stream of frames.
class FrameDecoder {
 public:
  void feed(const char* data, std::size_t n);
  // Next complete frame body, if any. Once an oversize header is seen the
  // decoder is poisoned and yields nothing further.
  std::optional<std::string> next();
  bool poisoned() const { return poisoned_; }
  std::size_t buffered() const { return buf_.size(); }

 private:
  std::string buf_;
  bool poisoned_{false};
};

enum class ReadStatus { ok, timeout, closed, oversize, io_error };

std::string to_string(ReadStatus s);

// Blocking write of one frame. Retries on EINTR and short writes.
bool write_frame(int fd, const std::string& body);

// Read one frame, waiting at most until deadline (none = wait forever).
ReadStatus read_frame(int fd, std::string& body,
                      std::optional<std::chrono::steady_clock::time_point> deadline);

struct Message {
  std::string type;
  std::uint64_t id{0};
  jsonlite::Object body;  // includes type and id
};

std::string encode_message(const std::string& type, std::uint64_t id, jsonlite::Object body);
std::optional<Message> decode_message(const std::string& frame_body, std::string* error);

}  // namespace protocol
}  // namespace gradebox
