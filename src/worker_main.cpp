// gradebox_worker — guest execution process.
//
// Started by WorkerSupervisor with
//   gradebox_worker --in-fd N --out-fd M [--interrupt-fd K]
// and driven entirely by frames on those descriptors. Exits when the host
// closes its end of the channel or sends "shutdown".

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "gradebox/controller.hpp"
#include "gradebox/guest_runtime.hpp"
#include "gradebox/interrupt.hpp"
#include "gradebox/jsonlite.hpp"
#include "gradebox/protocol.hpp"
#include "gradebox/types.hpp"
#include "gradebox/version.hpp"

namespace {

// Captured streams beyond this are cut before framing; the host truncates
// far below it anyway.
constexpr std::size_t kMaxStreamBytes = gradebox::protocol::kMaxFrameBytes / 8;

struct WorkerArgs {
  int in_fd{-1};
  int out_fd{-1};
  int interrupt_fd{-1};
};

std::optional<WorkerArgs> parse_args(int argc, char** argv) {
  WorkerArgs a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) return std::nullopt;
    const int value = std::atoi(argv[i + 1]);
    if (arg == "--in-fd") {
      a.in_fd = value;
    } else if (arg == "--out-fd") {
      a.out_fd = value;
    } else if (arg == "--interrupt-fd") {
      a.interrupt_fd = value;
    } else {
      return std::nullopt;
    }
    ++i;
  }
  if (a.in_fd < 0 || a.out_fd < 0) return std::nullopt;
  return a;
}

void cap_stream(std::string& s) {
  if (s.size() > kMaxStreamBytes) s.resize(kMaxStreamBytes);
}

class Worker {
 public:
  Worker(WorkerArgs args, std::optional<gradebox::InterruptCell> cell)
      : args_(args), cell_(std::move(cell)) {}

  int run() {
    for (;;) {
      std::string body;
      const auto st = gradebox::protocol::read_frame(args_.in_fd, body, std::nullopt);
      if (st == gradebox::protocol::ReadStatus::closed) return 0;
      if (st != gradebox::protocol::ReadStatus::ok) {
        std::fprintf(stderr, "[gradebox_worker] channel %s\n", gradebox::protocol::to_string(st).c_str());
        return 1;
      }
      std::string error;
      auto msg = gradebox::protocol::decode_message(body, &error);
      if (!msg) {
        if (!reply_error(0, error)) return 1;
        continue;
      }
      if (msg->type == "shutdown") return 0;
      if (!dispatch(*msg)) return 1;
    }
  }

 private:
  bool send(const std::string& type, std::uint64_t id, gradebox::jsonlite::Object body) {
    return gradebox::protocol::write_frame(args_.out_fd,
                                           gradebox::protocol::encode_message(type, id, std::move(body)));
  }

  bool reply_error(std::uint64_t id, const std::string& message) {
    gradebox::jsonlite::Object body;
    body["message"] = message;
    return send("error", id, std::move(body));
  }

  bool dispatch(const gradebox::protocol::Message& msg) {
    if (msg.type == "init") return on_init(msg);
    if (msg.type == "run") return on_run(msg);
    if (msg.type == "ping") {
      gradebox::jsonlite::Object body;
      body["nonce"] = gradebox::jsonlite::get_string(msg.body, "nonce");
      return send("ack", msg.id, std::move(body));
    }
    return reply_error(msg.id, "unknown message type '" + msg.type + "'");
  }

  bool on_init(const gradebox::protocol::Message& msg) {
    const auto info = gradebox::guest::init_runtime(gradebox::jsonlite::get_string(msg.body, "image"));
    if (!info.ok) return reply_error(msg.id, info.error);
    gradebox::jsonlite::Object body;
    body["protocol"] = static_cast<std::uint64_t>(gradebox::version::PROTOCOL_FRAMING_VERSION);
    body["runtime"] = info.version;
    body["libPrefix"] = info.lib_prefix;
    return send("ready", msg.id, std::move(body));
  }

  bool on_run(const gradebox::protocol::Message& msg) {
    if (!gradebox::guest::runtime_ready()) return reply_error(msg.id, "runtime not initialized");

    std::vector<gradebox::TestCase> cases;
    if (const auto* tests = gradebox::jsonlite::find(msg.body, "tests"); tests && tests->is_array()) {
      for (const auto& t : tests->as_array()) cases.push_back(gradebox::test_case_from_json(t));
    }

    gradebox::RawRunResult raw = gradebox::guest::run_program(gradebox::jsonlite::get_string(msg.body, "source"),
                                                              cases, cell_ ? &*cell_ : nullptr);
    cap_stream(raw.stdout_text);
    cap_stream(raw.stderr_text);

    gradebox::jsonlite::Value v = gradebox::raw_result_to_json(raw);
    return send("result", msg.id, std::move(v.as_object()));
  }

  WorkerArgs args_;
  std::optional<gradebox::InterruptCell> cell_;
};

}  // namespace

int main(int argc, char** argv) {
  auto args = parse_args(argc, argv);
  if (!args) {
    std::cerr << "usage: gradebox_worker --in-fd N --out-fd M [--interrupt-fd K]\n";
    return 2;
  }

  std::optional<gradebox::InterruptCell> cell;
  if (args->interrupt_fd >= 0) {
    cell = gradebox::InterruptCell::attach(args->interrupt_fd);
    if (!cell) std::fprintf(stderr, "[gradebox_worker] interrupt cell unavailable, running without it\n");
  }

  Worker worker(*args, std::move(cell));
  const int rc = worker.run();
  if (gradebox::guest::runtime_ready()) Py_FinalizeEx();
  return rc;
}
