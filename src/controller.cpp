#include "gradebox/controller.hpp"

#include <chrono>

#include "gradebox/guest_runtime.hpp"
#include "gradebox/harness.hpp"
#include "gradebox/introspect.hpp"
#include "gradebox/policy.hpp"
#include "gradebox/postprocess.hpp"
#include "gradebox/snapshot.hpp"

namespace gradebox {
namespace guest {

namespace {

constexpr const char* kExecName = "__gradebox_exec__";
constexpr const char* kSourceFile = "solution.py";

PyRef fresh_namespace() {
  PyRef ns(PyDict_New());
  if (!ns) return ns;
  PyRef name(PyUnicode_FromString(kExecName));
  PyRef file(PyUnicode_FromString(kSourceFile));
  PyRef builtins(PyImport_ImportModule("builtins"));
  if (!name || !file || !builtins || PyDict_SetItemString(ns.get(), "__name__", name.get()) < 0 ||
      PyDict_SetItemString(ns.get(), "__file__", file.get()) < 0 ||
      PyDict_SetItemString(ns.get(), "__builtins__", builtins.get()) < 0) {
    return PyRef();
  }
  return ns;
}

class RunState {
 public:
  RunState(CaptureGuard& capture, PyObject* ns) : capture_(capture), ns_(ns) {}

  bool snapshot_emitted() const {
    return capture_.stdout_text().find(kVizStartMarker) != std::string::npos;
  }

  void dump_snapshot(const std::set<std::string>& excluded) {
    GuestGraph graph = capture_graph(ns_, last_instance.get(), excluded);
    SnapshotOptions opts;
    opts.excluded_names = excluded;
    StructureSerializer serializer(graph, opts);
    if (auto payload = serializer.build()) capture_.write_stdout(format_payload_block(*payload));
  }

  void dump_if_absent(const std::set<std::string>& excluded) {
    if (!snapshot_emitted()) dump_snapshot(excluded);
  }

  PyRef last_instance;

 private:
  CaptureGuard& capture_;
  PyObject* ns_;
};

std::vector<TestOutcome> fail_all(const std::vector<TestCase>& cases, const std::string& error_text) {
  std::vector<TestOutcome> out;
  out.reserve(cases.size());
  for (const auto& tc : cases) {
    TestOutcome o;
    o.id = tc.id;
    o.target_name = tc.target_name;
    o.error_text = error_text;
    out.push_back(std::move(o));
  }
  return out;
}

// Prints the pending exception unless it is SystemExit, which is cleared.
std::string report_uncaught() {
  if (PyErr_ExceptionMatches(PyExc_SystemExit)) {
    PyErr_Clear();
    return "";
  }
  return print_exception();
}

void run_user_tests(PyObject* ns, RunState& state, std::vector<UserTestOutcome>& out) {
  PyObject* tests = PyDict_GetItemString(ns, "USER_TESTS");
  if (!tests || !PyList_Check(tests)) return;
  PyRef entries(PySequence_List(tests));
  if (!entries) {
    PyErr_Clear();
    return;
  }
  const Py_ssize_t n = PyList_GET_SIZE(entries.get());
  for (Py_ssize_t i = 0; i < n; ++i) {
    PyObject* fn = PyList_GET_ITEM(entries.get(), i);
    if (!PyCallable_Check(fn)) continue;
    if (interrupt_reason() != InterruptReason::none) break;

    UserTestOutcome u;
    PyRef name(PyObject_GetAttrString(fn, "__name__"));
    if (name && PyUnicode_Check(name.get())) {
      u.name = str_of(name.get(), "unknown");
    } else {
      PyErr_Clear();
      u.name = "unknown";
    }

    PyRef result(PyObject_CallNoArgs(fn));
    if (result) {
      u.status = "pass";
      out.push_back(std::move(u));
      continue;
    }
    if (interrupt_reason() != InterruptReason::none) {
      PyErr_Clear();
      u.status = "error";
      u.error_text = "Execution interrupted";
      out.push_back(std::move(u));
      break;
    }
    u.status = PyErr_ExceptionMatches(PyExc_AssertionError) ? "fail" : "error";
    u.error_text = take_exception_message();
    out.push_back(std::move(u));
    state.dump_snapshot({"USER_TESTS"});
  }
}

}  // namespace

const std::set<std::string>& infrastructure_names() {
  static const std::set<std::string> kNames = {
      "USER_TESTS", "test_results", "test_output", "run_test", "sys",    "io",   "json",
      "time",       "traceback",    "re",          "collections", "unittest", "os", "math",
  };
  return kNames;
}

RawRunResult run_program(const std::string& source_text, const std::vector<TestCase>& test_cases,
                         const InterruptCell* cell) {
  const auto start = std::chrono::steady_clock::now();
  RawRunResult out;

  {
    CaptureGuard capture;
    PyRef ns = fresh_namespace();
    if (!capture.active() || !ns) {
      const std::string why = "worker could not prepare the run: " + take_exception_text();
      out.stderr_text = why;
      out.outcomes = fail_all(test_cases, why);
      return out;
    }
    RunState state(capture, ns.get());

    if (auto violation = find_policy_violation(source_text)) {
      const std::string message = policy_violation_message(*violation);
      PyErr_SetString(PyExc_ImportError, message.c_str());
      print_exception();
      out.outcomes = fail_all(test_cases, "ImportError: " + message);
    } else {
      install_interrupt_hook(cell);

      PyRef result;
      if (source_text.find('\0') != std::string::npos) {
        PyErr_SetString(PyExc_SyntaxError, "source code string cannot contain null bytes");
      } else {
        PyRef code(Py_CompileString(source_text.c_str(), kSourceFile, Py_file_input));
        if (code) result = PyRef(PyEval_EvalCode(code.get(), ns.get(), ns.get()));
      }

      if (result) {
        if (!test_cases.empty()) {
          HarnessRun harness = run_harness(ns.get(), test_cases);
          out.outcomes = std::move(harness.outcomes);
          state.last_instance = std::move(harness.last_instance);
        }
        run_user_tests(ns.get(), state, out.user_tests);
        remove_interrupt_hook();

        bool any_failed = false;
        for (const auto& o : out.outcomes) any_failed = any_failed || !o.passed;
        if (any_failed && interrupt_reason() == InterruptReason::none) {
          state.dump_if_absent(infrastructure_names());
        }
      } else {
        remove_interrupt_hook();
        const bool interrupted = interrupt_reason() != InterruptReason::none;
        const bool system_exit = PyErr_ExceptionMatches(PyExc_SystemExit);
        const std::string text = report_uncaught();
        if (!system_exit) {
          out.outcomes = fail_all(test_cases, interrupted ? "Execution interrupted" : text);
          if (!interrupted) state.dump_if_absent({});
        } else if (!test_cases.empty()) {
          out.outcomes = fail_all(test_cases, "SystemExit");
        }
      }
    }

    out.stdout_text = capture.stdout_text();
    out.stderr_text = capture.stderr_text();
    out.interrupted = interrupt_reason() != InterruptReason::none;
  }

  if (PyErr_Occurred()) PyErr_Clear();
  PyGC_Collect();
  out.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  return out;
}

}  // namespace guest
}  // namespace gradebox
