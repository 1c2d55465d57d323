#include "gradebox/harness.hpp"

#include <chrono>
#include <string>

namespace gradebox {
namespace guest {

namespace {

constexpr const char* kInterrupted = "Execution interrupted";

PyRef lookup(PyObject* namespace_dict, const std::string& name) {
  return PyRef::borrow(PyDict_GetItemString(namespace_dict, name.c_str()));
}

PyRef args_tuple(const jsonlite::Array& args, std::string* error) {
  PyRef tuple(PyTuple_New(static_cast<Py_ssize_t>(args.size())));
  if (!tuple) {
    *error = take_exception_text();
    return tuple;
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    PyRef item = to_python(args[i]);
    if (!item) {
      *error = take_exception_text();
      return PyRef();
    }
    PyTuple_SET_ITEM(tuple.get(), static_cast<Py_ssize_t>(i), item.release());
  }
  return tuple;
}

// Calls target(*args); on failure fills out.error_text and returns null.
PyRef call_with(PyObject* target, const jsonlite::Array& args, TestOutcome& out) {
  std::string error;
  PyRef tuple = args_tuple(args, &error);
  if (!tuple) {
    out.error_text = error;
    return tuple;
  }
  PyRef result(PyObject_Call(target, tuple.get(), nullptr));
  if (!result) out.error_text = take_exception_text();
  return result;
}

// Without an expected value a completed call passes, unless the comparison
// is mandatory (operation sequences compare against null).
void judge(TestOutcome& out, PyObject* received, const std::optional<jsonlite::Value>& expected,
           bool always_compare) {
  out.received_value = to_json(received);
  if (!expected && !always_compare) {
    out.passed = true;
    return;
  }
  out.expected_value = expected;
  PyRef want = expected ? to_python(*expected) : PyRef::borrow(Py_None);
  if (!want) {
    out.error_text = take_exception_text();
    out.passed = false;
    return;
  }
  const int eq = PyObject_RichCompareBool(received, want.get(), Py_EQ);
  if (eq < 0) {
    out.error_text = take_exception_text();
    out.passed = false;
    return;
  }
  out.passed = eq == 1;
}

void run_plain_function(PyObject* ns, const TestCase& tc, TestOutcome& out) {
  PyRef fn = lookup(ns, tc.target_name);
  if (!fn) {
    out.error_text = "Function " + tc.target_name + " not found";
    return;
  }
  PyRef received = call_with(fn.get(), tc.arguments, out);
  if (received) judge(out, received.get(), tc.expected_value, false);
}

void run_instance_method(PyObject* ns, const TestCase& tc, TestOutcome& out, PyRef& last_instance) {
  PyRef cls = lookup(ns, tc.class_name);
  if (!cls) {
    out.error_text = "Class " + tc.class_name + " not found";
    return;
  }
  PyRef instance(PyObject_CallNoArgs(cls.get()));
  if (!instance) {
    out.error_text = take_exception_text();
    return;
  }
  last_instance = instance;

  PyRef method(PyObject_GetAttrString(instance.get(), tc.target_name.c_str()));
  if (!method) {
    PyErr_Clear();
    out.error_text = "Method " + tc.target_name + " missing";
    return;
  }
  PyRef received = call_with(method.get(), tc.arguments, out);
  if (received) judge(out, received.get(), tc.expected_value, false);
}

void run_operation_sequence(PyObject* ns, const TestCase& tc, TestOutcome& out, PyRef& last_instance) {
  if (tc.arguments.size() < 2 || !tc.arguments[0].is_array() || !tc.arguments[1].is_array() ||
      tc.arguments[0].as_array().empty() || !tc.arguments[0].as_array()[0].is_string()) {
    out.error_text = "operation-sequence arguments must be [operations, argument_lists]";
    return;
  }
  const jsonlite::Array& operations = tc.arguments[0].as_array();
  const jsonlite::Array& argument_lists = tc.arguments[1].as_array();
  static const jsonlite::Array kNoArgs;
  auto args_at = [&](std::size_t i) -> const jsonlite::Array& {
    if (i < argument_lists.size() && argument_lists[i].is_array()) return argument_lists[i].as_array();
    return kNoArgs;
  };

  const std::string class_name = operations[0].as_string();
  PyRef cls = lookup(ns, class_name);
  if (!cls) {
    out.error_text = "Class " + class_name + " not found";
    return;
  }
  PyRef instance = call_with(cls.get(), args_at(0), out);
  if (!instance) return;
  last_instance = instance;

  PyRef received(PyList_New(0));
  if (!received || PyList_Append(received.get(), Py_None) < 0) {
    out.error_text = take_exception_text();
    return;
  }
  for (std::size_t i = 1; i < operations.size(); ++i) {
    const std::string method_name =
        operations[i].is_string() ? operations[i].as_string() : jsonlite::to_json(operations[i]);
    PyRef method(PyObject_GetAttrString(instance.get(), method_name.c_str()));
    if (!method) {
      PyErr_Clear();
      out.error_text = "Method " + method_name + " missing";
      return;
    }
    PyRef result = call_with(method.get(), args_at(i), out);
    if (!result) return;
    if (PyList_Append(received.get(), result.get()) < 0) {
      out.error_text = take_exception_text();
      return;
    }
  }
  judge(out, received.get(), tc.expected_value, true);
}

// Text of the reason a case cannot be run as described, or empty.
std::string shape_error(const TestCase& tc) {
  if (!tc.metadata_error.empty()) return tc.metadata_error;
  switch (tc.entry_kind) {
    case EntryKind::plain_function:
      if (tc.target_name.empty()) return "test case is missing its target name";
      break;
    case EntryKind::instance_method:
      if (tc.target_name.empty()) return "test case is missing its target name";
      if (tc.class_name.empty()) return "instance-method test case is missing className";
      break;
    case EntryKind::operation_sequence:
      break;
  }
  return "";
}

}  // namespace

HarnessRun run_harness(PyObject* namespace_dict, const std::vector<TestCase>& cases) {
  HarnessRun run;
  run.outcomes.reserve(cases.size());
  for (const auto& tc : cases) {
    TestOutcome out;
    out.id = tc.id;
    out.target_name = tc.target_name;

    if (interrupt_reason() != InterruptReason::none) {
      out.error_text = kInterrupted;
      run.outcomes.push_back(std::move(out));
      continue;
    }

    if (std::string why = shape_error(tc); !why.empty()) {
      out.error_text = std::move(why);
      run.outcomes.push_back(std::move(out));
      continue;
    }

    const auto start = std::chrono::steady_clock::now();
    switch (tc.entry_kind) {
      case EntryKind::plain_function:
        run_plain_function(namespace_dict, tc, out);
        break;
      case EntryKind::instance_method:
        run_instance_method(namespace_dict, tc, out, run.last_instance);
        break;
      case EntryKind::operation_sequence:
        run_operation_sequence(namespace_dict, tc, out, run.last_instance);
        break;
    }
    if (PyErr_Occurred()) PyErr_Clear();
    out.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (!out.passed && out.error_text && interrupt_reason() != InterruptReason::none) {
      out.error_text = kInterrupted;
    }
    run.outcomes.push_back(std::move(out));
  }
  return run;
}

}  // namespace guest
}  // namespace gradebox
