#pragma once

// gradebox/guest_runtime.hpp — Embedded CPython for the worker process.
//
// Everything in this header runs inside gradebox_worker on the thread that
// initialized the interpreter, with the GIL held.
//
// SAFE POINTS: install_interrupt_hook() registers a C trace function that
// reads the shared InterruptCell on every line/call event of guest code. A
// set cell raises KeyboardInterrupt("Execution interrupted"), which is a
// BaseException, so guest `except Exception` blocks do not swallow it; a
// bare `except:` only delays it to the next line.

#include <Python.h>

#include <optional>
#include <string>

#include "gradebox/interrupt.hpp"
#include "gradebox/jsonlite.hpp"

namespace gradebox {
namespace guest {

// Owning reference to a PyObject. Steals the reference it is constructed
// with; use PyRef::borrow for borrowed references.
class PyRef {
 public:
  PyRef() = default;
  explicit PyRef(PyObject* owned) : obj_(owned) {}
  static PyRef borrow(PyObject* borrowed) {
    Py_XINCREF(borrowed);
    return PyRef(borrowed);
  }

  PyRef(const PyRef& other) : obj_(other.obj_) { Py_XINCREF(obj_); }
  PyRef& operator=(const PyRef& other) {
    if (this != &other) {
      Py_XINCREF(other.obj_);
      Py_XDECREF(obj_);
      obj_ = other.obj_;
    }
    return *this;
  }
  PyRef(PyRef&& other) noexcept : obj_(other.obj_) { other.obj_ = nullptr; }
  PyRef& operator=(PyRef&& other) noexcept {
    if (this != &other) {
      Py_XDECREF(obj_);
      obj_ = other.obj_;
      other.obj_ = nullptr;
    }
    return *this;
  }
  ~PyRef() { Py_XDECREF(obj_); }

  PyObject* get() const { return obj_; }
  PyObject* release() {
    PyObject* o = obj_;
    obj_ = nullptr;
    return o;
  }
  explicit operator bool() const { return obj_ != nullptr; }

 private:
  PyObject* obj_{nullptr};
};

struct RuntimeInfo {
  bool ok{false};
  std::string error;
  std::string version;     // Py_GetVersion()
  std::string lib_prefix;  // sysconfig stdlib directory
};

// Initializes an isolated interpreter (no environment variables, no user
// site). `image` is the runtime home (PYTHONHOME layout); empty uses the
// build-time default. Safe to call again; later calls report the existing
// runtime.
RuntimeInfo init_runtime(const std::string& image);
bool runtime_ready();

void install_interrupt_hook(const InterruptCell* cell);
void remove_interrupt_hook();
// Reason observed on the installed cell, none without a cell.
InterruptReason interrupt_reason();

// Swaps sys.stdout/sys.stderr for io.StringIO buffers for its lifetime.
class CaptureGuard {
 public:
  CaptureGuard();
  ~CaptureGuard();
  CaptureGuard(const CaptureGuard&) = delete;
  CaptureGuard& operator=(const CaptureGuard&) = delete;

  bool active() const { return active_; }
  std::string stdout_text() const;
  std::string stderr_text() const;
  // Writes to the captured stream through its write() method.
  void write_stdout(const std::string& text);

 private:
  PyRef saved_stdout_;
  PyRef saved_stderr_;
  PyRef out_;
  PyRef err_;
  bool active_{false};
};

PyRef to_python(const jsonlite::Value& v);
// Lossy conversion of a guest value for reporting: containers recurse, other
// objects become their str() text.
jsonlite::Value to_json(PyObject* obj);

// "TypeName: message" for the pending exception (or just "TypeName"), and
// clears it.
std::string take_exception_text();
// str(exception) for the pending exception, and clears it.
std::string take_exception_message();
// Prints the pending exception with its traceback to sys.stderr, clears it,
// and returns its "TypeName: message" text. SystemExit is printed like any
// other exception, never acted upon.
std::string print_exception();

// str(obj), or fallback when str() raises.
std::string str_of(PyObject* obj, const std::string& fallback = "<unprintable>");

}  // namespace guest
}  // namespace gradebox
