#include "gradebox/guest_runtime.hpp"

#include <cstdint>
#include <unordered_set>

namespace gradebox {
namespace guest {

namespace {

constexpr int kMaxJsonDepth = 64;
constexpr std::size_t kMaxJsonElements = 10000;

bool g_initialized = false;
RuntimeInfo g_info;
const InterruptCell* g_cell = nullptr;

std::string utf8_of(PyObject* s) {
  Py_ssize_t n = 0;
  const char* c = PyUnicode_AsUTF8AndSize(s, &n);
  if (c) return std::string(c, static_cast<std::size_t>(n));
  // Lone surrogates cannot be encoded strictly.
  PyErr_Clear();
  PyRef bytes(PyUnicode_AsEncodedString(s, "utf-8", "replace"));
  if (!bytes) {
    PyErr_Clear();
    return "";
  }
  return std::string(PyBytes_AS_STRING(bytes.get()), static_cast<std::size_t>(PyBytes_GET_SIZE(bytes.get())));
}

PyRef unicode_of(const std::string& s) {
  return PyRef(PyUnicode_DecodeUTF8(s.data(), static_cast<Py_ssize_t>(s.size()), "replace"));
}

std::string status_text(const PyStatus& st) {
  std::string out = st.func ? st.func : "";
  if (st.err_msg) {
    if (!out.empty()) out += ": ";
    out += st.err_msg;
  }
  return out.empty() ? "interpreter initialization failed" : out;
}

std::string stdlib_directory() {
  PyRef sysconfig(PyImport_ImportModule("sysconfig"));
  if (!sysconfig) {
    PyErr_Clear();
    return "";
  }
  PyRef path(PyObject_CallMethod(sysconfig.get(), "get_path", "s", "stdlib"));
  if (!path || !PyUnicode_Check(path.get())) {
    PyErr_Clear();
    return "";
  }
  return utf8_of(path.get());
}

int trace_hook(PyObject*, PyFrameObject*, int what, PyObject*) {
  if (what != PyTrace_LINE && what != PyTrace_CALL) return 0;
  if (!g_cell || g_cell->load() == InterruptReason::none) return 0;
  PyErr_SetString(PyExc_KeyboardInterrupt, "Execution interrupted");
  return -1;
}

// Guest values reported back as JSON. Containers already on the current path
// become "[...]" / "{...}" (as repr() prints them), and the total number of
// emitted values is bounded so shared sub-structures cannot blow up.
class JsonEncoder {
 public:
  jsonlite::Value encode(PyObject* obj) { return at(obj, 0); }

 private:
  jsonlite::Value at(PyObject* obj, int depth) {
    if (obj == Py_None) return jsonlite::Value{};
    if (PyBool_Check(obj)) return jsonlite::Value{obj == Py_True};
    if (PyLong_Check(obj)) {
      int overflow = 0;
      const long long n = PyLong_AsLongLongAndOverflow(obj, &overflow);
      if (overflow == 0 && !PyErr_Occurred()) return jsonlite::Value{static_cast<std::int64_t>(n)};
      PyErr_Clear();
      return jsonlite::Value{str_of(obj)};
    }
    if (PyFloat_Check(obj)) return jsonlite::Value{PyFloat_AS_DOUBLE(obj)};
    if (PyUnicode_Check(obj)) return jsonlite::Value{utf8_of(obj)};

    const bool sequence = PyList_Check(obj) || PyTuple_Check(obj) || PyAnySet_Check(obj);
    if (!sequence && !PyDict_Check(obj)) return jsonlite::Value{str_of(obj)};
    if (depth >= kMaxJsonDepth || path_.count(obj)) {
      return jsonlite::Value{std::string(PyDict_Check(obj) ? "{...}" : "[...]")};
    }

    path_.insert(obj);
    jsonlite::Value out = PyDict_Check(obj) ? mapping(obj, depth) : items(obj, depth);
    path_.erase(obj);
    return out;
  }

  // Accounts one emitted element; false once the budget is spent.
  bool take() {
    if (emitted_ >= kMaxJsonElements) return false;
    ++emitted_;
    return true;
  }

  jsonlite::Value items(PyObject* obj, int depth) {
    jsonlite::Array a;
    // Walk a snapshot: element conversion may run guest __str__.
    PyRef copy(PySequence_List(obj));
    if (!copy) {
      PyErr_Clear();
      return jsonlite::Value{std::move(a)};
    }
    const Py_ssize_t n = PyList_GET_SIZE(copy.get());
    for (Py_ssize_t i = 0; i < n && take(); ++i) a.push_back(at(PyList_GET_ITEM(copy.get(), i), depth + 1));
    return jsonlite::Value{std::move(a)};
  }

  jsonlite::Value mapping(PyObject* obj, int depth) {
    jsonlite::Object o;
    PyRef pairs(PyDict_Items(obj));
    if (!pairs) {
      PyErr_Clear();
      return jsonlite::Value{std::move(o)};
    }
    const Py_ssize_t n = PyList_GET_SIZE(pairs.get());
    for (Py_ssize_t i = 0; i < n && take(); ++i) {
      PyObject* pair = PyList_GET_ITEM(pairs.get(), i);
      PyObject* key = PyTuple_GET_ITEM(pair, 0);
      const std::string k = PyUnicode_Check(key) ? utf8_of(key) : str_of(key);
      o[k] = at(PyTuple_GET_ITEM(pair, 1), depth + 1);
    }
    return jsonlite::Value{std::move(o)};
  }

  std::unordered_set<PyObject*> path_;
  std::size_t emitted_{0};
};

}  // namespace

RuntimeInfo init_runtime(const std::string& image) {
  if (g_initialized) return g_info;

  RuntimeInfo info;
  PyConfig config;
  PyConfig_InitIsolatedConfig(&config);
  config.install_signal_handlers = 0;
  config.write_bytecode = 0;

  if (!image.empty()) {
    PyStatus st = PyConfig_SetBytesString(&config, &config.home, image.c_str());
    if (PyStatus_Exception(st)) {
      PyConfig_Clear(&config);
      info.error = "invalid runtime image path: " + status_text(st);
      return info;
    }
  }
  PyStatus st = Py_InitializeFromConfig(&config);
  PyConfig_Clear(&config);
  if (PyStatus_Exception(st)) {
    info.error = status_text(st);
    return info;
  }

  const std::string version = Py_GetVersion();
  info.ok = true;
  info.version = version.substr(0, version.find(' '));
  info.lib_prefix = stdlib_directory();
  g_info = info;
  g_initialized = true;
  return info;
}

bool runtime_ready() { return g_initialized; }

void install_interrupt_hook(const InterruptCell* cell) {
  g_cell = cell;
  PyEval_SetTrace(trace_hook, nullptr);
}

void remove_interrupt_hook() { PyEval_SetTrace(nullptr, nullptr); }

InterruptReason interrupt_reason() { return g_cell ? g_cell->load() : InterruptReason::none; }

CaptureGuard::CaptureGuard() {
  PyRef io(PyImport_ImportModule("io"));
  if (!io) {
    PyErr_Clear();
    return;
  }
  out_ = PyRef(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  err_ = PyRef(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  if (!out_ || !err_) {
    PyErr_Clear();
    return;
  }
  saved_stdout_ = PyRef::borrow(PySys_GetObject("stdout"));
  saved_stderr_ = PyRef::borrow(PySys_GetObject("stderr"));
  if (PySys_SetObject("stdout", out_.get()) < 0 || PySys_SetObject("stderr", err_.get()) < 0) {
    PyErr_Clear();
    PySys_SetObject("stdout", saved_stdout_ ? saved_stdout_.get() : Py_None);
    PySys_SetObject("stderr", saved_stderr_ ? saved_stderr_.get() : Py_None);
    return;
  }
  active_ = true;
}

CaptureGuard::~CaptureGuard() {
  if (!active_) return;
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* tb = nullptr;
  PyErr_Fetch(&type, &value, &tb);
  if (PySys_SetObject("stdout", saved_stdout_ ? saved_stdout_.get() : Py_None) < 0) PyErr_Clear();
  if (PySys_SetObject("stderr", saved_stderr_ ? saved_stderr_.get() : Py_None) < 0) PyErr_Clear();
  PyErr_Restore(type, value, tb);
}

namespace {

std::string buffer_value(const PyRef& buf) {
  if (!buf) return "";
  PyRef v(PyObject_CallMethod(buf.get(), "getvalue", nullptr));
  if (!v || !PyUnicode_Check(v.get())) {
    PyErr_Clear();
    return "";
  }
  return utf8_of(v.get());
}

void buffer_write(const PyRef& buf, const std::string& text) {
  if (!buf) return;
  PyRef s = unicode_of(text);
  if (!s) {
    PyErr_Clear();
    return;
  }
  PyRef r(PyObject_CallMethod(buf.get(), "write", "O", s.get()));
  if (!r) PyErr_Clear();
}

}  // namespace

std::string CaptureGuard::stdout_text() const { return buffer_value(out_); }
std::string CaptureGuard::stderr_text() const { return buffer_value(err_); }
void CaptureGuard::write_stdout(const std::string& text) { buffer_write(out_, text); }

PyRef to_python(const jsonlite::Value& v) {
  if (v.is_null()) return PyRef::borrow(Py_None);
  if (v.is_bool()) return PyRef(PyBool_FromLong(v.as_bool() ? 1 : 0));
  if (v.is_int()) return PyRef(PyLong_FromLongLong(static_cast<long long>(v.as_int())));
  if (v.is_double()) return PyRef(PyFloat_FromDouble(v.as_double()));
  if (v.is_string()) return unicode_of(v.as_string());
  if (v.is_array()) {
    const auto& a = v.as_array();
    PyRef list(PyList_New(static_cast<Py_ssize_t>(a.size())));
    if (!list) return list;
    for (std::size_t i = 0; i < a.size(); ++i) {
      PyRef item = to_python(a[i]);
      if (!item) return PyRef();
      PyList_SET_ITEM(list.get(), static_cast<Py_ssize_t>(i), item.release());
    }
    return list;
  }
  PyRef dict(PyDict_New());
  if (!dict) return dict;
  for (const auto& [key, value] : v.as_object()) {
    PyRef item = to_python(value);
    if (!item || PyDict_SetItemString(dict.get(), key.c_str(), item.get()) < 0) return PyRef();
  }
  return dict;
}

jsonlite::Value to_json(PyObject* obj) {
  if (!obj) return jsonlite::Value{};
  JsonEncoder encoder;
  return encoder.encode(obj);
}

std::string take_exception_text() {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* tb = nullptr;
  PyErr_Fetch(&type, &value, &tb);
  if (!type) return "";
  PyErr_NormalizeException(&type, &value, &tb);
  PyRef t(type), v(value), b(tb);
  const std::string name = PyType_Check(type) ? reinterpret_cast<PyTypeObject*>(type)->tp_name : "Exception";
  const std::string message = v ? str_of(v.get(), "") : "";
  return message.empty() ? name : name + ": " + message;
}

std::string take_exception_message() {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* tb = nullptr;
  PyErr_Fetch(&type, &value, &tb);
  if (!type) return "";
  PyErr_NormalizeException(&type, &value, &tb);
  PyRef t(type), v(value), b(tb);
  return v ? str_of(v.get(), "") : "";
}

std::string print_exception() {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* tb = nullptr;
  PyErr_Fetch(&type, &value, &tb);
  if (!type) return "";
  PyErr_NormalizeException(&type, &value, &tb);
  if (value && tb) PyException_SetTraceback(value, tb);

  const std::string name = PyType_Check(type) ? reinterpret_cast<PyTypeObject*>(type)->tp_name : "Exception";
  const std::string message = value ? str_of(value, "") : "";

  PyErr_Display(type, value, tb);
  Py_XDECREF(type);
  Py_XDECREF(value);
  Py_XDECREF(tb);
  PyErr_Clear();
  return message.empty() ? name : name + ": " + message;
}

std::string str_of(PyObject* obj, const std::string& fallback) {
  if (!obj) return fallback;
  PyRef s(PyObject_Str(obj));
  if (!s) {
    PyErr_Clear();
    return fallback;
  }
  return utf8_of(s.get());
}

}  // namespace guest
}  // namespace gradebox
