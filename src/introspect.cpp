#include "gradebox/introspect.hpp"

#include <cstdint>
#include <deque>
#include <limits>
#include <vector>

#include "gradebox/guest_runtime.hpp"

namespace gradebox {
namespace guest {

namespace {

GuestId id_of(PyObject* obj) { return static_cast<GuestId>(reinterpret_cast<std::uintptr_t>(obj)); }

GuestKind kind_of(PyObject* obj) {
  if (obj == Py_None) return GuestKind::none;
  if (PyBool_Check(obj)) return GuestKind::boolean;
  if (PyLong_Check(obj)) return GuestKind::integer;
  if (PyFloat_Check(obj)) return GuestKind::real;
  if (PyUnicode_Check(obj)) return GuestKind::text;
  if (PyList_Check(obj) || PyTuple_Check(obj)) return GuestKind::sequence;
  if (PyAnySet_Check(obj)) return GuestKind::set;
  if (PyDict_Check(obj)) return GuestKind::mapping;
  if (PyModule_Check(obj)) return GuestKind::module;
  if (PyType_Check(obj)) return GuestKind::type;
  if (PyCallable_Check(obj)) return GuestKind::callable;
  if (PyBytes_Check(obj) || PyByteArray_Check(obj) || PyComplex_Check(obj)) return GuestKind::other;
  return GuestKind::object;
}

bool expandable(GuestKind k) {
  return k == GuestKind::sequence || k == GuestKind::set || k == GuestKind::mapping || k == GuestKind::object;
}

class Recorder {
 public:
  Recorder(GuestGraph& graph, const IntrospectLimits& limits) : graph_(graph), limits_(limits) {}

  GuestId record(PyObject* obj);
  void drain();

 private:
  bool full() const { return graph_.size() >= limits_.max_values; }
  void expand(PyObject* obj);
  std::vector<GuestId> record_all(PyObject* list, std::size_t limit);
  std::vector<GuestAttribute> record_attributes(PyObject* obj, bool* has_dict);

  GuestGraph& graph_;
  IntrospectLimits limits_;
  std::vector<PyRef> keep_alive_;
  std::deque<PyObject*> queue_;
};

GuestId Recorder::record(PyObject* obj) {
  const GuestId id = id_of(obj);
  if (graph_.find(id) || full()) return id;

  keep_alive_.push_back(PyRef::borrow(obj));

  GuestValue v;
  v.id = id;
  v.kind = kind_of(obj);
  v.type_name = Py_TYPE(obj)->tp_name;
  v.tuple = PyTuple_Check(obj);

  if (v.kind == GuestKind::boolean) {
    v.integer = obj == Py_True ? 1 : 0;
  } else if (v.kind == GuestKind::integer) {
    int overflow = 0;
    const long long n = PyLong_AsLongLongAndOverflow(obj, &overflow);
    if (PyErr_Occurred()) PyErr_Clear();
    if (overflow > 0) {
      v.integer = std::numeric_limits<std::int64_t>::max();
    } else if (overflow < 0) {
      v.integer = std::numeric_limits<std::int64_t>::min();
    } else {
      v.integer = static_cast<std::int64_t>(n);
    }
  }

  v.text = clip_text(str_of(obj), v.is_primitive() ? limits_.max_primitive_text : limits_.max_text);

  const int truth = PyObject_IsTrue(obj);
  if (truth < 0) PyErr_Clear();
  v.truthy = truth != 0;

  if (v.kind == GuestKind::sequence || v.kind == GuestKind::set || v.kind == GuestKind::mapping ||
      v.kind == GuestKind::text) {
    const Py_ssize_t n = PyObject_Length(obj);
    if (n < 0) PyErr_Clear();
    v.length = n > 0 ? static_cast<std::size_t>(n) : 0;
  }

  const bool expand_later = expandable(v.kind);
  graph_.add(std::move(v));
  if (expand_later) queue_.push_back(obj);
  return id;
}

std::vector<GuestId> Recorder::record_all(PyObject* list, std::size_t limit) {
  std::vector<GuestId> ids;
  const Py_ssize_t n = PyList_GET_SIZE(list);
  for (Py_ssize_t i = 0; i < n && static_cast<std::size_t>(i) < limit; ++i) {
    ids.push_back(record(PyList_GET_ITEM(list, i)));
  }
  return ids;
}

std::vector<GuestAttribute> Recorder::record_attributes(PyObject* obj, bool* has_dict) {
  std::vector<GuestAttribute> attrs;
  std::set<std::string> seen;

  PyRef dict(PyObject_GetAttrString(obj, "__dict__"));
  if (!dict) PyErr_Clear();
  if (dict && PyDict_Check(dict.get())) {
    *has_dict = true;
    PyRef items(PyDict_Items(dict.get()));
    if (!items) PyErr_Clear();
    const Py_ssize_t n = items ? PyList_GET_SIZE(items.get()) : 0;
    for (Py_ssize_t i = 0; i < n && attrs.size() < limits_.max_items; ++i) {
      PyObject* pair = PyList_GET_ITEM(items.get(), i);
      PyObject* key = PyTuple_GET_ITEM(pair, 0);
      if (!PyUnicode_Check(key)) continue;
      GuestAttribute a;
      a.name = str_of(key, "");
      a.own = true;
      a.value = record(PyTuple_GET_ITEM(pair, 1));
      seen.insert(a.name);
      attrs.push_back(std::move(a));
    }
  }

  for (const auto& name : inspected_attribute_names()) {
    if (seen.count(name)) continue;
    PyRef value(PyObject_GetAttrString(obj, name.c_str()));
    if (!value) {
      PyErr_Clear();
      continue;
    }
    GuestAttribute a;
    a.name = name;
    a.value = record(value.get());
    attrs.push_back(std::move(a));
  }

  for (auto& a : attrs) {
    if (!is_size_or_index_attribute(a.name)) continue;
    PyRef value(PyObject_GetAttrString(obj, a.name.c_str()));
    if (!value) {
      PyErr_Clear();
      continue;
    }
    if (!PyCallable_Check(value.get()) || PyType_Check(value.get())) continue;
    PyRef result(PyObject_CallNoArgs(value.get()));
    if (!result) {
      PyErr_Clear();
      continue;
    }
    a.call_result = record(result.get());
  }
  return attrs;
}

void Recorder::expand(PyObject* obj) {
  GuestValue* v = graph_.find(id_of(obj));
  if (!v || v->expanded) return;
  const GuestKind kind = v->kind;

  std::vector<GuestId> items;
  std::vector<std::pair<GuestId, GuestId>> entries;
  std::vector<GuestAttribute> attrs;
  bool has_dict = false;

  if (kind == GuestKind::sequence || kind == GuestKind::set) {
    // Walk a copy: str() of an element may mutate the original.
    PyRef copy(PySequence_List(obj));
    if (!copy) {
      PyErr_Clear();
    } else {
      items = record_all(copy.get(), limits_.max_items);
    }
  } else if (kind == GuestKind::mapping) {
    PyRef pairs(PyDict_Items(obj));
    if (!pairs) PyErr_Clear();
    const Py_ssize_t n = pairs ? PyList_GET_SIZE(pairs.get()) : 0;
    for (Py_ssize_t i = 0; i < n && static_cast<std::size_t>(i) < limits_.max_items; ++i) {
      PyObject* pair = PyList_GET_ITEM(pairs.get(), i);
      const GuestId key = record(PyTuple_GET_ITEM(pair, 0));
      const GuestId value = record(PyTuple_GET_ITEM(pair, 1));
      entries.emplace_back(key, value);
    }
  } else {
    attrs = record_attributes(obj, &has_dict);
  }

  v = graph_.find(id_of(obj));
  if (!v) return;
  v->items = std::move(items);
  v->entries = std::move(entries);
  v->attributes = std::move(attrs);
  v->has_dict = has_dict;
  v->expanded = true;
}

void Recorder::drain() {
  while (!queue_.empty() && !full()) {
    PyObject* obj = queue_.front();
    queue_.pop_front();
    expand(obj);
  }
}

}  // namespace

GuestGraph capture_graph(PyObject* namespace_dict, PyObject* subject, const std::set<std::string>& excluded,
                         const IntrospectLimits& limits) {
  GuestGraph graph;
  Recorder recorder(graph, limits);
  // The subject is recorded first so a crowded namespace cannot starve it.
  if (subject && subject != Py_None) graph.set_subject(recorder.record(subject));

  if (namespace_dict && PyDict_Check(namespace_dict)) {
    PyRef items(PyDict_Items(namespace_dict));
    if (!items) PyErr_Clear();
    const Py_ssize_t n = items ? PyList_GET_SIZE(items.get()) : 0;
    for (Py_ssize_t i = 0; i < n; ++i) {
      PyObject* pair = PyList_GET_ITEM(items.get(), i);
      PyObject* key = PyTuple_GET_ITEM(pair, 0);
      if (!PyUnicode_Check(key)) continue;
      std::string name = str_of(key, "");
      if (name == "__builtins__" || excluded.count(name)) continue;
      graph.bind(std::move(name), recorder.record(PyTuple_GET_ITEM(pair, 1)));
    }
  }

  recorder.drain();
  return graph;
}

}  // namespace guest
}  // namespace gradebox
