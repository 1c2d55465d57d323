#pragma once

// gradebox/introspect.hpp — Records guest objects into a GuestGraph.
//
// Breadth-first from the namespace bindings and the last tested instance.
// For every value: kind, type name, str() text, truthiness; for containers
// their elements (capped per container); for objects their instance
// variables plus the inspected attribute names, with callable size/index
// attributes invoked once with no arguments. Objects reached are kept alive
// until capture finishes, so identities never collide with a recycled
// address.
//
// Guest code runs here (__str__, __bool__, properties, size methods). Any
// exception it raises is cleared and the value is recorded without the
// failing piece.

#include <Python.h>

#include <cstddef>
#include <set>
#include <string>

#include "gradebox/guest_value.hpp"

namespace gradebox {
namespace guest {

struct IntrospectLimits {
  std::size_t max_values{4096};
  std::size_t max_items{1000};   // elements/entries recorded per container
  std::size_t max_text{256};     // str() text kept for containers and objects
  std::size_t max_primitive_text{1000};
};

// namespace_dict must be a dict. subject may be null.
GuestGraph capture_graph(PyObject* namespace_dict, PyObject* subject, const std::set<std::string>& excluded,
                         const IntrospectLimits& limits = {});

}  // namespace guest
}  // namespace gradebox
