#pragma once

// gradebox/harness.hpp — Runs structured test cases against an executed
// guest namespace.
//
//   plain-function      f(*arguments)
//   instance-method     C().m(*arguments)
//   operation-sequence  arguments = [[C, op1, op2, ...], [ctor_args, a1, a2, ...]]
//                       obj = C(*ctor_args); returns [None, obj.op1(*a1), ...]
//
// Each case is independent: a malformed description, a missing name or a
// raised exception fails that case only. Equality is the guest's own `==`
// against the expected JSON converted to guest values. Once the interrupt
// cell is set, remaining cases fail with "Execution interrupted" without
// being called.

#include <Python.h>

#include <vector>

#include "gradebox/guest_runtime.hpp"
#include "gradebox/types.hpp"

namespace gradebox {
namespace guest {

struct HarnessRun {
  std::vector<TestOutcome> outcomes;
  // Instance built by the last instance-method or operation-sequence case.
  PyRef last_instance;
};

HarnessRun run_harness(PyObject* namespace_dict, const std::vector<TestCase>& cases);

}  // namespace guest
}  // namespace gradebox
