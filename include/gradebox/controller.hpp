#pragma once

// gradebox/controller.hpp — One guest run inside the worker.
//
//   1. import allow-list check (violation: ImportError on captured stderr,
//      nothing executes)
//   2. exec of the source in a fresh namespace (__name__ = "__gradebox_exec__")
//   3. harness over the structured test cases
//   4. USER_TESTS: each callable entry is one pass/fail/error case; every
//      fail or error dumps a snapshot
//   5. any failed harness case and no snapshot yet: dump the namespace minus
//      infrastructure names
//   6. uncaught exception: traceback on captured stderr, then a snapshot if
//      none was emitted; SystemExit is swallowed
//
// If step 1 or 2 fails, every test case gets a failing outcome carrying the
// error, so outcomes always line up with the request's test cases.

#include <set>
#include <string>
#include <vector>

#include "gradebox/interrupt.hpp"
#include "gradebox/types.hpp"

namespace gradebox {
namespace guest {

// Namespace bindings left out of the failure snapshot.
const std::set<std::string>& infrastructure_names();

// Requires an initialized runtime. cell may be null (no cooperative
// interruption).
RawRunResult run_program(const std::string& source_text, const std::vector<TestCase>& test_cases,
                         const InterruptCell* cell);

}  // namespace guest
}  // namespace gradebox
