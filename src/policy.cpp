#include "gradebox/policy.hpp"

#include <regex>
#include <set>
#include <sstream>

namespace gradebox {

namespace {

const std::set<std::string, std::less<>>& allowed_modules() {
  static const std::set<std::string, std::less<>> kAllowed = {
      // standard library
      "os", "sys", "json", "math", "random", "time", "datetime", "collections", "itertools",
      "functools", "operator", "string", "re", "io", "pathlib", "typing", "dataclasses", "enum",
      "abc", "copy", "pickle", "base64", "hashlib", "uuid", "urllib", "http", "socket",
      "threading", "multiprocessing", "subprocess", "shutil", "glob", "fnmatch", "tempfile",
      "zipfile", "csv", "xml", "html", "email", "logging", "warnings", "traceback", "inspect",
      "ast", "dis", "gc", "weakref", "contextlib", "fractions", "decimal", "statistics", "array",
      "struct", "mmap", "codecs", "unicodedata", "locale", "gettext", "argparse", "configparser",
      "fileinput", "linecache", "cmd", "shlex", "readline", "rlcompleter", "pdb", "profile",
      "pstats", "timeit", "trace", "faulthandler", "signal", "atexit", "sysconfig", "platform",
      "ctypes", "cffi", "heapq", "_heapq", "deque", "bisect", "queue", "numbers", "types",
      "typing_extensions", "unittest", "_unittest",
      // course helper modules
      "arraylist", "trie", "graph", "heap", "min_heap", "hashtable", "linkedlist", "graphs",
      "warmup", "solution",
  };
  return kAllowed;
}

std::string root_of(const std::string& dotted) { return dotted.substr(0, dotted.find('.')); }

bool skipped_line(const std::string& line) {
  const auto first = line.find_first_not_of(" \t\r\f\v");
  if (first == std::string::npos) return true;
  const std::string_view s(line.data() + first, line.size() - first);
  return s.rfind("#", 0) == 0 || s.rfind("\"\"\"", 0) == 0 || s.rfind("'''", 0) == 0;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

}  // namespace

bool module_allowed(std::string_view root_module) {
  return allowed_modules().find(root_module) != allowed_modules().end();
}

std::optional<PolicyViolation> find_policy_violation(const std::string& source_text) {
  static const std::regex kFrom(R"(^\s*from\s+([A-Za-z0-9_.]+)\s+import\b)");
  static const std::regex kImport(
      R"(^\s*import\s+([A-Za-z0-9_.]+(?:\s+as\s+\w+)?(?:\s*,\s*[A-Za-z0-9_.]+(?:\s+as\s+\w+)?)*))");

  std::istringstream in(source_text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (skipped_line(line)) continue;

    std::smatch m;
    if (std::regex_search(line, m, kFrom)) {
      const std::string root = root_of(m[1].str());
      if (!module_allowed(root)) return PolicyViolation{root, line_no};
      continue;
    }
    if (std::regex_search(line, m, kImport)) {
      // import a.b as x, c
      std::stringstream names(m[1].str());
      std::string item;
      while (std::getline(names, item, ',')) {
        item = trim(item);
        const auto space = item.find_first_of(" \t");
        if (space != std::string::npos) item = item.substr(0, space);
        if (item.empty()) continue;
        const std::string root = root_of(item);
        if (!module_allowed(root)) return PolicyViolation{root, line_no};
      }
    }
  }
  return std::nullopt;
}

std::string policy_violation_message(const PolicyViolation& v) {
  return "Package policy violation: '" + v.module + "' not allowed";
}

}  // namespace gradebox
