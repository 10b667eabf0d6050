/***
 * Name: pyjudge::harness::Synthesize
 * Purpose: Assemble the driver program for one test case.
 */
#include "harness/Harness.h"

#include <string>

#include "codec/Codec.h"

namespace pyjudge::harness {

namespace {
constexpr const char* kEmitter = R"PY(import json as _pyjudge_json
import sys as _pyjudge_sys


def _pyjudge_emit(payload):
    try:
        line = _pyjudge_json.dumps(payload)
    except Exception as exc:
        line = _pyjudge_json.dumps({"success": False, "error": "serialization error: %s: %s" % (type(exc).__name__, exc)})
    _pyjudge_sys.stdout.write("\n" + line + "\n")
    _pyjudge_sys.stdout.flush()

)PY";

constexpr const char* kMain = R"PY(

def _pyjudge_main():
    if _PYJUDGE_TARGET is None:
        _pyjudge_emit({"success": True, "result": "OK"})
        return
    try:
        target = _PYJUDGE_TARGETS[_PYJUDGE_TARGET]()
    except BaseException as exc:
        _pyjudge_emit({"success": False, "error": "Cannot resolve target '%s': %s" % (_PYJUDGE_TARGET, exc)})
        return
    try:
        result = target(*_PYJUDGE_ARGS, **_PYJUDGE_KWARGS)
    except BaseException as exc:
        _pyjudge_emit({"success": False, "error": "Execution error: %s: %s" % (type(exc).__name__, exc)})
        return
    try:
        text = repr(result)
    except BaseException as exc:
        _pyjudge_emit({"success": False, "error": "Repr error: %s: %s" % (type(exc).__name__, exc)})
        return
    _pyjudge_emit({"success": True, "result": text})


try:
    _pyjudge_main()
except BaseException as exc:
    _pyjudge_emit({"success": False, "error": "Wrapper error: %s: %s" % (type(exc).__name__, exc)})
)PY";

std::string encodeArgs(const TestCase& testCase) {
  std::string out = "(";
  for (const auto& arg : testCase.args) {
    out += codec::EncodeLiteral(arg);
    out += ", ";
  }
  return out + ")";
}

std::string encodeKwargs(const TestCase& testCase) {
  std::string out = "{";
  bool first = true;
  for (const auto& [name, value] : testCase.kwargs) {
    if (!first) { out += ", "; }
    first = false;
    out += codec::EncodeLiteral(codec::Value::str(name));
    out += ": ";
    out += codec::EncodeLiteral(value);
  }
  return out + "}";
}
} // namespace

std::string Synthesize(const std::string& source, const TestCase& testCase) {
  std::string registry = "_PYJUDGE_TARGETS = {\n";
  std::string selected = "None";
  if (!testCase.target.empty()) {
    const Target target = ParseTarget(testCase.target);
    selected = codec::EncodeLiteral(codec::Value::str(target.key));
    registry += "    " + selected + ": lambda: " + target.rendered + ",\n";
  }
  registry += "}\n";

  std::string program = "# Generated by pyjudge: candidate source followed by the test driver.\n";
  program += kSourceBeginMarker;
  program += "\n";
  program += source;
  if (source.empty() || source.back() != '\n') { program += "\n"; }
  program += kSourceEndMarker;
  program += "\n";
  program += kEmitter;
  program += "\n";
  program += registry;
  program += "_PYJUDGE_TARGET = " + selected + "\n";
  program += "_PYJUDGE_ARGS = " + encodeArgs(testCase) + "\n";
  program += "_PYJUDGE_KWARGS = " + encodeKwargs(testCase) + "\n";
  program += kMain;
  return program;
}

} // namespace pyjudge::harness
