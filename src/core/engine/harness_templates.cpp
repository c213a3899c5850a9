#include "harness_templates.h"

// 两个 runner 内嵌的比较器与入口推导规则必须与 comparator.cpp /
// harness_generator.cpp 保持一致 (comparator_parity_test 覆盖)。

namespace saferun {

const char* const kPythonHarnessTemplate = R"PY(# generated by saferun
import contextlib
import io
import json
import math
import os
import re
import signal
import sys
import time
import traceback

_START_MARKER = "__RESULTS_JSON_START__"
_END_MARKER = "__RESULTS_JSON_END__"
_HERE = os.path.dirname(os.path.abspath(__file__))
_SOURCE_FILE = os.path.join(_HERE, "solution.py")
_TESTS_FILE = os.path.join(_HERE, "tests.json")
_ENTRY_POINT = {{ENTRY_POINT}}
_EXPECTED_TEST_COUNT = {{TEST_COUNT}}
_SOFT_LIMIT_SECONDS = {{SOFT_LIMIT}}
_ENTRY_PATTERN = re.compile(r"^def\s+([A-Za-z_][A-Za-z0-9_]*)\s*\(")


class _SoftTimeLimit(BaseException):
    pass


def _on_soft_limit(signum, frame):
    raise _SoftTimeLimit()


def _emit(report):
    try:
        sys.stdout.flush()
        sys.stderr.flush()
    except (OSError, ValueError):
        # the candidate may have closed or replaced the standard streams
        pass
    # captured candidate output must not contain a literal marker inside the block
    payload = json.dumps(report, default=repr).replace("__RESULTS_JSON_", "\\u005f_RESULTS_JSON_")
    data = ("\n" + _START_MARKER + "\n" + payload + "\n" + _END_MARKER + "\n").encode("utf-8", "replace")
    while data:
        written = os.write(1, data)
        data = data[written:]


def _error_report(kind, message, trace=None):
    report = {
        "status": "error",
        "error_kind": kind,
        "passed_count": 0,
        "failed_count": 0,
        "all_passed": False,
        "total_execution_time_seconds": 0.0,
        "test_results": [],
        "error_message": message,
    }
    if trace:
        report["traceback"] = trace
    return report


def _derive_entry_point(source):
    for line in source.split("\n"):
        match = _ENTRY_PATTERN.match(line.rstrip("\r"))
        if match:
            return match.group(1)
    return None


def _normalize(value, depth=0):
    if depth > 100:
        return repr(value)
    if value is None or isinstance(value, (bool, str)):
        return value
    if isinstance(value, int):
        return value
    if isinstance(value, float):
        if math.isnan(value) or math.isinf(value):
            return repr(value)
        return value
    if isinstance(value, (list, tuple)):
        return [_normalize(item, depth + 1) for item in value]
    if isinstance(value, (set, frozenset)):
        items = [_normalize(item, depth + 1) for item in value]
        try:
            return sorted(items)
        except TypeError:
            return sorted(items, key=lambda item: json.dumps(item, sort_keys=True, default=repr))
    if isinstance(value, dict):
        return {str(key): _normalize(item, depth + 1) for key, item in value.items()}
    return repr(value)


def _values_equal(actual, expected):
    if actual is None or expected is None:
        return actual is None and expected is None
    if isinstance(actual, bool) or isinstance(expected, bool):
        return isinstance(actual, bool) and isinstance(expected, bool) and actual == expected
    if isinstance(actual, (int, float)) or isinstance(expected, (int, float)):
        return isinstance(actual, (int, float)) and isinstance(expected, (int, float)) and actual == expected
    if isinstance(actual, str) or isinstance(expected, str):
        return isinstance(actual, str) and isinstance(expected, str) and actual == expected
    if isinstance(actual, list) or isinstance(expected, list):
        if not (isinstance(actual, list) and isinstance(expected, list)):
            return False
        if len(actual) != len(expected):
            return False
        return all(_values_equal(a, e) for a, e in zip(actual, expected))
    if isinstance(actual, dict) and isinstance(expected, dict):
        if len(actual) != len(expected):
            return False
        for key, item in expected.items():
            if key not in actual:
                return False
            if not _values_equal(actual[key], item):
                return False
        return True
    return False


def _invoke(function, test_input):
    if isinstance(test_input, list):
        return function(*test_input)
    if isinstance(test_input, dict):
        return function(**test_input)
    return function(test_input)


def _describe(exc):
    return "%s: %s" % (type(exc).__name__, exc)


def _run_test(function, index, test_case):
    test_input = test_case.get("input")
    expected = test_case.get("expected_output")
    result = {
        "test_case_id": index + 1,
        "input": test_input,
        "expected_output": expected,
        "is_hidden": bool(test_case.get("is_hidden", False)),
        "explanation": test_case.get("explanation") or "",
        "passed": False,
        "output": None,
        "error": None,
        "execution_time_seconds": 0.0,
    }
    stdout_buffer = io.StringIO()
    stderr_buffer = io.StringIO()
    use_timer = _SOFT_LIMIT_SECONDS > 0 and hasattr(signal, "setitimer")
    elapsed = 0.0
    try:
        with contextlib.redirect_stdout(stdout_buffer), contextlib.redirect_stderr(stderr_buffer):
            if use_timer:
                signal.setitimer(signal.ITIMER_REAL, _SOFT_LIMIT_SECONDS)
            started = time.perf_counter()
            try:
                actual = _invoke(function, test_input)
            finally:
                elapsed = time.perf_counter() - started
                if use_timer:
                    signal.setitimer(signal.ITIMER_REAL, 0)
        if _SOFT_LIMIT_SECONDS > 0 and elapsed > _SOFT_LIMIT_SECONDS:
            raise _SoftTimeLimit()
        output = _normalize(actual)
        result["output"] = output
        result["passed"] = _values_equal(output, expected)
    except _SoftTimeLimit:
        result["error"] = "Test exceeded soft time limit of %gs" % _SOFT_LIMIT_SECONDS
    except (Exception, SystemExit) as exc:
        result["error"] = _describe(exc)
        result["traceback"] = traceback.format_exc()
    result["execution_time_seconds"] = elapsed

    captured_out = stdout_buffer.getvalue()
    captured_err = stderr_buffer.getvalue()
    if captured_out:
        result["stdout"] = captured_out
    if captured_err:
        result["stderr"] = captured_err
    return result


def _main():
    try:
        with open(_SOURCE_FILE, encoding="utf-8") as handle:
            source = handle.read()
        with open(_TESTS_FILE, encoding="utf-8") as handle:
            test_cases = json.load(handle)
    except (OSError, ValueError) as exc:
        return _error_report("protocol", "Failed to load submission files: %s" % _describe(exc))

    if not isinstance(test_cases, list) or len(test_cases) != _EXPECTED_TEST_COUNT:
        found = len(test_cases) if isinstance(test_cases, list) else "invalid"
        return _error_report(
            "protocol",
            "Test case count mismatch: expected %d, found %s" % (_EXPECTED_TEST_COUNT, found))

    entry_point = _ENTRY_POINT or _derive_entry_point(source)
    if not entry_point:
        return _error_report(
            "candidate_fault",
            "NoEntryPointError: no top-level function definition found in candidate code")

    if _SOFT_LIMIT_SECONDS > 0 and hasattr(signal, "setitimer"):
        signal.signal(signal.SIGALRM, _on_soft_limit)

    namespace = {"__name__": "solution", "__builtins__": __builtins__}
    try:
        code = compile(source, "solution.py", "exec")
        exec(code, namespace)
    except SyntaxError as exc:
        return _error_report(
            "candidate_fault",
            "SyntaxError: %s (line %s)" % (exc.msg, exc.lineno),
            traceback.format_exc())
    except (Exception, SystemExit) as exc:
        return _error_report(
            "candidate_fault",
            "Error while loading candidate code: %s" % _describe(exc),
            traceback.format_exc())

    function = namespace.get(entry_point)
    if not callable(function):
        return _error_report(
            "candidate_fault",
            "NoEntryPointError: entry point '%s' is not defined as a callable" % entry_point)

    results = []
    for index, test_case in enumerate(test_cases):
        if not isinstance(test_case, dict):
            test_case = {"input": test_case}
        results.append(_run_test(function, index, test_case))

    count = len(results)
    passed = sum(1 for item in results if item["passed"])
    total_time = sum(item["execution_time_seconds"] for item in results)
    return {
        "status": "success",
        "error_kind": "none",
        "entry_point": entry_point,
        "passed_count": passed,
        "failed_count": count - passed,
        "all_passed": count > 0 and passed == count,
        "total_execution_time_seconds": total_time,
        "test_results": results,
        "error_message": None,
        "detailed_metrics": {
            "avg_execution_time": total_time / count if count else 0.0,
            "max_execution_time": max((item["execution_time_seconds"] for item in results), default=0.0),
            "success_rate": passed / count if count else 0.0,
        },
    }


if __name__ == "__main__":
    try:
        _report = _main()
    except BaseException as exc:
        _report = _error_report("protocol", "Harness failure: %s" % _describe(exc), traceback.format_exc())
    _emit(_report)
    # threads started by the candidate must not keep the unit alive
    os._exit(0)
)PY";

const char* const kJavaScriptHarnessTemplate = R"JS(// generated by saferun
'use strict';
const fs = require('fs');
const path = require('path');
const vm = require('vm');
const util = require('util');

const START_MARKER = '__RESULTS_JSON_START__';
const END_MARKER = '__RESULTS_JSON_END__';
const SOURCE_FILE = path.join(__dirname, 'solution.js');
const TESTS_FILE = path.join(__dirname, 'tests.json');
const ENTRY_POINT = {{ENTRY_POINT}};
const EXPECTED_TEST_COUNT = {{TEST_COUNT}};
const SOFT_LIMIT_SECONDS = {{SOFT_LIMIT}};
const ENTRY_PATTERNS = [
  /^function\s+([A-Za-z_$][A-Za-z0-9_$]*)\s*\(/,
  /^(?:const|let|var)\s+([A-Za-z_$][A-Za-z0-9_$]*)\s*=\s*(?:function\b|\([^)]*\)\s*=>|[A-Za-z_$][A-Za-z0-9_$]*\s*=>)/,
];

// console inside the candidate context writes into the active capture
let capture = { stdout: '', stderr: '' };
const candidateConsole = {
  log: (...args) => { capture.stdout += util.format(...args) + '\n'; },
  info: (...args) => { capture.stdout += util.format(...args) + '\n'; },
  debug: (...args) => { capture.stdout += util.format(...args) + '\n'; },
  error: (...args) => { capture.stderr += util.format(...args) + '\n'; },
  warn: (...args) => { capture.stderr += util.format(...args) + '\n'; },
};

function writeAll(text) {
  let data = Buffer.from(text, 'utf8');
  while (data.length > 0) {
    const written = fs.writeSync(1, data);
    data = data.subarray(written);
  }
}

function emit(report) {
  // captured candidate output must not contain a literal marker inside the block
  const payload = JSON.stringify(report).split('__RESULTS_JSON_').join('\\u005f_RESULTS_JSON_');
  writeAll('\n' + START_MARKER + '\n' + payload + '\n' + END_MARKER + '\n');
}

function errorReport(kind, message, trace) {
  const report = {
    status: 'error',
    error_kind: kind,
    passed_count: 0,
    failed_count: 0,
    all_passed: false,
    total_execution_time_seconds: 0,
    test_results: [],
    error_message: message,
  };
  if (trace) report.traceback = trace;
  return report;
}

function deriveEntryPoint(source) {
  for (const rawLine of source.split('\n')) {
    const line = rawLine.endsWith('\r') ? rawLine.slice(0, -1) : rawLine;
    for (const pattern of ENTRY_PATTERNS) {
      const match = pattern.exec(line);
      if (match) return match[1];
    }
  }
  return null;
}

function describeError(e) {
  if (e !== null && typeof e === 'object' && 'message' in e) {
    return (e.name || 'Error') + ': ' + e.message;
  }
  return 'Uncaught: ' + String(e);
}

function stackOf(e) {
  return e !== null && typeof e === 'object' && typeof e.stack === 'string' ? e.stack : null;
}

function normalize(value, seen) {
  if (value === undefined || value === null) return null;
  const type = typeof value;
  if (type === 'boolean' || type === 'string') return value;
  if (type === 'number') return Number.isFinite(value) ? value : String(value);
  if (type === 'bigint') return value.toString();
  if (type !== 'object') return String(value);
  if (seen.has(value)) return '[Circular]';
  seen.add(value);
  let out;
  const tag = Object.prototype.toString.call(value);
  if (Array.isArray(value)) {
    out = value.map((item) => normalize(item, seen));
  } else if (tag === '[object Set]') {
    out = Array.from(value, (item) => normalize(item, seen));
  } else if (tag === '[object Map]') {
    out = {};
    for (const [key, item] of value) out[String(key)] = normalize(item, seen);
  } else if (tag === '[object Date]') {
    out = value.toISOString();
  } else {
    out = {};
    for (const key of Object.keys(value)) out[key] = normalize(value[key], seen);
  }
  seen.delete(value);
  return out;
}

function kindOf(value) {
  if (value === null) return 'null';
  if (Array.isArray(value)) return 'sequence';
  switch (typeof value) {
    case 'boolean': return 'bool';
    case 'number': return 'number';
    case 'string': return 'string';
    case 'object': return 'map';
    default: return 'unsupported';
  }
}

function valuesEqual(actual, expected) {
  const kind = kindOf(actual);
  if (kind !== kindOf(expected) || kind === 'unsupported') return false;
  switch (kind) {
    case 'null':
      return true;
    case 'bool':
    case 'number':
    case 'string':
      return actual === expected;
    case 'sequence':
      if (actual.length !== expected.length) return false;
      for (let i = 0; i < actual.length; i++) {
        if (!valuesEqual(actual[i], expected[i])) return false;
      }
      return true;
    default: {
      const expectedKeys = Object.keys(expected);
      if (Object.keys(actual).length !== expectedKeys.length) return false;
      for (const key of expectedKeys) {
        if (!Object.prototype.hasOwnProperty.call(actual, key)) return false;
        if (!valuesEqual(actual[key], expected[key])) return false;
      }
      return true;
    }
  }
}

const context = vm.createContext({ console: candidateConsole });
const invokeScript = new vm.Script('__saferunInvoke()', { filename: 'invoke.js' });
const runOptions = SOFT_LIMIT_SECONDS > 0 ? { timeout: Math.ceil(SOFT_LIMIT_SECONDS * 1000) } : {};

function isSoftTimeout(e) {
  return e !== null && typeof e === 'object' && e.code === 'ERR_SCRIPT_EXECUTION_TIMEOUT';
}

function invoke(fn, input) {
  // sequence -> positional spread; map -> a single options object; scalar -> single argument
  context.__saferunInvoke = Array.isArray(input) ? () => fn(...input) : () => fn(input);
  return invokeScript.runInContext(context, runOptions);
}

function runTest(fn, index, testCase) {
  const input = testCase.input === undefined ? null : testCase.input;
  const expected = testCase.expected_output === undefined ? null : testCase.expected_output;
  const result = {
    test_case_id: index + 1,
    input,
    expected_output: expected,
    is_hidden: Boolean(testCase.is_hidden),
    explanation: testCase.explanation || '',
    passed: false,
    output: null,
    error: null,
    execution_time_seconds: 0,
  };
  capture = { stdout: '', stderr: '' };
  let elapsed = 0;
  try {
    const started = process.hrtime.bigint();
    let actual;
    try {
      actual = invoke(fn, input);
    } finally {
      elapsed = Number(process.hrtime.bigint() - started) / 1e9;
    }
    const output = normalize(actual, new Set());
    result.output = output;
    result.passed = valuesEqual(output, expected);
  } catch (e) {
    if (isSoftTimeout(e)) {
      result.error = 'Test exceeded soft time limit of ' + SOFT_LIMIT_SECONDS + 's';
    } else {
      result.error = describeError(e);
      const stack = stackOf(e);
      if (stack) result.traceback = stack;
    }
  }
  result.execution_time_seconds = elapsed;
  if (capture.stdout) result.stdout = capture.stdout;
  if (capture.stderr) result.stderr = capture.stderr;
  return result;
}

function resolveEntryPoint(name) {
  try {
    return vm.runInContext(name, context);
  } catch (e) {
    return undefined;
  }
}

function main() {
  let source;
  let testCases;
  try {
    source = fs.readFileSync(SOURCE_FILE, 'utf8');
    testCases = JSON.parse(fs.readFileSync(TESTS_FILE, 'utf8'));
  } catch (e) {
    return errorReport('protocol', 'Failed to load submission files: ' + describeError(e));
  }

  if (!Array.isArray(testCases) || testCases.length !== EXPECTED_TEST_COUNT) {
    const found = Array.isArray(testCases) ? testCases.length : 'invalid';
    return errorReport('protocol',
      'Test case count mismatch: expected ' + EXPECTED_TEST_COUNT + ', found ' + found);
  }

  const entryPoint = ENTRY_POINT || deriveEntryPoint(source);
  if (!entryPoint) {
    return errorReport('candidate_fault',
      'NoEntryPointError: no top-level function definition found in candidate code');
  }

  const loadCapture = { stdout: '', stderr: '' };
  capture = loadCapture;
  try {
    vm.runInContext(source, context, Object.assign({ filename: 'solution.js' }, runOptions));
  } catch (e) {
    writeAll(loadCapture.stdout + loadCapture.stderr);
    const name = e !== null && typeof e === 'object' ? e.name : '';
    const message = name === 'SyntaxError'
      ? describeError(e)
      : 'Error while loading candidate code: ' + describeError(e);
    return errorReport('candidate_fault', message, stackOf(e));
  }
  writeAll(loadCapture.stdout + loadCapture.stderr);

  const fn = resolveEntryPoint(entryPoint);
  if (typeof fn !== 'function') {
    return errorReport('candidate_fault',
      "NoEntryPointError: entry point '" + entryPoint + "' is not defined as a callable");
  }

  const results = testCases.map((testCase, index) =>
    runTest(fn, index, testCase !== null && typeof testCase === 'object' && !Array.isArray(testCase)
      ? testCase : { input: testCase }));

  const count = results.length;
  const passed = results.filter((r) => r.passed).length;
  const totalTime = results.reduce((sum, r) => sum + r.execution_time_seconds, 0);
  return {
    status: 'success',
    error_kind: 'none',
    entry_point: entryPoint,
    passed_count: passed,
    failed_count: count - passed,
    all_passed: count > 0 && passed === count,
    total_execution_time_seconds: totalTime,
    test_results: results,
    error_message: null,
    detailed_metrics: {
      avg_execution_time: count ? totalTime / count : 0,
      max_execution_time: results.reduce((max, r) => Math.max(max, r.execution_time_seconds), 0),
      success_rate: count ? passed / count : 0,
    },
  };
}

let report;
try {
  report = main();
} catch (e) {
  report = errorReport('protocol', 'Harness failure: ' + describeError(e), stackOf(e));
}
emit(report);
process.exit(0);
)JS";

} // namespace saferun
