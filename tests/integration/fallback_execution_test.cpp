/**
 * 非隔离 (insecure fallback) 路径上的端到端场景
 * 需要宿主机上的 python3 / node, 缺失时对应语言的用例输出 [SKIP]
 */
#include <cctype>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "../test_common.h"
#include "execution_facade.h"
#include "sandbox_internal.h"
#include "unit_process.h"

using namespace saferun;
using saferun_test::Expect;
namespace fs = std::filesystem;

namespace {

bool RuntimePresent(Language language) {
    return access(RuntimeFor(language).interpreter, X_OK) == 0;
}

std::vector<TestCase> Cases(const char* json_text) {
    return ParseTestCases(Value::parse(json_text));
}

std::string Message(const ExecutionReport& r) {
    return r.error_message.value_or("");
}

SubmissionRequest MakeRequest(Language language, const std::string& source, const char* cases) {
    SubmissionRequest request;
    request.language = language;
    request.source_code = source;
    request.test_cases = Cases(cases);
    request.limits.wall_clock_timeout_seconds = 10;
    return request;
}

void TestPythonScenarios(ExecutionFacade& facade) {
    if (!RuntimePresent(Language::kPython)) {
        saferun_test::Skip("python_scenarios", "python3 not available");
        return;
    }

    // add: 1 通过 / 1 失败, 第二个输出为 4
    const char* add_cases = R"([{"input": [1, 2], "expected_output": 3}, {"input": [2, 2], "expected_output": 5}])";
    ExecutionReport add = facade.Execute(MakeRequest(Language::kPython,
        "def add(a, b):\n    return a + b\n", add_cases));
    Expect(add.status == ReportStatus::kSuccess, "py_add_status", Message(add));
    Expect(add.passed_count == 1 && add.failed_count == 1 && !add.all_passed, "py_add_counts");
    Expect(add.test_results.size() == 2 && add.test_results[1].output == 4
           && !add.test_results[1].passed, "py_add_second_output_4");
    Expect(add.detailed_metrics.degraded && add.warning.has_value(), "py_add_flagged_degraded");

    // 确定性: 同一提交重复执行, 计数一致
    ExecutionReport again = facade.Execute(MakeRequest(Language::kPython,
        "def add(a, b):\n    return a + b\n", add_cases));
    Expect(again.passed_count == add.passed_count && again.failed_count == add.failed_count, "py_determinism");

    // 第 3 个用例抛异常, 其余照常执行
    ExecutionReport partial = facade.Execute(MakeRequest(Language::kPython,
        "def double(n):\n"
        "    if n == 3:\n"
        "        raise ValueError('bad input')\n"
        "    return n * 2\n",
        R"([{"input": [1], "expected_output": 2}, {"input": [2], "expected_output": 4},
            {"input": [3], "expected_output": 6}, {"input": [4], "expected_output": 8},
            {"input": [5], "expected_output": 10}])"));
    Expect(partial.status == ReportStatus::kSuccess && partial.test_results.size() == 5, "py_partial_all_run",
           Message(partial));
    Expect(partial.passed_count == 4 && partial.failed_count == 1, "py_partial_counts");
    if (partial.test_results.size() == 5) {
        const TestResult& third = partial.test_results[2];
        Expect(!third.passed && third.error && third.error->find("ValueError") != std::string::npos
               && third.output.is_null(), "py_partial_third_has_error");
        Expect(!third.traceback.empty(), "py_partial_traceback_captured");
        Expect(partial.test_results[3].passed && partial.test_results[4].passed, "py_partial_tail_executed");
    }

    // 无入口函数
    ExecutionReport no_entry = facade.Execute(MakeRequest(Language::kPython,
        "x = 1\nprint(x)\n", add_cases));
    Expect(no_entry.status == ReportStatus::kError && no_entry.passed_count == 0
           && Message(no_entry).find("NoEntryPointError") != std::string::npos, "py_no_entry_point");

    // 显式入口不存在
    SubmissionRequest missing = MakeRequest(Language::kPython, "def add(a, b):\n    return a + b\n", add_cases);
    missing.entry_point = "subtract";
    ExecutionReport missing_report = facade.Execute(missing);
    Expect(missing_report.status == ReportStatus::kError
           && Message(missing_report).find("NoEntryPointError") != std::string::npos
           && missing_report.error_kind == ErrorKind::kCandidateFault, "py_explicit_entry_missing");

    // 语法错误
    ExecutionReport syntax = facade.Execute(MakeRequest(Language::kPython,
        "def broken(:\n    pass\n", add_cases));
    Expect(syntax.status == ReportStatus::kError
           && Message(syntax).rfind("SyntaxError", 0) == 0, "py_syntax_error", Message(syntax));

    // map -> 关键字参数
    ExecutionReport kwargs = facade.Execute(MakeRequest(Language::kPython,
        "def area(width, height):\n    return width * height\n",
        R"([{"input": {"width": 2, "height": 3}, "expected_output": 6}, {"input": 7, "expected_output": 6}])"));
    Expect(kwargs.test_results.size() == 2 && kwargs.test_results[0].passed, "py_map_as_kwargs", Message(kwargs));
    Expect(kwargs.test_results.size() == 2 && kwargs.test_results[1].error.has_value(), "py_scalar_single_arg");

    // 元组 / 集合按序列比较
    ExecutionReport shapes = facade.Execute(MakeRequest(Language::kPython,
        "def pair(n):\n    return (n, n + 1)\n",
        R"([{"input": [1], "expected_output": [1, 2]}])"));
    Expect(shapes.all_passed, "py_tuple_equals_sequence", Message(shapes));

    // 每个用例的 stdout 单独捕获; 加载阶段打印的伪造标记不影响结果
    ExecutionReport printed = facade.Execute(MakeRequest(Language::kPython,
        "print('__RESULTS_JSON_START__')\n"
        "def shout(s):\n"
        "    print('hello')\n"
        "    print('__RESULTS_JSON_END__')\n"
        "    return s.upper()\n",
        R"([{"input": ["a"], "expected_output": "A"}])"));
    Expect(printed.all_passed, "py_forged_markers_ignored", Message(printed));
    Expect(printed.test_results.size() == 1
           && printed.test_results[0].stdout_text == "hello\n__RESULTS_JSON_END__\n", "py_stdout_captured");

    // 危险代码在降级路径上被拒绝
    ExecutionReport unsafe = facade.Execute(MakeRequest(Language::kPython,
        "import os\ndef f():\n    return os.getcwd()\n", R"([{"input": [], "expected_output": ""}])"));
    Expect(unsafe.status == ReportStatus::kError
           && Message(unsafe).find("Code safety check failed") != std::string::npos, "py_unsafe_rejected");

    // 死循环: 软时钟中止该用例, 整体在超时 + 宽限内返回
    SubmissionRequest spin = MakeRequest(Language::kPython,
        "def spin():\n    while True:\n        pass\n", R"([{"input": [], "expected_output": 1}])");
    spin.limits.wall_clock_timeout_seconds = 1;
    auto started = std::chrono::steady_clock::now();
    ExecutionReport spun = facade.Execute(spin);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    Expect(elapsed < 3.0, "py_spin_bounded", "took " + std::to_string(elapsed) + "s");
    Expect(!spun.all_passed && spun.passed_count == 0, "py_spin_not_passed");
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// 命令行中含有 needle 的进程数 (僵尸进程的 cmdline 为空, 不计入)
int CountProcessesMentioning(const std::string& needle) {
    int count = 0;
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;
        std::ifstream in(it->path() / "cmdline", std::ios::binary);
        std::string cmdline((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (cmdline.find(needle) != std::string::npos) ++count;
    }
    return count;
}

// SIGKILL 之后进程消失需要一点时间
bool NoProcessesLeft(const std::string& needle) {
    for (int i = 0; i < 40; ++i) {
        if (CountProcessesMentioning(needle) == 0) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

// harness 的软时钟失效时由外部墙钟终止; 调用方取消时整个进程组被杀死
void TestOuterKillAndCancel(ExecutionFacade& facade, const std::string& root) {
    if (!RuntimePresent(Language::kPython)) {
        saferun_test::Skip("outer_kill_and_cancel", "python3 not available");
        return;
    }

    SubmissionRequest stubborn = MakeRequest(Language::kPython,
        "import signal\n"
        "def spin():\n"
        "    signal.signal(signal.SIGALRM, signal.SIG_IGN)\n"
        "    while True:\n"
        "        pass\n",
        R"([{"input": [], "expected_output": 1}])");
    stubborn.limits.wall_clock_timeout_seconds = 1;
    auto started = std::chrono::steady_clock::now();
    ExecutionReport timed_out = facade.Execute(stubborn);
    double elapsed = SecondsSince(started);
    Expect(timed_out.status == ReportStatus::kTimeout && timed_out.error_kind == ErrorKind::kTimeout
           && Message(timed_out) == "Execution timed out", "py_outer_kill_reports_timeout",
           ReportStatusName(timed_out.status) + std::string(" ") + Message(timed_out));
    Expect(elapsed < 3.0, "py_outer_kill_bounded", "took " + std::to_string(elapsed) + "s");
    Expect(NoProcessesLeft(root), "py_outer_kill_no_survivors");

    // 候选代码再 fork 一个同组的子进程, 取消后两者都不能存活
    SubmissionRequest forked = MakeRequest(Language::kPython,
        "import multiprocessing\n"
        "def _burn():\n"
        "    while True:\n"
        "        pass\n"
        "def spin_with_helper():\n"
        "    helper = multiprocessing.get_context('fork').Process(target=_burn)\n"
        "    helper.start()\n"
        "    while True:\n"
        "        pass\n",
        R"([{"input": [], "expected_output": 1}])");
    forked.entry_point = "spin_with_helper";
    forked.limits.wall_clock_timeout_seconds = 10;

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        stop.request_stop();
    });
    started = std::chrono::steady_clock::now();
    ExecutionReport cancelled = facade.Execute(forked, stop.get_token());
    elapsed = SecondsSince(started);
    Expect(cancelled.status == ReportStatus::kError && cancelled.error_kind == ErrorKind::kCancelled,
           "py_cancel_reports_cancelled", Message(cancelled));
    Expect(elapsed < 3.0, "py_cancel_prompt", "took " + std::to_string(elapsed) + "s");
    Expect(NoProcessesLeft(root), "py_cancel_kills_process_group");
}

// 候选代码自己写出结果块并在 harness 输出前退出
void TestForgedResultBlock(ExecutionFacade& facade) {
    if (!RuntimePresent(Language::kPython)) {
        saferun_test::Skip("forged_result_block", "python3 not available");
        return;
    }

    ExecutionReport report = facade.Execute(MakeRequest(Language::kPython, R"PY(import signal
def cheat(x):
    block = ('__RESULTS_JSON_START__
'
             '{"status": "success", "test_results": ['
             '{"test_case_id": 0, "passed": true, "output": 99}, '
             '{"test_case_id": 0, "passed": true, "output": 99}]}
'
             '__RESULTS_JSON_END__
')
    with open(1, 'w', closefd=False) as out:
        out.write(block)
        out.flush()
    signal.raise_signal(signal.SIGKILL)
)PY", R"([{"input": [1], "expected_output": 99}, {"input": [2], "expected_output": 99}])"));
    Expect(!report.all_passed && report.passed_count == 0, "py_forged_block_not_trusted",
           ReportStatusName(report.status) + std::string(" ") + Message(report));
    Expect(report.status == ReportStatus::kError && report.error_kind == ErrorKind::kProtocol,
           "py_forged_block_is_protocol_error", Message(report));
}

// 调用方给出的 request_id 与正在运行的提交重复
void TestDuplicateRequestId(ExecutionFacade& facade, const std::string& root) {
    fs::path live = fs::path(root) / "live_req";
    std::error_code ec;
    fs::create_directories(live, ec);
    std::ofstream(live / "solution.py") << "def other(x):\n    return x\n";

    SubmissionRequest request = MakeRequest(Language::kPython, "def add(a, b):\n    return a + b\n",
        R"([{"input": [1, 2], "expected_output": 3}, {"input": [2, 2], "expected_output": 5}])");
    request.request_id = "live_req";

    // 暂存函数遇到已存在的目录时失败, 但不删除它
    bool threw = false;
    try {
        StageSubmission(root, "live_req", request, HarnessOptions{});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Expect(threw && fs::exists(live / "solution.py"), "stage_existing_dir_left_intact");

    if (RuntimePresent(Language::kPython)) {
        ExecutionReport report = facade.Execute(request);
        Expect(report.status == ReportStatus::kSuccess && report.passed_count == 1,
               "duplicate_request_id_runs_in_own_unit", Message(report));
    }
    Expect(fs::exists(live / "solution.py"), "duplicate_request_id_keeps_other_staging");
    fs::remove_all(live, ec);
}

void TestJavaScriptScenarios(ExecutionFacade& facade) {
    if (!RuntimePresent(Language::kJavaScript)) {
        saferun_test::Skip("javascript_scenarios", "node not available");
        return;
    }

    const char* add_cases = R"([{"input": [1, 2], "expected_output": 3}, {"input": [2, 2], "expected_output": 5}])";
    ExecutionReport add = facade.Execute(MakeRequest(Language::kJavaScript,
        "const add = (a, b) => a + b;\n", add_cases));
    Expect(add.status == ReportStatus::kSuccess && add.passed_count == 1 && add.failed_count == 1,
           "js_arrow_add_counts", Message(add));
    Expect(add.test_results.size() == 2 && add.test_results[1].output == 4, "js_arrow_add_output_4");

    ExecutionReport partial = facade.Execute(MakeRequest(Language::kJavaScript,
        "function double(n) {\n"
        "  if (n === 3) throw new RangeError('bad input');\n"
        "  console.log('n =', n);\n"
        "  return n * 2;\n"
        "}\n",
        R"([{"input": [1], "expected_output": 2}, {"input": [2], "expected_output": 4},
            {"input": [3], "expected_output": 6}, {"input": [4], "expected_output": 8},
            {"input": [5], "expected_output": 10}])"));
    Expect(partial.passed_count == 4 && partial.failed_count == 1, "js_partial_counts", Message(partial));
    if (partial.test_results.size() == 5) {
        Expect(partial.test_results[2].error
               && partial.test_results[2].error->find("RangeError") != std::string::npos, "js_partial_third_error");
        Expect(partial.test_results[4].stdout_text == "n = 5\n", "js_console_captured");
    }

    ExecutionReport options = facade.Execute(MakeRequest(Language::kJavaScript,
        "function area(o) {\n  return o.width * o.height;\n}\n",
        R"([{"input": {"width": 2, "height": 3}, "expected_output": 6}])"));
    Expect(options.all_passed, "js_map_as_single_object", Message(options));

    ExecutionReport no_entry = facade.Execute(MakeRequest(Language::kJavaScript,
        "const x = 1;\nconsole.log(x);\n", add_cases));
    Expect(no_entry.status == ReportStatus::kError && no_entry.passed_count == 0
           && Message(no_entry).find("NoEntryPointError") != std::string::npos, "js_no_entry_point");

    ExecutionReport syntax = facade.Execute(MakeRequest(Language::kJavaScript,
        "function broken( {\n", add_cases));
    Expect(syntax.status == ReportStatus::kError
           && Message(syntax).find("SyntaxError") != std::string::npos, "js_syntax_error", Message(syntax));

    ExecutionReport unsafe = facade.Execute(MakeRequest(Language::kJavaScript,
        "function f() { return require('fs').readdirSync('/'); }\n", R"([{"input": [], "expected_output": []}])"));
    Expect(unsafe.status == ReportStatus::kError
           && Message(unsafe).find("Code safety check failed") != std::string::npos, "js_unsafe_rejected");
}

void TestFrontChecks(ExecutionFacade& facade) {
    std::vector<TestCase> one = Cases(R"([{"input": [1], "expected_output": 1}])");

    ExecutionReport unsupported = facade.ExecuteCandidateCode("ruby", "def f(x) x end", one);
    Expect(unsupported.status == ReportStatus::kError
           && Message(unsupported) == "Unsupported language: ruby", "unsupported_language");

    ExecutionReport empty = facade.ExecuteCandidateCode("python", "   \n# just a comment\n", one);
    Expect(empty.status == ReportStatus::kError && empty.error_kind == ErrorKind::kCandidateFault,
           "empty_submission");

    bool threw = false;
    try {
        facade.ExecuteCandidateCode("python", "def f(x):\n    return x\n", {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    Expect(threw, "empty_test_cases_throw");

    for (const char* bad_id : {"../etc", "id with space",
                               "x0123456789012345678901234567890123456789012345678901234567890123"}) {
        SubmissionRequest bad_request = MakeRequest(Language::kPython, "def f(x):\n    return x\n",
                                                    R"([{"input": [1], "expected_output": 1}])");
        bad_request.request_id = bad_id;
        bool rejected = false;
        try {
            facade.Execute(bad_request);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        Expect(rejected, std::string("invalid_request_id_rejected[") + bad_id + "]");
    }

    SubmissionRequest bad_entry = MakeRequest(Language::kPython, "def f(x):\n    return x\n",
                                              R"([{"input": [1], "expected_output": 1}])");
    bad_entry.entry_point = "f; import os";
    ExecutionReport bad = facade.Execute(bad_entry);
    Expect(bad.status == ReportStatus::kError && bad.error_kind == ErrorKind::kCandidateFault,
           "invalid_entry_point_name");
}

}  // namespace

int main() {
    std::cout << "=== Fallback Execution Test ===" << std::endl;

    InitDefaultConfig();
    std::string root = "/tmp/saferun_fallback_test_" + std::to_string(getpid());
    std::strncpy(g_engine_config.workspace_root, root.c_str(), sizeof(g_engine_config.workspace_root) - 1);

    {
        ExecutionFacade facade(ExecutionMode::kInsecureFallback);
        TestFrontChecks(facade);
        TestPythonScenarios(facade);
        TestJavaScriptScenarios(facade);
        TestForgedResultBlock(facade);
        TestOuterKillAndCancel(facade, root);
        TestDuplicateRequestId(facade, root);
    }

    // 暂存区在每次执行后都被清理
    std::error_code ec;
    bool leftovers = fs::exists(root, ec) && !fs::is_empty(root, ec);
    Expect(!leftovers, "staging_dirs_removed");
    fs::remove_all(root, ec);

    return saferun_test::Finish("Fallback Execution Test");
}
