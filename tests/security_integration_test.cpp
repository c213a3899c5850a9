#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "test_common.h"
#include "sandbox_internal.h"
#include "sandbox_orchestrator.h"

using namespace saferun;
namespace fs = std::filesystem;

namespace {

struct RunOutcome {
    ExecutionReport report;
    double elapsed_seconds = 0.0;
    std::string request_id;
};

std::string ReadSource(const std::string& file) {
    std::ifstream t(std::string(SAFERUN_TEST_CODES_DIR) + "/" + file);
    std::stringstream buffer;
    buffer << t.rdbuf();
    return buffer.str();
}

RunOutcome RunCode(SandboxOrchestrator& sandbox, const std::string& name, Language language,
                   const std::string& file, const char* cases, ResourceLimits limits) {
    SubmissionRequest request;
    request.language = language;
    request.source_code = ReadSource(file);
    request.test_cases = ParseTestCases(Value::parse(cases));
    request.limits = limits;
    request.request_id = "test_" + name + "_" + std::to_string(getpid());

    RunOutcome outcome;
    outcome.request_id = request.request_id;
    auto started = std::chrono::steady_clock::now();
    outcome.report = sandbox.Execute(request);
    outcome.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return outcome;
}

std::string Describe(const ExecutionReport& r) {
    return std::string("status=") + ReportStatusName(r.status) + " kind=" + ErrorKindName(r.error_kind)
         + " passed=" + std::to_string(r.passed_count) + " msg=" + r.error_message.value_or("");
}

// 单元 cgroup 名为 <request_id>_<后缀>
bool UnitGone(const std::string& request_id) {
    const std::string prefix = request_id + "_";
    std::error_code ec;
    for (fs::directory_iterator it("/sys/fs/cgroup/saferun", ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(prefix, 0) == 0) return false;
    }
    return true;
}

void RunTest(SandboxOrchestrator& sandbox, const std::string& name, Language language, const std::string& file,
             const char* cases, ResourceLimits limits,
             const std::function<bool(const RunOutcome&, std::string&)>& verify) {
    if (language == Language::kJavaScript && access(RuntimeFor(language).interpreter, X_OK) != 0) {
        saferun_test::Skip(name, "node not available");
        return;
    }
    RunOutcome outcome = RunCode(sandbox, name, language, file, cases, limits);
    std::string failure_reason;
    bool passed = verify(outcome, failure_reason);
    if (passed && !UnitGone(outcome.request_id)) {
        passed = false;
        failure_reason = "unit cgroup still present after Execute returned";
    }
    saferun_test::Expect(passed, name, failure_reason.empty() ? Describe(outcome.report) : failure_reason);
}

}  // namespace

int main() {
    std::cout << "=== Security Integration Test ===" << std::endl;

    // 1. Load defaults from engine.yaml
    std::string config_path = std::string(SAFERUN_CONFIG_DIR) + "/engine.yaml";
    if (fs::exists(config_path)) {
        if (!LoadConfig(config_path)) {
            std::cerr << "Failed to load " << config_path << std::endl;
            return 1;
        }
    } else {
        std::cerr << "Warning: engine.yaml not found, using built-in defaults." << std::endl;
        InitDefaultConfig();
    }

    // 2. Override for test
    std::strncpy(g_engine_config.workspace_root, "/tmp/saferun_security_test",
                 sizeof(g_engine_config.workspace_root) - 1);
    g_engine_config.max_output_bytes = 1024 * 1024;

    std::string reason;
    if (!SandboxOrchestrator::Probe(&reason)) {
        saferun_test::Skip("security_integration", "isolation runtime unavailable: " + reason);
        return 0;
    }
    if (access(RuntimeFor(Language::kPython).interpreter, X_OK) != 0) {
        saferun_test::Skip("security_integration", "python3 not available");
        return 0;
    }

    ResourceLimits base;
    base.memory_bytes = 64ULL * 1024 * 1024;
    base.cpu_fraction = 1.0;
    base.wall_clock_timeout_seconds = 5;

    try {
        SandboxOrchestrator sandbox(g_engine_config.workspace_root);

        // 1. Infinite loop: 1 秒墙钟超时, 单元被拆除
        ResourceLimits one_second = base;
        one_second.wall_clock_timeout_seconds = 1;
        RunTest(sandbox, "timeout", Language::kPython, "infinite_loop.py",
                R"([{"input": [], "expected_output": null}])", one_second,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.status != ReportStatus::kTimeout) { why = Describe(o.report); return false; }
                    if (o.elapsed_seconds > 2.0) { why = "took " + std::to_string(o.elapsed_seconds) + "s"; return false; }
                    return true;
                });

        // 2. Fork Bomb: pids.max 让 fork 失败, 候选函数自行返回
        RunTest(sandbox, "fork_bomb", Language::kPython, "fork_bomb.py",
                R"([{"input": [], "expected_output": "contained"}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.error_kind == ErrorKind::kInfrastructure) { why = Describe(o.report); return false; }
                    // 被 RLIMIT_NPROC / pids.max 限制住, 或者被墙钟终止都算安全
                    if (o.report.status == ReportStatus::kSuccess && !o.report.all_passed) {
                        why = "fork bomb was not contained";
                        return false;
                    }
                    return true;
                });

        // 3. Network: 默认无网络
        RunTest(sandbox, "network_disabled", Language::kPython, "network_test.py",
                R"([{"input": [], "expected_output": "blocked"}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (!o.report.all_passed) { why = Describe(o.report); return false; }
                    return true;
                });

        // 4. Filesystem Escape: 宿主文件不可见, 根目录只读
        RunTest(sandbox, "filesystem_escape", Language::kPython, "filesystem_escape.py",
                R"([{"input": [], "expected_output": "denied"}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.all_passed) return true;
                    if (!o.report.test_results.empty()) why = "leaked: " + o.report.test_results[0].output.dump();
                    else why = Describe(o.report);
                    return false;
                });

        // 5. Syscall Attack: seccomp 拒绝 unshare / mount
        RunTest(sandbox, "syscall_attack", Language::kPython, "syscall_attack.py",
                R"([{"input": [], "expected_output": "blocked"}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.all_passed) return true;
                    if (!o.report.test_results.empty() && o.report.test_results[0].output.is_array()) {
                        why = "allowed: " + o.report.test_results[0].output.dump();
                        return false;
                    }
                    // ctypes 不可用时以错误结束也不算逃逸
                    if (o.report.error_kind == ErrorKind::kInfrastructure) { why = Describe(o.report); return false; }
                    return true;
                });

        // 6. Memory Bomb: MemoryError 或 OOM, 都不能通过
        RunTest(sandbox, "memory_bomb", Language::kPython, "memory_bomb.py",
                R"([{"input": [], "expected_output": null}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.all_passed || o.report.error_kind == ErrorKind::kInfrastructure) {
                        why = Describe(o.report);
                        return false;
                    }
                    return true;
                });

        // 7. Output Bomb: RLIMIT_FSIZE 截断日志
        RunTest(sandbox, "output_bomb", Language::kPython, "output_bomb.py",
                R"([{"input": [], "expected_output": 1}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.status == ReportStatus::kError
                        && o.report.error_message.value_or("").find("Output limit exceeded") != std::string::npos) {
                        return true;
                    }
                    why = Describe(o.report);
                    return false;
                });

        // 8. JS vm escape: 拿到宿主 process 也只能看到单元内的文件系统
        RunTest(sandbox, "vm_escape", Language::kJavaScript, "vm_escape.js",
                R"([{"input": [], "expected_output": "denied"}])", base,
                [](const RunOutcome& o, std::string& why) {
                    if (o.report.all_passed) return true;
                    why = o.report.test_results.empty() ? Describe(o.report)
                                                        : "leaked: " + o.report.test_results[0].output.dump();
                    return false;
                });

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    std::error_code ec;
    fs::remove_all("/tmp/saferun_security_test", ec);
    return saferun_test::Finish("Security Integration Test");
}
