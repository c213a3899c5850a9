#include "fallback_executor.h"
#include "sandbox_internal.h"
#include "unit_process.h"
#include "harness_generator.h"
#include "result_protocol.h"
#include "safety_checker.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>

namespace saferun
{

    namespace fs = std::filesystem;

    namespace {

        // 单个用例的软时钟上限 (秒)
        constexpr double kSoftTestLimitSeconds = 5.0;
        // 外部墙钟在请求超时之外的宽限
        constexpr auto kOuterKillGrace = std::chrono::seconds(1);

        std::string FormatSystemError(const std::string& prefix)
        {
            return prefix + ": " + std::strerror(errno);
        }

        // fork 之后只调用 async-signal-safe 函数
        [[noreturn]] void ExecHarnessChild(int null_fd, int log_fd, const char* work_dir,
                                           rlim_t output_limit, char* const argv[], char* const envp[])
        {
            setpgid(0, 0);
            if (dup2(null_fd, STDIN_FILENO) == -1) _exit(ERR_DUP2);
            if (dup2(log_fd, STDOUT_FILENO) == -1) _exit(ERR_DUP2);
            if (dup2(log_fd, STDERR_FILENO) == -1) _exit(ERR_DUP2);

            bool closed = false;
            #ifdef __NR_close_range
                closed = syscall(__NR_close_range, 3, ~0U, 0) == 0;
            #endif
            if (!closed) {
                for (int fd = 3; fd < 4096; ++fd) close(fd);
            }

            if (chdir(work_dir) != 0) _exit(ERR_CHDIR_FAILED);

            rlimit fsize;
            fsize.rlim_cur = output_limit;
            fsize.rlim_max = output_limit;
            if (setrlimit(RLIMIT_FSIZE, &fsize) == -1) _exit(ERR_RLIMIT_FSIZE);

            execve(argv[0], argv, envp);
            _exit(ERR_EXEC_FAILED);
        }

    } // anonymous namespace

    FallbackExecutor::FallbackExecutor(const std::string& workspace_root)
    {
        std::error_code ec;
        fs::path root_path = fs::absolute(workspace_root, ec);
        if (ec) root_path = workspace_root;

        fs::create_directories(root_path, ec);
        if (ec) {
            throw std::runtime_error("Fallback 初始化失败: 无法创建暂存区根目录 '" + root_path.string() + "': " + ec.message());
        }
        workspace_root_ = root_path.string();
    }

    ExecutionReport FallbackExecutor::Execute(const SubmissionRequest& request, std::stop_token stop)
    {
        ExecutionReport report = Run(request, stop);
        report.detailed_metrics.degraded = true;
        report.warning = kInsecureFallbackWarning;
        return report;
    }

    ExecutionReport FallbackExecutor::Run(const SubmissionRequest& request, std::stop_token stop)
    {
        const auto start_time = std::chrono::steady_clock::now();
        const ResourceLimits limits = request.limits.Normalized();

        if (!request.request_id.empty() && !IsValidRequestId(request.request_id)) {
            throw std::invalid_argument("invalid request_id '" + request.request_id + "'");
        }

        SafetyVerdict verdict = SafetyChecker::Check(request.language, request.source_code);
        if (!verdict.safe) {
            std::cerr << "[Fallback] 拒绝执行: " << verdict.reason << std::endl;
            return MakeErrorReport(ErrorKind::kCandidateFault, "Code safety check failed: " + verdict.reason);
        }

        const std::string unit_id = MakeUnitId(request.request_id);

        const RuntimeConfig& runtime = RuntimeFor(request.language);
        if (access(runtime.interpreter, X_OK) != 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure,
                std::string("Runtime image missing: ") + runtime.interpreter + " is not executable");
        }

        HarnessOptions options;
        options.soft_test_limit_seconds =
            std::min(kSoftTestLimitSeconds, static_cast<double>(limits.wall_clock_timeout_seconds));

        StagedSubmission staged;
        try {
            staged = StageSubmission(workspace_root_, unit_id, request, options);
        } catch (const std::exception& e) {
            return MakeErrorReport(ErrorKind::kInfrastructure,
                std::string("Failed to prepare staging area: ") + e.what());
        }
        DirectoryGuard dir_guard(staged.dir);
        DirectoryGuard log_guard(staged.log_path);

        AutoCloseFd null_fd(open("/dev/null", O_RDWR | O_CLOEXEC));
        if (null_fd.get() < 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("open /dev/null"));
        }
        AutoCloseFd log_fd(open(staged.log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
        if (log_fd.get() < 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("open unit log"));
        }

        // fork 之前备好 argv / envp
        std::vector<std::string> argv_storage;
        argv_storage.emplace_back(runtime.interpreter);
        for (int i = 0; i < runtime.arg_count; ++i) argv_storage.emplace_back(runtime.args[i]);
        argv_storage.push_back(staged.harness_path.string());
        std::vector<std::string> env_storage = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "LANG=C.UTF-8",
            "HOME=" + staged.dir.string(),
            "PYTHONIOENCODING=utf-8",
            "PYTHONDONTWRITEBYTECODE=1",
        };
        std::vector<char*> argv;
        for (auto& a : argv_storage) argv.push_back(a.data());
        argv.push_back(nullptr);
        std::vector<char*> envp;
        for (auto& e : env_storage) envp.push_back(e.data());
        envp.push_back(nullptr);

        const std::string work_dir = staged.dir.string();
        const rlim_t output_limit = static_cast<rlim_t>(g_engine_config.max_output_bytes);

        pid_t pid = fork();
        if (pid == -1) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("fork"));
        }
        if (pid == 0) {
            ExecHarnessChild(null_fd.get(), log_fd.get(), work_dir.c_str(), output_limit,
                             argv.data(), envp.data());
        }

        // ================= 父进程 =================
        setpgid(pid, pid);
        ProcessGuard proc(pid, true);
        log_fd.reset();

        std::cerr << "[Fallback] 警告: 非隔离执行 unit=" << unit_id
                  << " lang=" << LanguageName(request.language) << std::endl;

        int status = 0;
        const auto deadline = start_time + std::chrono::seconds(limits.wall_clock_timeout_seconds) + kOuterKillGrace;
        WaitOutcome outcome = WaitForExit(proc, status, deadline, stop);
        // 组长退出后仍可能留下后台子进程
        ::kill(-pid, SIGKILL);

        const std::size_t max_log = static_cast<std::size_t>(g_engine_config.max_log_bytes);
        const std::size_t max_output = static_cast<std::size_t>(g_engine_config.max_output_bytes);

        ExecutionReport report;
        switch (outcome)
        {
            case WaitOutcome::kTimedOut:
                report = MakeTimeoutReport();
                report.total_execution_time_seconds =
                    std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
                report.logs = TruncateLog(ReadFileBounded(staged.log_path, max_output), max_log);
                return report;

            case WaitOutcome::kCancelled:
                return MakeErrorReport(ErrorKind::kCancelled, "Execution cancelled");

            case WaitOutcome::kError:
                return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("waitpid"));

            case WaitOutcome::kExited:
                break;
        }

        const std::string output = ReadFileBounded(staged.log_path, max_output);
        report = ParseUnitOutput(output, max_log);
        VerifyUnitResults(report, request.test_cases);
        if (report.error_kind == ErrorKind::kProtocol && report.error_message && !ExtractResultBlock(output)) {
            *report.error_message += " (" + DescribeExitStatus(status) + ")";
        }
        return report;
    }

} // namespace saferun
