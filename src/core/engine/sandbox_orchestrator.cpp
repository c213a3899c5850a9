#include "sandbox_orchestrator.h"
#include "sandbox_internal.h"
#include "unit_isolation.h"
#include "unit_process.h"
#include "cgroup_manager.h"
#include "harness_generator.h"
#include "result_protocol.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

// 父进程使用的系统调用
#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/wait.h>
#include <sched.h>
#include <signal.h>

namespace saferun
{

    namespace fs = std::filesystem;

    namespace {

        constexpr const char* kCgroupRoot = "/sys/fs/cgroup/saferun";
        constexpr std::uint64_t kMinAddressSpace = 256ULL * 1024 * 1024;

        std::string FormatSystemError(const std::string& prefix)
        {
            return prefix + ": " + std::strerror(errno);
        }

        double SecondsSince(std::chrono::steady_clock::time_point start)
        {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        }

        void CopyField(char* dst, std::size_t cap, const std::string& src)
        {
            std::strncpy(dst, src.c_str(), cap - 1);
            dst[cap - 1] = '\0';
        }

        // argv/envp 指向 args 内部存储, clone 之后子进程只读访问
        void BuildCommandLine(UnitChildArgs& args, const RuntimeConfig& runtime, Language language)
        {
            CopyField(args.exec_path, sizeof(args.exec_path), runtime.interpreter);

            int argc = 0;
            CopyField(args.argv_storage[argc++], sizeof(args.argv_storage[0]), runtime.interpreter);
            for (int i = 0; i < runtime.arg_count; ++i) {
                CopyField(args.argv_storage[argc++], sizeof(args.argv_storage[0]), runtime.args[i]);
            }
            // 暂存区在单元内就是根目录
            CopyField(args.argv_storage[argc++], sizeof(args.argv_storage[0]),
                      std::string("/") + HarnessFileName(language));
            for (int i = 0; i < argc; ++i) args.argv[i] = args.argv_storage[i];
            args.argv[argc] = nullptr;

            const char* env[] = {
                "PATH=/usr/local/bin:/usr/bin:/bin",
                "LANG=C.UTF-8",
                "HOME=/tmp",
                "PYTHONIOENCODING=utf-8",
                "PYTHONDONTWRITEBYTECODE=1",
            };
            int envc = 0;
            for (const char* e : env) {
                CopyField(args.env_storage[envc], sizeof(args.env_storage[0]), e);
                args.envp[envc] = args.env_storage[envc];
                ++envc;
            }
            args.envp[envc] = nullptr;
        }

        bool IsSetupExitCode(int code)
        {
            switch (code) {
                case ERR_OPEN_OUTPUT: case ERR_DUP2: case ERR_SYNC_FAILED: case ERR_EXEC_FAILED:
                case ERR_CHDIR_FAILED: case ERR_SETGID_FAILED: case ERR_SETUID_FAILED:
                case ERR_RLIMIT_CPU: case ERR_RLIMIT_MEMORY: case ERR_RLIMIT_STACK:
                case ERR_RLIMIT_NPROC: case ERR_RLIMIT_FSIZE:
                    return true;
                default:
                    return code >= ERR_MOUNT_PRIVATE && code <= ERR_MOUNT_TMP;
            }
        }

        // 没有结果块时, 根据退出状态与资源使用推断原因
        ExecutionReport DiagnoseMissingResult(ExecutionReport protocol_report,
                                              int status,
                                              const CgroupManager* cgroup,
                                              const ResourceLimits& limits,
                                              std::uintmax_t log_size)
        {
            if (WIFEXITED(status)) {
                int code = WEXITSTATUS(status);
                if (IsSetupExitCode(code)) {
                    ExecutionReport report = MakeErrorReport(
                        ErrorKind::kInfrastructure,
                        "Execution unit setup failed (exit code " + std::to_string(code) + "): "
                            + GetExitCodeDescription(code));
                    report.logs = protocol_report.logs;
                    return report;
                }
            }

            if (log_size >= static_cast<std::uintmax_t>(g_engine_config.max_output_bytes)) {
                ExecutionReport report = MakeErrorReport(ErrorKind::kCandidateFault, "Output limit exceeded");
                report.logs = protocol_report.logs;
                return report;
            }

            if (cgroup) {
                std::uint64_t peak = cgroup->GetMemoryPeak();
                if (cgroup->WasOomKilled() || peak >= limits.memory_bytes / 100 * 95) {
                    ExecutionReport report = MakeErrorReport(ErrorKind::kCandidateFault, "Memory limit exceeded");
                    report.logs = protocol_report.logs;
                    return report;
                }
            }

            if (WIFSIGNALED(status)) {
                int sig = WTERMSIG(status);
                if (sig == SIGXCPU) {
                    ExecutionReport report = MakeTimeoutReport();
                    report.error_message = "CPU time limit exceeded";
                    report.logs = protocol_report.logs;
                    return report;
                }
                if (sig == SIGXFSZ) {
                    ExecutionReport report = MakeErrorReport(ErrorKind::kCandidateFault, "Output limit exceeded");
                    report.logs = protocol_report.logs;
                    return report;
                }
                ExecutionReport report = MakeErrorReport(
                    ErrorKind::kCandidateFault,
                    "Execution unit terminated by " + DescribeExitStatus(status));
                report.logs = protocol_report.logs;
                return report;
            }

            protocol_report.error_message = *protocol_report.error_message + " (" + DescribeExitStatus(status) + ")";
            return protocol_report;
        }

        int ProbeChildFn(void*)
        {
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1) _exit(ERR_MOUNT_PRIVATE);
            _exit(0);
            return 0;
        }

    } // anonymous namespace

    SandboxOrchestrator::SandboxOrchestrator(const std::string& workspace_root)
    {
        std::error_code ec;
        fs::path root_path = fs::absolute(workspace_root, ec);
        if (ec) root_path = workspace_root;

        fs::create_directories(root_path, ec);
        if (ec)
        {
            throw std::runtime_error("Sandbox 初始化失败: 无法创建暂存区根目录 '" + root_path.string() + "': " + ec.message());
        }
        workspace_root_ = root_path.string();
    }

    bool SandboxOrchestrator::Probe(std::string* reason)
    {
        auto fail = [reason](const std::string& why) {
            if (reason) *reason = why;
            return false;
        };

        auto stack_mem = std::make_unique<char[]>(64 * 1024);
        char* stack_top = stack_mem.get() + 64 * 1024;

        pid_t pid = clone(ProbeChildFn, stack_top,
                          CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS | SIGCHLD,
                          nullptr);
        if (pid == -1) {
            return fail(FormatSystemError("clone (namespaces)"));
        }

        ProcessGuard proc(pid);
        int status = 0;
        WaitOutcome outcome = WaitForExit(proc, status,
                                          std::chrono::steady_clock::now() + std::chrono::seconds(5),
                                          std::stop_token{});
        if (outcome != WaitOutcome::kExited) {
            return fail("probe unit did not exit in time");
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            return fail("probe unit failed: " + DescribeExitStatus(status));
        }
        if (reason) reason->clear();
        return true;
    }

    ExecutionReport SandboxOrchestrator::Execute(const SubmissionRequest& request, std::stop_token stop)
    {
        const auto start_time = std::chrono::steady_clock::now();
        const ResourceLimits limits = request.limits.Normalized();

        if (!request.request_id.empty() && !IsValidRequestId(request.request_id))
        {
            std::cerr << "[Security] 严重警告: 检测到非法 request_id '" << request.request_id << "'。请求已拒绝。\n";
            throw std::invalid_argument("invalid request_id '" + request.request_id + "'");
        }
        // 调用方的 ID 只作前缀, 每次执行都有自己独占的单元名
        const std::string unit_id = MakeUnitId(request.request_id);

        // 1. 运行时 ("最小运行时镜像") 必须存在
        const RuntimeConfig& runtime = RuntimeFor(request.language);
        if (access(runtime.interpreter, X_OK) != 0)
        {
            return MakeErrorReport(ErrorKind::kInfrastructure,
                std::string("Runtime image missing: ") + runtime.interpreter + " is not executable");
        }

        // 2. 暂存区
        StagedSubmission staged;
        try {
            staged = StageSubmission(workspace_root_, unit_id, request, HarnessOptions{});
        } catch (const std::exception& e) {
            return MakeErrorReport(ErrorKind::kInfrastructure,
                std::string("Failed to prepare staging area: ") + e.what());
        }
        DirectoryGuard dir_guard(staged.dir);
        DirectoryGuard log_guard(staged.log_path);
        if (staged.dir.string().size() >= sizeof(UnitChildArgs::work_dir)) {
            return MakeErrorReport(ErrorKind::kInfrastructure,
                "Staging path too long for execution unit: " + staged.dir.string());
        }

        // 3. 准备 FD
        AutoCloseFd null_fd(open("/dev/null", O_RDWR | O_CLOEXEC));
        if (null_fd.get() < 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("open /dev/null"));
        }
        AutoCloseFd log_fd(open(staged.log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
        if (log_fd.get() < 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("open unit log"));
        }
        int sync_pipe[2];
        if (pipe2(sync_pipe, O_CLOEXEC) != 0) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("pipe2"));
        }
        AutoCloseFd sync_read(sync_pipe[0]);
        AutoCloseFd sync_write(sync_pipe[1]);

        // 4. 子进程参数
        UnitChildArgs args;
        std::memset(&args, 0, sizeof(args));
        CopyField(args.work_dir, sizeof(args.work_dir), staged.dir.string());
        BuildCommandLine(args, runtime, request.language);

        args.memory_limit_bytes = runtime.address_space_limit
            ? static_cast<rlim_t>(std::max<std::uint64_t>(limits.memory_bytes * 2, kMinAddressSpace))
            : 0;
        args.cpu_time_limit_s = static_cast<rlim_t>(limits.wall_clock_timeout_seconds) + 1;
        args.output_limit_bytes = static_cast<rlim_t>(g_engine_config.max_output_bytes);
        args.nproc_limit = static_cast<rlim_t>(g_engine_config.nproc_limit);
        args.tmpfs_size_mb = g_engine_config.run_tmpfs_size_mb;
        args.run_uid = g_engine_config.run_uid;
        args.run_gid = g_engine_config.run_gid;
        args.network_enabled = limits.network_enabled;
        args.null_fd = null_fd.get();
        args.log_fd = log_fd.get();
        args.sync_fd = sync_read.get();
        args.sync_write_fd = sync_write.get();

        // 5. [Cgroups v2] 硬限制层; 不支持时降级为仅 setrlimit
        std::unique_ptr<CgroupManager> cgroup;
        if (CgroupManager::IsSupported()) {
            cgroup = std::make_unique<CgroupManager>(kCgroupRoot, unit_id);
            if (cgroup->Create()) {
                int pids_limit = g_engine_config.pids_limit > 0 ? g_engine_config.pids_limit : 64;
                bool ok = cgroup->SetMemoryLimit(limits.memory_bytes, true);
                ok = cgroup->SetPidsLimit(pids_limit) && ok;
                // cpu 控制器可能未委派, 失败时只告警
                cgroup->SetCPULimit(limits.cpu_fraction);
                if (!ok) {
                    return MakeErrorReport(ErrorKind::kInfrastructure,
                        "Failed to apply cgroup limits to " + cgroup->GetPath());
                }
            } else {
                std::cerr << "[沙箱] Cgroups v2 初始化失败，降级到 setrlimit 模式" << std::endl;
                cgroup.reset();
            }
        }

        // 6. Clone 子进程 (隔离层)
        auto stack_mem = std::make_unique<char[]>(STACK_SIZE);
        char* stack_top = stack_mem.get() + STACK_SIZE;

        int flags = CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | SIGCHLD;
        if (!limits.network_enabled) flags |= CLONE_NEWNET;

        pid_t pid = clone(UnitChildFn, stack_top, flags, &args);
        if (pid == -1)
        {
            std::cerr << "[沙箱] clone 调用失败: " << std::strerror(errno) << std::endl;
            return MakeErrorReport(ErrorKind::kInfrastructure,
                FormatSystemError("Failed to create execution unit: clone"));
        }

        // ================= 父进程 =================
        ProcessGuard proc(pid);
        sync_read.reset();

        if (cgroup && !cgroup->AddProcess(pid)) {
            return MakeErrorReport(ErrorKind::kInfrastructure, "Failed to attach execution unit to its cgroup");
        }

        // 子进程在此之前阻塞, 保证 exec 时已处于 cgroup 限制之下
        const char go = 1;
        if (write(sync_write.get(), &go, 1) != 1) {
            return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("Failed to start execution unit"));
        }
        sync_write.reset();
        log_fd.reset();

        std::cerr << "[沙箱] 执行单元已启动 unit=" << unit_id << " pid=" << pid
                  << " lang=" << LanguageName(request.language)
                  << " cgroup=" << (cgroup ? "on" : "off") << std::endl;

        // 7. 带截止时间的等待
        int status = 0;
        const auto deadline = start_time + std::chrono::seconds(limits.wall_clock_timeout_seconds);
        WaitOutcome outcome = WaitForExit(proc, status, deadline, stop);

        const std::size_t max_log = static_cast<std::size_t>(g_engine_config.max_log_bytes);
        const std::size_t max_output = static_cast<std::size_t>(g_engine_config.max_output_bytes);

        ExecutionReport report;
        switch (outcome)
        {
            case WaitOutcome::kTimedOut:
                report = MakeTimeoutReport();
                report.total_execution_time_seconds = SecondsSince(start_time);
                report.logs = TruncateLog(ReadFileBounded(staged.log_path, max_output), max_log);
                std::cerr << "[沙箱] 执行超时, 已强制终止 unit=" << unit_id << std::endl;
                return report;

            case WaitOutcome::kCancelled:
                report = MakeErrorReport(ErrorKind::kCancelled, "Execution cancelled");
                report.total_execution_time_seconds = SecondsSince(start_time);
                std::cerr << "[沙箱] 调用方取消, 已强制终止 unit=" << unit_id << std::endl;
                return report;

            case WaitOutcome::kError:
                return MakeErrorReport(ErrorKind::kInfrastructure, FormatSystemError("waitpid"));

            case WaitOutcome::kExited:
                break;
        }

        // 8. 解析输出
        const std::string output = ReadFileBounded(staged.log_path, max_output);
        report = ParseUnitOutput(output, max_log);
        VerifyUnitResults(report, request.test_cases);

        if (report.error_kind == ErrorKind::kProtocol && !ExtractResultBlock(output)) {
            std::error_code ec;
            std::uintmax_t log_size = fs::file_size(staged.log_path, ec);
            if (ec) log_size = 0;
            report = DiagnoseMissingResult(std::move(report), status, cgroup.get(), limits, log_size);
        }

        if (report.total_execution_time_seconds <= 0.0 && report.test_results.empty()) {
            report.total_execution_time_seconds = SecondsSince(start_time);
        }

        std::cerr << "[沙箱] 执行完成 unit=" << unit_id
                  << " status=" << ReportStatusName(report.status)
                  << " passed=" << report.passed_count << " failed=" << report.failed_count << std::endl;

        // 9. 拆除: cgroup -> 暂存区 -> 日志 (析构顺序)
        return report;
    }

} // namespace saferun
