#include "unit_process.h"
#include "sandbox_internal.h"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace saferun {

    namespace fs = std::filesystem;

    ProcessGuard::ProcessGuard(pid_t pid, bool kill_group)
        : pid_(pid), kill_group_(kill_group), released_(false)
    {
    }

    ProcessGuard::~ProcessGuard()
    {
        cleanup();
    }

    ProcessGuard::ProcessGuard(ProcessGuard&& other) noexcept
        : pid_(other.pid_), kill_group_(other.kill_group_), released_(other.released_)
    {
        other.pid_ = -1;
        other.released_ = true;
    }

    ProcessGuard& ProcessGuard::operator=(ProcessGuard&& other) noexcept
    {
        if (this != &other) {
            cleanup();

            pid_ = other.pid_;
            kill_group_ = other.kill_group_;
            released_ = other.released_;

            other.pid_ = -1;
            other.released_ = true;
        }
        return *this;
    }

    pid_t ProcessGuard::wait_nonblock(int& status)
    {
        if (pid_ <= 0) return -1;
        for (;;) {
            pid_t w = waitpid(pid_, &status, WNOHANG);
            if (w == -1 && errno == EINTR) continue;
            return w;
        }
    }

    pid_t ProcessGuard::wait(int& status)
    {
        if (pid_ <= 0) return -1;
        for (;;) {
            pid_t w = waitpid(pid_, &status, 0);
            if (w == -1 && errno == EINTR) continue;
            return w;
        }
    }

    bool ProcessGuard::kill()
    {
        if (pid_ <= 0) return false;
        if (kill_group_) {
            // 进程组可能已随组长退出, 此时回退到单个 PID
            if (::kill(-pid_, SIGKILL) == 0) return true;
        }
        return ::kill(pid_, SIGKILL) == 0;
    }

    void ProcessGuard::cleanup()
    {
        if (released_ || pid_ <= 0) return;

        int status;
        pid_t w = waitpid(pid_, &status, WNOHANG);
        if (w == 0) {
            kill();
            for (;;) {
                pid_t r = waitpid(pid_, &status, 0);
                if (r == -1 && errno == EINTR) continue;
                break;
            }
        } else if (kill_group_) {
            // 组长已退出, 清理它留下的孙进程
            ::kill(-pid_, SIGKILL);
        }
        released_ = true;
        pid_ = -1;
    }

    void AutoCloseFd::reset(int fd)
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    DirectoryGuard::DirectoryGuard(fs::path p) : path_(std::move(p)), committed_(false) {}

    DirectoryGuard::DirectoryGuard(DirectoryGuard&& other) noexcept
        : path_(std::move(other.path_)), committed_(other.committed_)
    {
        other.committed_ = true;
    }

    DirectoryGuard::~DirectoryGuard()
    {
        if (committed_) return;
        std::error_code ec;
        if (fs::exists(path_, ec)) {
            fs::remove_all(path_, ec);
            if (ec) {
                std::cerr << "[沙箱] 清理警告: 无法删除 " << path_ << ": " << ec.message() << std::endl;
            }
        }
    }

    namespace {

        bool IsSafeNameChars(const std::string& name)
        {
            for (char c : name) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
            }
            return true;
        }

        // 单元名 = request_id (<= 64) + "_" + 生成的后缀
        bool IsValidUnitName(const std::string& name)
        {
            return !name.empty() && name.length() <= 128 && IsSafeNameChars(name);
        }

    } // anonymous namespace

    bool IsValidRequestId(const std::string& id)
    {
        return !id.empty() && id.length() <= 64 && IsSafeNameChars(id);
    }

    std::string GenerateRequestId()
    {
        static std::atomic<unsigned long> counter{0};
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<unsigned> dist(0, 0xFFFF);

        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "%04x", dist(rng));
        return "run_" + std::to_string(getpid()) + "_" + std::to_string(++counter) + "_" + suffix;
    }

    std::string MakeUnitId(const std::string& request_id)
    {
        if (request_id.empty()) return GenerateRequestId();
        return request_id + "_" + GenerateRequestId();
    }

    namespace {

        void WriteStagedFile(const fs::path& path, const std::string& content)
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                throw std::runtime_error("无法打开文件进行写入: " + path.string());
            }
            ofs << content;
            ofs.flush();
            if (!ofs.good()) {
                throw std::runtime_error("写入文件时发生 I/O 错误: " + path.string());
            }
            ofs.close();
            if (chmod(path.c_str(), 0644) != 0) {
                throw std::runtime_error("无法设置文件权限: " + path.string() + ": " + std::strerror(errno));
            }
        }

    } // anonymous namespace

    StagedSubmission StageSubmission(const fs::path& workspace_root,
                                     const std::string& unit_id,
                                     const SubmissionRequest& request,
                                     const HarnessOptions& options)
    {
        if (!IsValidUnitName(unit_id)) {
            throw std::runtime_error("安全违规: 单元名包含非法字符 '" + unit_id + "'");
        }

        StagedSubmission staged;
        staged.dir = workspace_root / unit_id;
        staged.log_path = workspace_root / (unit_id + ".log");
        staged.harness_path = staged.dir / HarnessFileName(request.language);

        // 单次使用: 目录必须是新建的, 不能复用其他提交的暂存区
        if (mkdir(staged.dir.c_str(), 0755) != 0) {
            throw std::runtime_error("无法创建暂存目录 '" + staged.dir.string() + "': " + std::strerror(errno));
        }
        // 从这里开始目录归本次调用所有, 失败时由它删除
        DirectoryGuard created(staged.dir);

        // umask 可能去掉了 group/other 的执行位
        if (chmod(staged.dir.c_str(), 0755) != 0) {
            throw std::runtime_error("无法设置暂存目录权限: " + std::string(std::strerror(errno)));
        }

        WriteStagedFile(staged.dir / SourceFileName(request.language), request.source_code);
        WriteStagedFile(staged.harness_path,
                        GenerateHarness(request.language, request.test_cases.size(),
                                        request.entry_point, options));
        WriteStagedFile(staged.dir / kTestCasesFileName, SerializeTestCases(request.test_cases));

        created.commit();
        return staged;
    }

    std::string ReadFileBounded(const fs::path& path, std::size_t max_bytes)
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) return "";

        std::string content(max_bytes, '\0');
        ifs.read(content.data(), static_cast<std::streamsize>(max_bytes));
        content.resize(static_cast<std::size_t>(ifs.gcount()));

        if (ifs.peek() != std::ifstream::traits_type::eof()) {
            content += "\n...[output truncated]";
        }
        return content;
    }

    std::string GetExitCodeDescription(int code)
    {
        switch (code)
        {
            // Stage 1: Basic Setup / Exec
            case ERR_OPEN_OUTPUT:   return "无法打开输出文件 (IO Redirect)";
            case ERR_DUP2:          return "dup2 调用失败 (IO Redirect)";
            case ERR_SYNC_FAILED:   return "等待 cgroup 挂接失败 (父进程已放弃)";
            case ERR_EXEC_FAILED:   return "execve 调用失败 (解释器启动失败)";
            case ERR_CHDIR_FAILED:  return "chdir/chmod 根目录失败";
            case ERR_SETGID_FAILED: return "setgid 失败 (降权失败)";
            case ERR_SETUID_FAILED: return "setuid 失败 (降权失败)";

            // Stage 2: Resource Limits
            case ERR_RLIMIT_CPU:    return "setrlimit(CPU) 失败";
            case ERR_RLIMIT_MEMORY: return "setrlimit(AS) 失败";
            case ERR_RLIMIT_STACK:  return "setrlimit(STACK) 失败";
            case ERR_RLIMIT_NPROC:  return "setrlimit(NPROC) 失败";
            case ERR_RLIMIT_FSIZE:  return "setrlimit(FSIZE/CORE) 失败";

            // Stage 3: Isolation / Rootfs
            case ERR_MOUNT_PRIVATE:     return "mount --make-rprivate 失败";
            case ERR_MOUNT_BIND_SELF:   return "bind mount 暂存区失败";
            case ERR_MOUNT_BIND_LIB:    return "bind mount 运行时目录失败";
            case ERR_REMOUNT_RO:        return "remount (RO) 失败";
            case ERR_PIVOT_ROOT:        return "pivot_root 系统调用失败";
            case ERR_CHDIR_NEW_ROOT:    return "切换到新根目录失败";
            case ERR_UMOUNT_OLD:        return "umount /old_root 失败";
            case ERR_MOUNT_PROC:        return "mount /proc 失败";
            case ERR_MOUNT_TMP:         return "mount /tmp (tmpfs) 失败";
            case ERR_MKDIR_FAILED:      return "mkdir (构建 Rootfs) 失败";
            case ERR_SANDBOX_EXCEPTION: return "no_new_privs / seccomp 加载失败";

            default: return "与系统相关的未知错误";
        }
    }

    WaitOutcome WaitForExit(ProcessGuard& proc,
                            int& status,
                            std::chrono::steady_clock::time_point deadline,
                            std::stop_token stop)
    {
        while (true)
        {
            pid_t w = proc.wait_nonblock(status);

            if (w == -1)
            {
                if (errno == EINTR) continue;
                return WaitOutcome::kError;
            }

            if (w != 0)
            {
                proc.release();
                return WaitOutcome::kExited;
            }

            if (stop.stop_requested())
            {
                proc.kill();
                proc.wait(status);
                proc.release();
                return WaitOutcome::kCancelled;
            }

            if (std::chrono::steady_clock::now() >= deadline)
            {
                proc.kill();
                proc.wait(status);
                proc.release();
                return WaitOutcome::kTimedOut;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    std::string DescribeExitStatus(int status)
    {
        if (WIFEXITED(status)) {
            return "exit code " + std::to_string(WEXITSTATUS(status));
        }
        if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            const char* name = strsignal(sig);
            return "signal " + std::to_string(sig) + " (" + (name ? name : "unknown") + ")";
        }
        return "unknown status";
    }

} // namespace saferun
