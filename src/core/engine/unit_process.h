#ifndef SAFERUN_UNIT_PROCESS_H
#define SAFERUN_UNIT_PROCESS_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <string>

#include <sys/types.h>
#include <sys/resource.h>

#include "execution_types.h"
#include "harness_generator.h"

namespace saferun {

    // 以下工具只在父进程使用, 允许 C++ 特性

    /**
     * @brief 子进程 RAII: 析构时若仍在运行则 SIGKILL 并阻塞收尸
     * kill_group 为 true 时信号发往整个进程组 (非隔离路径)
     */
    class ProcessGuard
    {
    public:
        explicit ProcessGuard(pid_t pid, bool kill_group = false);
        ~ProcessGuard();

        ProcessGuard(const ProcessGuard&) = delete;
        ProcessGuard& operator=(const ProcessGuard&) = delete;
        ProcessGuard(ProcessGuard&& other) noexcept;
        ProcessGuard& operator=(ProcessGuard&& other) noexcept;

        pid_t wait_nonblock(int& status);
        pid_t wait(int& status);
        bool kill();
        void release() { released_ = true; pid_ = -1; }
        pid_t pid() const { return pid_; }

    private:
        void cleanup();

        pid_t pid_;
        bool kill_group_;
        bool released_;
    };

    class AutoCloseFd
    {
    public:
        explicit AutoCloseFd(int fd = -1) : fd_(fd) {}
        ~AutoCloseFd() { reset(); }
        AutoCloseFd(const AutoCloseFd&) = delete;
        AutoCloseFd& operator=(const AutoCloseFd&) = delete;

        int get() const { return fd_; }
        void reset(int fd = -1);

    private:
        int fd_;
    };

    /**
     * @brief 作用域哨兵: 析构时删除目录 (除非 commit)
     */
    class DirectoryGuard
    {
    public:
        explicit DirectoryGuard(std::filesystem::path p);
        ~DirectoryGuard();

        DirectoryGuard(const DirectoryGuard&) = delete;
        DirectoryGuard& operator=(const DirectoryGuard&) = delete;
        DirectoryGuard(DirectoryGuard&& other) noexcept;
        DirectoryGuard& operator=(DirectoryGuard&&) = delete;

        void commit() { committed_ = true; }

    private:
        std::filesystem::path path_;
        bool committed_;
    };

    /**
     * @brief 请求 ID 只允许字母数字、'_' 与 '-', 最长 64 (防止路径遍历)
     */
    bool IsValidRequestId(const std::string& id);

    /**
     * @brief 生成进程内唯一的请求 ID: run_<pid>_<序号>_<随机后缀>
     */
    std::string GenerateRequestId();

    /**
     * @brief 执行单元名 (暂存目录 / cgroup 共用): <request_id>_<GenerateRequestId()>
     * 调用方给出的 request_id 只作前缀, 重复或重试的 ID 不会落到同一个单元上
     */
    std::string MakeUnitId(const std::string& request_id);

    /**
     * @brief 单次提交的暂存区: <workspace>/<unit_id>/ 与宿主侧日志文件
     */
    struct StagedSubmission
    {
        std::filesystem::path dir;
        std::filesystem::path harness_path;
        std::filesystem::path log_path;   // <workspace>/<unit_id>.log
    };

    /**
     * @brief 写入 solution / harness / tests.json (文件 0644, 目录 0755)
     * 失败时只删除本次调用自己创建的目录; 已存在的目录原样保留
     * @throw std::runtime_error 目录已存在或任何 I/O 失败
     */
    StagedSubmission StageSubmission(const std::filesystem::path& workspace_root,
                                     const std::string& unit_id,
                                     const SubmissionRequest& request,
                                     const HarnessOptions& options);

    /**
     * @brief 读取文件前 max_bytes 字节, 超出部分丢弃并追加截断提示
     */
    std::string ReadFileBounded(const std::filesystem::path& path, std::size_t max_bytes);

    /**
     * @brief 隔离层退出码 (120-200) 的文字说明
     */
    std::string GetExitCodeDescription(int code);

    enum class WaitOutcome {
        kExited,
        kTimedOut,
        kCancelled,
        kError
    };

    /**
     * @brief 50ms 轮询等待子进程, 直到退出、超过 deadline 或 stop 被请求
     * 超时与取消时子进程已被 SIGKILL 并收尸
     */
    WaitOutcome WaitForExit(ProcessGuard& proc,
                            int& status,
                            std::chrono::steady_clock::time_point deadline,
                            std::stop_token stop);

    /**
     * @brief 子进程退出状态的描述 ("exit code N" / "signal N (SIGXXX)")
     */
    std::string DescribeExitStatus(int status);

} // namespace saferun

#endif // SAFERUN_UNIT_PROCESS_H
