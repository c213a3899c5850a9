#ifndef SAFERUN_FALLBACK_EXECUTOR_H
#define SAFERUN_FALLBACK_EXECUTOR_H

#include <stop_token>
#include <string>

#include "execution_types.h"

namespace saferun
{
    constexpr const char* kInsecureFallbackWarning = "Executed without isolation (insecure fallback)";

    /**
     * @brief 降级执行器 (仅限本地开发)
     * 与 SandboxOrchestrator 相同的契约, 但 harness 作为宿主机上的普通子进程运行:
     * 没有 namespaces / cgroup / seccomp / 降权。保留 harness 的单用例软时钟与外部墙钟强杀。
     * 每份报告都带 detailed_metrics.degraded = true 与 warning。
     */
    class FallbackExecutor
    {
    public:
        /**
         * @throw std::runtime_error 如果无法创建暂存区根目录
         */
        explicit FallbackExecutor(const std::string& workspace_root);

        /**
         * @throw std::invalid_argument request_id 非法
         */
        ExecutionReport Execute(const SubmissionRequest& request, std::stop_token stop = {});

    private:
        ExecutionReport Run(const SubmissionRequest& request, std::stop_token stop);

        std::string workspace_root_;
    };
}

#endif // SAFERUN_FALLBACK_EXECUTOR_H
