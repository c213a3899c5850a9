#ifndef SAFERUN_EXECUTION_FACADE_H
#define SAFERUN_EXECUTION_FACADE_H

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "execution_types.h"

namespace saferun
{
    class SandboxOrchestrator;
    class FallbackExecutor;

    /**
     * @brief 进程级缓存的隔离运行时探测结果
     * 首次调用时在 std::call_once 下探测一次, 之后不再重新探测。
     */
    bool IsolationRuntimeAvailable();

    /**
     * @brief 对外唯一入口: 选择隔离执行或降级执行, 统一返回 ExecutionReport
     *
     * 对候选代码故障、超时、基础设施故障都不抛出; 只有调用方误用
     * (test_cases 为空) 抛出 std::invalid_argument。
     */
    class ExecutionFacade
    {
    public:
        /**
         * @param mode kAuto 按探测结果选择; kIsolated 强制隔离; kInsecureFallback 强制降级
         * 工作区与 allow_insecure_fallback 取自 g_engine_config
         */
        explicit ExecutionFacade(ExecutionMode mode = ExecutionMode::kAuto);
        ~ExecutionFacade();

        ExecutionFacade(const ExecutionFacade&) = delete;
        ExecutionFacade& operator=(const ExecutionFacade&) = delete;

        /**
         * @throw std::invalid_argument request.test_cases 为空, 或 request_id 非法
         */
        ExecutionReport Execute(const SubmissionRequest& request, std::stop_token stop = {});

        /**
         * @brief 入站调用契约: 语言名 + 源码 + 用例, 其余取默认值
         * @throw std::invalid_argument test_cases 为空
         */
        ExecutionReport ExecuteCandidateCode(const std::string& language,
                                             const std::string& code,
                                             const std::vector<TestCase>& test_cases);

        ExecutionMode mode() const { return mode_; }

    private:
        ExecutionReport Dispatch(const SubmissionRequest& request, std::stop_token stop);
        ExecutionReport RunIsolated(const SubmissionRequest& request, std::stop_token stop);
        ExecutionReport RunFallback(const SubmissionRequest& request, std::stop_token stop);

        ExecutionMode mode_;
        std::unique_ptr<SandboxOrchestrator> orchestrator_;
        std::unique_ptr<FallbackExecutor> fallback_;
    };

    /**
     * @brief 使用进程级默认 facade (mode 取自配置) 执行一次提交
     * @throw std::invalid_argument test_cases 为空
     */
    ExecutionReport ExecuteCandidateCode(const std::string& language,
                                         const std::string& code,
                                         const std::vector<TestCase>& test_cases);

    /**
     * @brief 运行环境可用性报告 (JSON)
     * { "isolation_available", "isolation_detail", "cgroup_v2", "mode",
     *   "allow_insecure_fallback", "runtimes": { "python": {...}, "javascript": {...} }, "ready" }
     */
    Value CheckRuntime();

} // namespace saferun

#endif // SAFERUN_EXECUTION_FACADE_H
