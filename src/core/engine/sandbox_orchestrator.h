#ifndef SAFERUN_SANDBOX_ORCHESTRATOR_H
#define SAFERUN_SANDBOX_ORCHESTRATOR_H

#include <stop_token>
#include <string>

#include "execution_types.h"

namespace saferun
{
    /**
     * @brief 沙箱编排器
     * 每次 Execute 创建一个一次性的隔离执行单元:
     * 暂存区 -> cgroup -> clone(namespaces) -> 带截止时间的等待 -> 解析结果块 -> 无条件拆除
     */
    class SandboxOrchestrator
    {
    public:
        /**
         * @param workspace_root 暂存区根目录 (例如 /tmp/saferun)
         * @throw std::runtime_error 如果无法创建根目录
         */
        explicit SandboxOrchestrator(const std::string& workspace_root);

        /**
         * @brief 在隔离执行单元中运行一次提交
         * 同步调用, 可被多个线程并发调用 (每次调用独占自己的单元)。
         * 除编程误用外不抛出异常, 所有失败都体现在返回的报告中。
         *
         * @param stop 调用方取消请求; 触发后强制杀死单元并返回 ErrorKind::kCancelled
         * @throw std::invalid_argument request_id 非空且含非法字符或超过 64 字符
         */
        ExecutionReport Execute(const SubmissionRequest& request, std::stop_token stop = {});

        /**
         * @brief 探测当前进程能否创建执行单元 (namespaces + 私有挂载)
         * @param reason 失败时写入原因, 可为 nullptr
         */
        static bool Probe(std::string* reason = nullptr);

        const std::string& workspace_root() const { return workspace_root_; }

    private:
        std::string workspace_root_;
    };
}

#endif // SAFERUN_SANDBOX_ORCHESTRATOR_H
