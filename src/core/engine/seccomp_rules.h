#ifndef SAFERUN_SECCOMP_RULES_H
#define SAFERUN_SECCOMP_RULES_H

namespace saferun {

    /**
     * @brief 加载执行单元的 Seccomp 规则
     * 解释器需要的系统调用集合较大 (线程、mmap、信号等), 因此采用
     * 默认允许 + 危险系统调用黑名单策略, 命中黑名单返回 EPERM。
     * @param network_enabled 为 false 时禁止创建非 AF_UNIX 套接字
     * 调用失败会直接以 ERR_SANDBOX_EXCEPTION 终止进程。
     */
    void LoadUnitSeccompRules(bool network_enabled);

} // namespace saferun

#endif // SAFERUN_SECCOMP_RULES_H
