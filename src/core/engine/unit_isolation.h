#ifndef SAFERUN_UNIT_ISOLATION_H
#define SAFERUN_UNIT_ISOLATION_H

namespace saferun {

    /**
     * @brief 执行单元子进程的入口点 (隔离层)
     * 兼容 clone() 函数签名。
     * @param arg 指向 UnitChildArgs 结构体的指针
     * @return int 仅在 exec 之前失败时返回 (以 SandboxExitCode 退出)
     */
    int UnitChildFn(void* arg);

} // namespace saferun

#endif // SAFERUN_UNIT_ISOLATION_H
