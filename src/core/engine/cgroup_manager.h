#ifndef SAFERUN_CGROUP_MANAGER_H
#define SAFERUN_CGROUP_MANAGER_H

#include <string>
#include <cstdint>
#include <sys/types.h>

namespace saferun {

/**
 * @brief 执行单元的 Cgroups v2 资源限制
 *
 * 每个执行单元独占一个叶子 cgroup: {cgroup_root}/{unit_id}
 * - memory.max + memory.swap.max = 0: 内存上限, 禁止借助 Swap 绕过
 * - pids.max: 进程/线程数上限, 防止 Fork 炸弹
 * - cpu.max: CPU 份额 (quota/period)
 *
 * 遵循 "No Internal Process Constraint": 进程只加入叶子节点,
 * 控制器在父目录的 cgroup.subtree_control 中启用。
 */
class CgroupManager {
public:
    /**
     * @param cgroup_root 单元 cgroup 的父目录, 例如 /sys/fs/cgroup/saferun
     * @param unit_id 执行单元 ID (与暂存区目录同名)
     */
    CgroupManager(const std::string& cgroup_root, const std::string& unit_id);

    /**
     * @brief 析构时杀死残留进程并删除 cgroup 目录
     */
    ~CgroupManager();

    CgroupManager(const CgroupManager&) = delete;
    CgroupManager& operator=(const CgroupManager&) = delete;

    CgroupManager(CgroupManager&& other) noexcept;
    CgroupManager& operator=(CgroupManager&& other) noexcept;

    /**
     * @brief 创建 cgroup 目录并在父目录启用 memory/pids/cpu 控制器
     */
    bool Create();

    /**
     * @param bytes 内存上限 (字节)
     * @param disable_swap 同时写入 memory.swap.max = 0
     */
    bool SetMemoryLimit(uint64_t bytes, bool disable_swap = true);

    bool SetPidsLimit(int max_pids);

    /**
     * @brief 设置 CPU 配额
     * @param max_cores 可用核数上限 (0.5 表示半个核), 写入 "quota period"
     */
    bool SetCPULimit(double max_cores);

    /**
     * @brief 向 cgroup.procs 写入 PID (子进程在此之前阻塞在同步管道上)
     */
    bool AddProcess(pid_t pid);

    /**
     * @brief 峰值内存 (memory.peak, 不存在时回退到 memory.current), 字节
     */
    uint64_t GetMemoryPeak() const;
    uint64_t GetMemoryCurrent() const;

    /**
     * @brief memory.events 中 oom_kill 计数是否大于 0
     */
    bool WasOomKilled() const;

    /**
     * @brief 杀死 cgroup 内所有进程并删除目录
     * rmdir 只对空 cgroup 有效, 因此先 cgroup.kill / 逐个 SIGKILL
     */
    void Destroy();

    const std::string& GetPath() const { return cgroup_path_; }
    bool IsCreated() const { return created_; }

    /**
     * @brief /sys/fs/cgroup 是否为 cgroup2 文件系统
     */
    static bool IsSupported();

private:
    bool WriteToFile(const std::string& path, const std::string& value);
    std::string ReadFromFile(const std::string& path) const;
    void KillAllProcesses();
    bool EnsureParentReady();

private:
    std::string cgroup_root_;
    std::string unit_id_;
    std::string cgroup_path_;   ///< cgroup_root_ + "/" + unit_id_
    bool created_ = false;
};

} // namespace saferun

#endif // SAFERUN_CGROUP_MANAGER_H
