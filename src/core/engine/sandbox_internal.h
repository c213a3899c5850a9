#ifndef SAFERUN_SANDBOX_INTERNAL_H
#define SAFERUN_SANDBOX_INTERNAL_H

#include <string>
#include <sys/types.h>
#include <sys/resource.h>
#include <unistd.h>

#include "execution_types.h"

namespace saferun {

    // 子进程栈大小: 8MB (防止 glibc 在 clone 子进程内爆栈)
    const int STACK_SIZE = 8 * 1024 * 1024;

    // 执行单元退出状态码 (仅由隔离层在 exec 之前使用)
    enum SandboxExitCode {
        EXIT_OK = 0,

        // 第一阶段: 基础设置与执行 (120-139)
        ERR_OPEN_OUTPUT      = 120, // 打开日志文件失败
        ERR_DUP2             = 121, // 重定向标准输出/输入失败
        ERR_SYNC_FAILED      = 122, // 等待父进程完成 cgroup 挂接失败
        ERR_EXEC_FAILED      = 127, // execve 执行解释器失败
        ERR_CHDIR_FAILED     = 128, // 切换工作目录失败
        ERR_SETGID_FAILED    = 129, // 设置组 ID 失败
        ERR_SETUID_FAILED    = 130, // 设置用户 ID 失败

        // 第二阶段: 资源限制 (140-159)
        ERR_RLIMIT_CPU       = 141,
        ERR_RLIMIT_MEMORY    = 142,
        ERR_RLIMIT_STACK     = 143,
        ERR_RLIMIT_NPROC     = 144,
        ERR_RLIMIT_FSIZE     = 145,

        // 第三阶段: 隔离与文件系统 (190-200)
        ERR_MOUNT_PRIVATE    = 190, // mount --make-rprivate 失败
        ERR_MOUNT_BIND_SELF  = 191, // bind mount 暂存区失败
        ERR_MOUNT_BIND_LIB   = 192, // 挂载运行时目录 (/usr, /lib...) 失败
        ERR_REMOUNT_RO       = 193, // 重新挂载为只读失败
        ERR_PIVOT_ROOT       = 194,
        ERR_CHDIR_NEW_ROOT   = 195,
        ERR_UMOUNT_OLD       = 196,
        ERR_MOUNT_PROC       = 197,
        ERR_MKDIR_FAILED     = 198,
        ERR_SANDBOX_EXCEPTION = 199, // no_new_privs / seccomp 失败
        ERR_MOUNT_TMP        = 200
    };

    const int kMaxMounts = 16;
    const int kMaxRuntimeArgs = 8;
    const int kRuntimeCount = 2;

    /**
     * @brief 单个语言运行时 ("最小运行时镜像") 的配置
     * interpreter 在宿主机与执行单元内路径一致 (所在目录以只读方式 bind mount)
     */
    struct RuntimeConfig {
        char interpreter[256];
        char args[kMaxRuntimeArgs][128];
        int arg_count;
        // V8 会预留大量虚拟地址空间, 因此 node 不能使用 RLIMIT_AS
        bool address_space_limit;
    };

    struct GlobalConfig {
        // 工作区
        char workspace_root[256];

        // 挂载目录 / 文件 (只读)
        char mount_dirs[kMaxMounts][256];
        int mount_count;
        char mount_files[kMaxMounts][256];
        int mount_file_count;

        // 安全限制
        uid_t run_uid;
        gid_t run_gid;
        long long run_tmpfs_size_mb;
        int pids_limit;
        int nproc_limit;

        // 输出限制
        long long max_output_bytes; // 单元日志文件上限 (RLIMIT_FSIZE)
        long long max_log_bytes;    // 报告中 logs 字段上限

        // 服务
        int pool_size;
        int server_port;

        // 执行模式
        ExecutionMode mode;
        bool allow_insecure_fallback;

        // 默认资源限制
        ResourceLimits default_limits;

        // 下标为 static_cast<int>(Language)
        RuntimeConfig runtimes[kRuntimeCount];
    };
    extern GlobalConfig g_engine_config;

    /**
     * @brief 填充内置默认配置 (无配置文件时可直接使用)
     */
    void InitDefaultConfig();

    /**
     * @brief 尚未加载任何配置时填充默认值 (已加载则不做任何事)
     */
    void EnsureDefaultConfig();

    /**
     * @brief 从 YAML 加载配置, 未出现的键保留默认值
     * @return false 表示文件无法解析或关键字段非法 (错误已输出到 stderr)
     */
    bool LoadConfig(const std::string& path);

    const RuntimeConfig& RuntimeFor(Language language);

    /**
     * @brief 执行单元子进程参数 (C 风格结构体, clone 之后只读)
     * argv/envp 指针指向本结构体内部存储
     */
    struct UnitChildArgs {
        char work_dir[256];          // 暂存区 = 新根目录
        char exec_path[256];         // 解释器绝对路径
        char argv_storage[kMaxRuntimeArgs + 4][256];
        char* argv[kMaxRuntimeArgs + 5];
        char env_storage[6][128];
        char* envp[7];

        rlim_t memory_limit_bytes;   // 0 表示不设置 RLIMIT_AS
        rlim_t cpu_time_limit_s;     // RLIMIT_CPU 兜底
        rlim_t output_limit_bytes;   // RLIMIT_FSIZE
        rlim_t nproc_limit;
        long long tmpfs_size_mb;

        uid_t run_uid;
        gid_t run_gid;
        bool network_enabled;

        int null_fd;  // stdin
        int log_fd;   // stdout + stderr (合并输出流)
        int sync_fd;        // 父进程写入 1 字节后继续
        int sync_write_fd;  // 同一管道的写端, 子进程必须先关闭它才能感知父进程放弃
    };

} // namespace saferun

#endif // SAFERUN_SANDBOX_INTERNAL_H
