#include "unit_isolation.h"
#include "sandbox_internal.h"
#include "seccomp_rules.h"

#include <unistd.h>
#include <fcntl.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/mount.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <cstring>
#include <cstdio>
#include <cerrno>

// 严重警告: 必须严格遵守 Async-Signal-Safe C 风格
// 禁止使用: malloc/new, exceptions, STL, iostream
// 只能使用: glibc 系统调用, stack memory, snprintf 等。

namespace saferun {

    namespace {

        // 失败原因写入单元日志 (stderr 已重定向), 父进程在找不到结果块时会把它放进 logs
        [[noreturn]] void ExitSetupError(
            int code,
            const char* step,
            const char* work_dir,
            const char* src_path = nullptr,
            const char* target_path = nullptr)
        {
            int err = errno;
            char msg[1024];
            int n = snprintf(
                msg,
                sizeof(msg),
                "[saferun][unit_setup] step=%s code=%d errno=%d(%s) uid=%d euid=%d work_dir=%s",
                step ? step : "-",
                code,
                err,
                strerror(err),
                (int)getuid(),
                (int)geteuid(),
                work_dir ? work_dir : "-");
            if (n < 0) n = 0;
            if (src_path && *src_path && n < (int)sizeof(msg)) {
                n += snprintf(msg + n, sizeof(msg) - (size_t)n, " src=%s", src_path);
            }
            if (target_path && *target_path && n < (int)sizeof(msg)) {
                n += snprintf(msg + n, sizeof(msg) - (size_t)n, " target=%s", target_path);
            }
            if (n < 0) n = 0;
            size_t len = (size_t)n;
            if (len >= sizeof(msg)) len = sizeof(msg) - 1;
            msg[len++] = '\n';
            ssize_t wrote = write(STDERR_FILENO, msg, len);
            (void)wrote;
            _exit(code);
        }

        // 在 base 之下逐级创建 path 的父目录
        void EnsureParentDir(const char* path, const char* base)
        {
            char tmp[512];
            strncpy(tmp, path, sizeof(tmp) - 1);
            tmp[sizeof(tmp)-1] = '\0';
            char* p = strrchr(tmp, '/');
            if (!p) return;
            *p = '\0';

            size_t base_len = strlen(base);
            if (base_len == 0) return;
            if (strncmp(tmp, base, base_len) != 0) return;

            size_t len = strlen(tmp);
            for (size_t i = base_len + 1; i <= len; ++i) {
                if (tmp[i] == '\0' || tmp[i] == '/') {
                    char dirbuf[512];
                    memcpy(dirbuf, tmp, i);
                    dirbuf[i] = '\0';
                    if (mkdir(dirbuf, 0755) == -1 && errno != EEXIST) {
                        ExitSetupError(ERR_MKDIR_FAILED, "mkdir_parent", base, nullptr, dirbuf);
                    }
                }
            }
        }

        void BindReadOnly(const char* work_dir, const char* src, const char* target, bool is_dir)
        {
            unsigned long rec = is_dir ? MS_REC : 0;
            if (mount(src, target, nullptr, MS_BIND | rec, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_BIND_LIB, is_dir ? "mount_bind_dir" : "mount_bind_file",
                               work_dir, src, target);
            }
            if (mount(src, target, nullptr, MS_BIND | rec | MS_RDONLY | MS_REMOUNT | MS_NOSUID, nullptr) == -1) {
                ExitSetupError(ERR_REMOUNT_RO, "mount_remount_ro", work_dir, src, target);
            }
        }

        // 暂存区即新根: 运行时目录只读挂入, 然后 pivot_root
        void SetupRootfs(const char* work_dir)
        {
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_PRIVATE, "mount_private_root", work_dir, "/", "/");
            }

            // pivot_root 要求新根是一个挂载点
            if (mount(work_dir, work_dir, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
                ExitSetupError(ERR_MOUNT_BIND_SELF, "mount_bind_self", work_dir, work_dir, work_dir);
            }

            char target[512];
            for (int i = 0; i < g_engine_config.mount_count; ++i) {
                const char* src = g_engine_config.mount_dirs[i];
                if (access(src, F_OK) != 0) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_dir_not_found", work_dir, src, nullptr);
                }

                int n = snprintf(target, sizeof(target), "%s%s", work_dir, src);
                if (n >= (int)sizeof(target)) {
                    errno = ENAMETOOLONG;
                    ExitSetupError(ERR_MKDIR_FAILED, "mount_dir_target_too_long", work_dir, src, nullptr);
                }

                EnsureParentDir(target, work_dir);
                if (mkdir(target, 0755) == -1 && errno != EEXIST) {
                    ExitSetupError(ERR_MKDIR_FAILED, "mkdir_mount_dir", work_dir, src, target);
                }
                BindReadOnly(work_dir, src, target, true);
            }

            for (int i = 0; i < g_engine_config.mount_file_count; ++i) {
                const char* src = g_engine_config.mount_files[i];
                if (access(src, F_OK) != 0) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_file_not_found", work_dir, src, nullptr);
                }

                int n = snprintf(target, sizeof(target), "%s%s", work_dir, src);
                if (n >= (int)sizeof(target)) {
                    errno = ENAMETOOLONG;
                    ExitSetupError(ERR_MKDIR_FAILED, "mount_file_target_too_long", work_dir, src, nullptr);
                }

                EnsureParentDir(target, work_dir);
                int fd = open(target, O_CREAT | O_RDWR | O_CLOEXEC, 0666);
                if (fd != -1) close(fd);
                else if (errno != EEXIST) ExitSetupError(ERR_MKDIR_FAILED, "touch_mount_file_target", work_dir, src, target);

                BindReadOnly(work_dir, src, target, false);
            }

            char old_root[512];
            snprintf(old_root, sizeof(old_root), "%s/old_root", work_dir);
            if (mkdir(old_root, 0755) == -1 && errno != EEXIST) {
                ExitSetupError(ERR_MKDIR_FAILED, "mkdir_old_root", work_dir, nullptr, old_root);
            }

            if (syscall(SYS_pivot_root, work_dir, old_root) == -1) {
                ExitSetupError(ERR_PIVOT_ROOT, "pivot_root", work_dir, work_dir, old_root);
            }
            if (chdir("/") == -1) ExitSetupError(ERR_CHDIR_NEW_ROOT, "chdir_new_root", work_dir);
            if (umount2("/old_root", MNT_DETACH) == -1) ExitSetupError(ERR_UMOUNT_OLD, "umount_old_root", work_dir);
            rmdir("/old_root");
        }

        void CloseInheritedFds()
        {
            bool close_range_success = false;

            #ifdef __NR_close_range
                if (syscall(__NR_close_range, 3, ~0U, 0) == 0) {
                    close_range_success = true;
                }
            #endif

            if (!close_range_success) {
                int max_fd = (int)sysconf(_SC_OPEN_MAX);
                if (max_fd < 0) max_fd = 4096;
                if (max_fd > 65536) max_fd = 65536;

                for (int fd = 3; fd < max_fd; ++fd) {
                    close(fd);
                }
            }
        }

        void SetLimit(int resource, rlim_t value, int exit_code)
        {
            rlimit lim;
            lim.rlim_cur = value;
            lim.rlim_max = value;
            if (setrlimit(resource, &lim) == -1) _exit(exit_code);
        }

    } // anonymous namespace

    int UnitChildFn(void* arg)
    {
        auto* args = (UnitChildArgs*)(arg);

        // -----------------------------------------------------
        // 0. 等待父进程把我们加入 cgroup
        // -----------------------------------------------------
        // 父进程写入 1 字节表示就绪; 读到 EOF 表示父进程放弃了本单元
        close(args->sync_write_fd);
        char ready = 0;
        ssize_t got;
        do {
            got = read(args->sync_fd, &ready, 1);
        } while (got == -1 && errno == EINTR);
        if (got != 1) _exit(ERR_SYNC_FAILED);

        // -----------------------------------------------------
        // 1. IO 重定向: stdin <- /dev/null, stdout + stderr -> 单元日志
        // -----------------------------------------------------
        if (dup2(args->null_fd, STDIN_FILENO) == -1) _exit(ERR_DUP2);
        if (dup2(args->log_fd, STDOUT_FILENO) == -1) _exit(ERR_DUP2);
        if (dup2(args->log_fd, STDERR_FILENO) == -1) _exit(ERR_DUP2);

        CloseInheritedFds();

        // -----------------------------------------------------
        // 2. 构建隔离环境 (Rootfs)
        // -----------------------------------------------------
        SetupRootfs(args->work_dir);

        // 必须在根目录只读之前创建挂载点
        if (mkdir("/tmp", 01777) == -1 && errno != EEXIST) _exit(ERR_MOUNT_TMP);
        if (mkdir("/proc", 0755) == -1 && errno != EEXIST) _exit(ERR_MOUNT_PROC);

        if (chmod("/", 0555) == -1) _exit(ERR_CHDIR_FAILED);
        if (mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY, nullptr) == -1) {
            _exit(ERR_REMOUNT_RO);
        }

        // /tmp 是单元内唯一可写位置
        char tmpfs_opts[64];
        long long tmpfs_mb = args->tmpfs_size_mb > 0 ? args->tmpfs_size_mb : 16;
        snprintf(tmpfs_opts, sizeof(tmpfs_opts), "size=%lldm,mode=1777", tmpfs_mb);
        if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, tmpfs_opts) == -1) _exit(ERR_MOUNT_TMP);

        if (mount("proc", "/proc", "proc", 0, nullptr) == -1) _exit(ERR_MOUNT_PROC);
        if (mount("proc", "/proc", "proc", MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NOEXEC | MS_NODEV, nullptr) == -1)
            _exit(ERR_MOUNT_PROC);

        // -----------------------------------------------------
        // 3. 资源限制 (cgroup 之外的兜底)
        // -----------------------------------------------------
        rlimit cpu_limit;
        cpu_limit.rlim_cur = args->cpu_time_limit_s;
        cpu_limit.rlim_max = args->cpu_time_limit_s + 1;
        if (setrlimit(RLIMIT_CPU, &cpu_limit) == -1) _exit(ERR_RLIMIT_CPU);

        if (args->memory_limit_bytes > 0) {
            SetLimit(RLIMIT_AS, args->memory_limit_bytes, ERR_RLIMIT_MEMORY);
        }
        SetLimit(RLIMIT_STACK, 64UL * 1024 * 1024, ERR_RLIMIT_STACK);
        SetLimit(RLIMIT_NPROC, args->nproc_limit, ERR_RLIMIT_NPROC);
        SetLimit(RLIMIT_FSIZE, args->output_limit_bytes, ERR_RLIMIT_FSIZE);
        SetLimit(RLIMIT_CORE, 0, ERR_RLIMIT_FSIZE);

        // -----------------------------------------------------
        // 4. 清理附加组 + 降权
        // -----------------------------------------------------
        if (setgroups(0, nullptr) != 0) _exit(ERR_SETGID_FAILED);
        if (chdir("/") != 0) _exit(ERR_CHDIR_FAILED);
        if (setgid(args->run_gid) != 0) _exit(ERR_SETGID_FAILED);
        if (setuid(args->run_uid) != 0) _exit(ERR_SETUID_FAILED);

        // -----------------------------------------------------
        // 5. 禁止提升特权 + Seccomp (exec 前最后一步)
        // -----------------------------------------------------
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) _exit(ERR_SANDBOX_EXCEPTION);
        LoadUnitSeccompRules(args->network_enabled);

        execve(args->exec_path, args->argv, args->envp);

        _exit(ERR_EXEC_FAILED);
        return 0;
    }

} // namespace saferun
