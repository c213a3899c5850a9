// src/core/engine/seccomp_rules.cpp
#include "seccomp_rules.h"
#include "sandbox_internal.h"
#include <seccomp.h>
#include <sched.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

// 在 clone 出的子进程中调用: 只能使用 libseccomp 与系统调用

namespace saferun {

    namespace {

        // 当前架构不存在的系统调用 (SCMP_SYS 解析为负数) 直接跳过
        void DenySyscall(scmp_filter_ctx ctx, int nr, int err)
        {
            if (nr < 0) return;
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(err), nr, 0) != 0) {
                seccomp_release(ctx);
                _exit(ERR_SANDBOX_EXCEPTION);
            }
        }

    } // anonymous namespace

    void LoadUnitSeccompRules(bool network_enabled) {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) _exit(ERR_SANDBOX_EXCEPTION);

        #define DENY_SYSCALL(name) DenySyscall(ctx, SCMP_SYS(name), EPERM)

        // 挂载与根目录切换: 单元内不允许再改变文件系统视图
        DENY_SYSCALL(mount);
        DENY_SYSCALL(umount2);
        DENY_SYSCALL(pivot_root);
        DENY_SYSCALL(chroot);

        // 调试与跨进程内存访问
        DENY_SYSCALL(ptrace);
        DENY_SYSCALL(process_vm_readv);
        DENY_SYSCALL(process_vm_writev);
        DENY_SYSCALL(perf_event_open);
        DENY_SYSCALL(personality);

        // 内核模块与系统级操作
        DENY_SYSCALL(reboot);
        DENY_SYSCALL(kexec_load);
        DENY_SYSCALL(init_module);
        DENY_SYSCALL(finit_module);
        DENY_SYSCALL(delete_module);
        DENY_SYSCALL(swapon);
        DENY_SYSCALL(swapoff);
        DENY_SYSCALL(bpf);

        // 命名空间逃逸
        DENY_SYSCALL(setns);
        DENY_SYSCALL(unshare);

        // 内核密钥环
        DENY_SYSCALL(keyctl);
        DENY_SYSCALL(add_key);
        DENY_SYSCALL(request_key);

        #undef DENY_SYSCALL

        // clone(CLONE_NEWUSER) 可在单元内重新获得能力; 普通线程/进程创建仍允许
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                SCMP_A0(SCMP_CMP_MASKED_EQ, (scmp_datum_t)CLONE_NEWUSER, (scmp_datum_t)CLONE_NEWUSER)) != 0) {
            seccomp_release(ctx);
            _exit(ERR_SANDBOX_EXCEPTION);
        }

        // clone3 的参数在用户态结构体中无法过滤, 返回 ENOSYS 让 glibc 回退到 clone
        DenySyscall(ctx, SCMP_SYS(clone3), ENOSYS);

        if (!network_enabled) {
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                    SCMP_A0(SCMP_CMP_NE, (scmp_datum_t)AF_UNIX)) != 0) {
                seccomp_release(ctx);
                _exit(ERR_SANDBOX_EXCEPTION);
            }
        }

        if (seccomp_load(ctx) != 0) {
            seccomp_release(ctx);
            _exit(ERR_SANDBOX_EXCEPTION);
        }
        seccomp_release(ctx);
    }

} // namespace saferun
