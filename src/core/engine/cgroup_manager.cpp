/**
 * @file cgroup_manager.cpp
 * @brief 执行单元 Cgroups v2 资源限制实现
 *
 * 控制文件:
 *    - cgroup.procs: 属于此 cgroup 的进程 PID
 *    - cgroup.subtree_control: 子目录可用的控制器
 *    - cgroup.kill: 写入 1 杀死整个 cgroup (Linux 5.14+)
 *    - memory.max / memory.swap.max / memory.peak / memory.events
 *    - pids.max
 *    - cpu.max: "$QUOTA $PERIOD" (微秒)
 */

#include "cgroup_manager.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <csignal>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <cstring>
#include <iostream>

// Cgroups v2 文件系统魔数
#ifndef CGROUP2_SUPER_MAGIC
#define CGROUP2_SUPER_MAGIC 0x63677270
#endif

namespace fs = std::filesystem;

namespace saferun {

namespace {

constexpr long long kCpuPeriodUs = 100000;

uint64_t ParseCounter(const std::string& val)
{
    if (val.empty() || val == "max") return 0;
    try {
        return std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
}

} // anonymous namespace

CgroupManager::CgroupManager(const std::string& root, const std::string& unit_id)
    : cgroup_root_(root)
    , unit_id_(unit_id)
    , created_(false)
{
    cgroup_path_ = cgroup_root_ + "/" + unit_id_;
}

CgroupManager::~CgroupManager() {
    if (created_) {
        Destroy();
    }
}

CgroupManager::CgroupManager(CgroupManager&& other) noexcept
    : cgroup_root_(std::move(other.cgroup_root_))
    , unit_id_(std::move(other.unit_id_))
    , cgroup_path_(std::move(other.cgroup_path_))
    , created_(other.created_)
{
    other.created_ = false;
}

CgroupManager& CgroupManager::operator=(CgroupManager&& other) noexcept {
    if (this != &other) {
        if (created_) {
            Destroy();
        }

        cgroup_root_ = std::move(other.cgroup_root_);
        unit_id_ = std::move(other.unit_id_);
        cgroup_path_ = std::move(other.cgroup_path_);
        created_ = other.created_;

        other.created_ = false;
    }
    return *this;
}

bool CgroupManager::IsSupported() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

bool CgroupManager::EnsureParentReady() {
    std::error_code ec;

    if (!fs::exists(cgroup_root_, ec)) {
        if (!fs::create_directories(cgroup_root_, ec)) {
            std::cerr << "[CgroupManager] Failed to create root dir: "
                      << cgroup_root_ << std::endl;
            return false;
        }
    }

    // 在 /sys/fs/cgroup 启用控制器; 非 root 委派场景下可能无权限,
    // 只要运维已提前开启即可, 这里失败不致命
    fs::path parent_path = fs::path(cgroup_root_).parent_path();
    std::string subtree_control = parent_path.string() + "/cgroup.subtree_control";
    if (!WriteToFile(subtree_control, "+memory +pids +cpu")) {
         std::cerr << "[CgroupManager] Warning: Failed to enable controllers in " << subtree_control
                   << " (Assuming admin already enabled them)" << std::endl;
    }

    // 我们自己的根目录必须成功, 否则单元 cgroup 无法使用这些控制器
    std::string our_subtree_control = cgroup_root_ + "/cgroup.subtree_control";
    if (!WriteToFile(our_subtree_control, "+memory +pids +cpu")) {
        // cpu 控制器在部分内核上不可委派, 退化为 memory + pids
        if (!WriteToFile(our_subtree_control, "+memory +pids")) {
            std::cerr << "[CgroupManager] Error: Failed to enable controllers in " << our_subtree_control
                      << ". Please check ownership or delegation." << std::endl;
            return false;
        }
        std::cerr << "[CgroupManager] Warning: cpu controller unavailable, cpu_fraction not enforced" << std::endl;
    }

    return true;
}

bool CgroupManager::Create() {
    if (created_) {
        return true;
    }

    if (!EnsureParentReady()) {
        std::cerr << "[CgroupManager] Failed to prepare parent directories" << std::endl;
        return false;
    }

    std::error_code ec;
    if (!fs::create_directories(cgroup_path_, ec)) {
        if (ec) {
            std::cerr << "[CgroupManager] Failed to create cgroup: "
                      << cgroup_path_ << " - " << ec.message() << std::endl;
            return false;
        }
    }

    created_ = true;
    return true;
}

bool CgroupManager::SetMemoryLimit(uint64_t bytes, bool disable_swap) {
    if (!created_) {
        std::cerr << "[CgroupManager] Cgroup not created" << std::endl;
        return false;
    }

    if (!WriteToFile(cgroup_path_ + "/memory.max", std::to_string(bytes))) {
        std::cerr << "[CgroupManager] Failed to set memory.max" << std::endl;
        return false;
    }

    if (disable_swap) {
        // 未开启 swap 记账的内核没有 memory.swap.max, 忽略
        WriteToFile(cgroup_path_ + "/memory.swap.max", "0");
    }
    return true;
}

bool CgroupManager::SetPidsLimit(int max_pids) {
    if (!created_) {
        std::cerr << "[CgroupManager] Cgroup not created" << std::endl;
        return false;
    }

    if (!WriteToFile(cgroup_path_ + "/pids.max", std::to_string(max_pids))) {
        std::cerr << "[CgroupManager] Failed to set pids.max" << std::endl;
        return false;
    }
    return true;
}

bool CgroupManager::SetCPULimit(double max_cores) {
    if (!created_) {
        std::cerr << "[CgroupManager] Cgroup not created" << std::endl;
        return false;
    }

    // 内核要求 quota >= 1000us
    long long quota = static_cast<long long>(std::llround(max_cores * kCpuPeriodUs));
    quota = std::max(quota, 1000LL);

    std::ostringstream value;
    value << quota << " " << kCpuPeriodUs;
    if (!WriteToFile(cgroup_path_ + "/cpu.max", value.str())) {
        std::cerr << "[CgroupManager] Failed to set cpu.max" << std::endl;
        return false;
    }
    return true;
}

bool CgroupManager::AddProcess(pid_t pid) {
    if (!created_) {
        std::cerr << "[CgroupManager] Cgroup not created" << std::endl;
        return false;
    }

    if (!WriteToFile(cgroup_path_ + "/cgroup.procs", std::to_string(pid))) {
        std::cerr << "[CgroupManager] Failed to add process " << pid << std::endl;
        return false;
    }
    return true;
}

uint64_t CgroupManager::GetMemoryPeak() const {
    if (!created_) return 0;

    uint64_t peak = ParseCounter(ReadFromFile(cgroup_path_ + "/memory.peak"));
    if (peak > 0) return peak;
    return GetMemoryCurrent();
}

uint64_t CgroupManager::GetMemoryCurrent() const {
    if (!created_) return 0;
    return ParseCounter(ReadFromFile(cgroup_path_ + "/memory.current"));
}

bool CgroupManager::WasOomKilled() const {
    if (!created_) return false;

    std::ifstream ifs(cgroup_path_ + "/memory.events");
    std::string key;
    uint64_t count = 0;
    while (ifs >> key >> count) {
        if (key == "oom_kill") return count > 0;
    }
    return false;
}

void CgroupManager::KillAllProcesses() {
    // 优先使用 cgroup.kill, 一次写入即可杀死整个子树
    if (fs::exists(cgroup_path_ + "/cgroup.kill")) {
        if (WriteToFile(cgroup_path_ + "/cgroup.kill", "1")) return;
    }

    std::ifstream ifs(cgroup_path_ + "/cgroup.procs");
    pid_t pid;
    while (ifs >> pid) {
        if (pid > 0) {
            kill(pid, SIGKILL);
        }
    }
}

void CgroupManager::Destroy() {
    if (!created_) return;

    KillAllProcesses();
    usleep(20000);

    std::error_code ec;
    if (!fs::remove(cgroup_path_, ec)) {
        // 进程被 SIGKILL 后仍需要一点时间退出
        for (int attempt = 0; attempt < 5; ++attempt) {
            usleep(50000);
            KillAllProcesses();
            if (fs::remove(cgroup_path_, ec)) break;
        }
        if (ec) {
            std::cerr << "[CgroupManager] Failed to remove " << cgroup_path_
                      << ": " << ec.message() << std::endl;
        }
    }

    created_ = false;
}

bool CgroupManager::WriteToFile(const std::string& path, const std::string& value) {
    std::ofstream ofs(path);
    if (!ofs) {
        return false;
    }
    ofs << value;
    ofs.flush();
    return ofs.good();
}

std::string CgroupManager::ReadFromFile(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs) {
        return "";
    }
    std::string content;
    std::getline(ifs, content);
    return content;
}

} // namespace saferun
