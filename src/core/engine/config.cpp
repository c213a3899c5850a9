// saferun/src/core/engine/config.cpp

#include <sys/types.h>
#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "sandbox_internal.h"

namespace saferun {
    // 定义全局变量实例
    GlobalConfig g_engine_config;

    namespace {

        void CopyString(char* dst, std::size_t cap, const std::string& src)
        {
            std::strncpy(dst, src.c_str(), cap - 1);
            dst[cap - 1] = '\0';
        }

        // 解释器名不含 '/' 时在 PATH 中查找, 返回绝对路径
        std::string ResolveInterpreter(const std::string& name)
        {
            if (name.empty() || name.find('/') != std::string::npos) return name;
            const char* path_env = std::getenv("PATH");
            std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
            std::size_t start = 0;
            while (start <= path.size()) {
                std::size_t end = path.find(':', start);
                if (end == std::string::npos) end = path.size();
                std::string dir = path.substr(start, end - start);
                if (!dir.empty()) {
                    std::string candidate = dir + "/" + name;
                    if (access(candidate.c_str(), X_OK) == 0) return candidate;
                }
                start = end + 1;
            }
            return name;
        }

        void SetRuntime(Language language, const std::string& interpreter,
                        const std::vector<std::string>& args, bool address_space_limit)
        {
            RuntimeConfig& rt = g_engine_config.runtimes[static_cast<int>(language)];
            CopyString(rt.interpreter, sizeof(rt.interpreter), ResolveInterpreter(interpreter));
            rt.arg_count = 0;
            for (const auto& a : args) {
                if (rt.arg_count >= kMaxRuntimeArgs) break;
                CopyString(rt.args[rt.arg_count], sizeof(rt.args[0]), a);
                rt.arg_count++;
            }
            rt.address_space_limit = address_space_limit;
        }

        // 不存在的挂载源会让子进程在 pivot_root 之前失败, 这里提前剔除
        void SetMounts(const std::vector<std::string>& dirs, const std::vector<std::string>& files)
        {
            g_engine_config.mount_count = 0;
            for (const auto& d : dirs) {
                if (g_engine_config.mount_count >= kMaxMounts) break;
                std::error_code ec;
                if (!std::filesystem::exists(d, ec)) {
                    std::cerr << "[配置] 警告: 挂载目录不存在, 已忽略: " << d << std::endl;
                    continue;
                }
                CopyString(g_engine_config.mount_dirs[g_engine_config.mount_count],
                           sizeof(g_engine_config.mount_dirs[0]), d);
                g_engine_config.mount_count++;
            }

            g_engine_config.mount_file_count = 0;
            for (const auto& f : files) {
                if (g_engine_config.mount_file_count >= kMaxMounts) break;
                std::error_code ec;
                if (!std::filesystem::exists(f, ec)) {
                    std::cerr << "[配置] 警告: 挂载文件不存在, 已忽略: " << f << std::endl;
                    continue;
                }
                CopyString(g_engine_config.mount_files[g_engine_config.mount_file_count],
                           sizeof(g_engine_config.mount_files[0]), f);
                g_engine_config.mount_file_count++;
            }
        }

        std::vector<std::string> ReadStringList(const YAML::Node& node, const char* name)
        {
            std::vector<std::string> out;
            if (!node.IsSequence()) {
                throw std::runtime_error(std::string("'") + name + "' 必须是一个列表");
            }
            for (std::size_t i = 0; i < node.size(); ++i) {
                out.push_back(node[i].as<std::string>());
            }
            return out;
        }

        void LoadRuntime(const YAML::Node& node, Language language)
        {
            RuntimeConfig& current = g_engine_config.runtimes[static_cast<int>(language)];
            std::string interpreter = node["interpreter"]
                ? node["interpreter"].as<std::string>()
                : std::string(current.interpreter);

            std::vector<std::string> args;
            if (node["args"]) {
                args = ReadStringList(node["args"], "runtimes.*.args");
            } else {
                for (int i = 0; i < current.arg_count; ++i) args.emplace_back(current.args[i]);
            }

            bool as_limit = node["address_space_limit"]
                ? node["address_space_limit"].as<bool>()
                : current.address_space_limit;
            SetRuntime(language, interpreter, args, as_limit);
        }

    } // anonymous namespace

    const RuntimeConfig& RuntimeFor(Language language)
    {
        return g_engine_config.runtimes[static_cast<int>(language)];
    }

    void InitDefaultConfig()
    {
        std::memset(&g_engine_config, 0, sizeof(g_engine_config));

        CopyString(g_engine_config.workspace_root, sizeof(g_engine_config.workspace_root), "/tmp/saferun");
        g_engine_config.run_uid = 65534; // nobody
        g_engine_config.run_gid = 65534; // nogroup
        g_engine_config.run_tmpfs_size_mb = 16;
        g_engine_config.pids_limit = 64;
        g_engine_config.nproc_limit = 512;
        g_engine_config.max_output_bytes = 4LL * 1024 * 1024;
        g_engine_config.max_log_bytes = 64LL * 1024;
        g_engine_config.pool_size = 4;
        g_engine_config.server_port = 50061;
        g_engine_config.mode = ExecutionMode::kAuto;
        g_engine_config.allow_insecure_fallback = false;
        g_engine_config.default_limits = ResourceLimits{};

        SetMounts({"/usr", "/lib", "/lib64", "/bin"}, {"/dev/null", "/dev/urandom", "/dev/zero"});

        // -I: 隔离模式 (忽略 PYTHON* 环境变量与用户 site-packages), -B: 不写 .pyc
        SetRuntime(Language::kPython, "/usr/bin/python3", {"-I", "-B"}, true);
        SetRuntime(Language::kJavaScript, "/usr/bin/node", {"--max-old-space-size=96"}, false);
    }

    void EnsureDefaultConfig()
    {
        // 工作线程可能同时构造 facade; 只允许一个线程写入全局配置
        static std::once_flag once;
        std::call_once(once, [] {
            if (g_engine_config.workspace_root[0] == '\0') {
                InitDefaultConfig();
            }
        });
    }

    bool LoadConfig(const std::string& path) {
    InitDefaultConfig();
    try {
        std::cerr << "[配置] 正在读取: " << path << " ..." << std::endl;
        YAML::Node config = YAML::LoadFile(path);

        // Engine 配置
        if (config["engine"]) {
            YAML::Node engine = config["engine"];
            if (engine["workspace_root"]) {
                CopyString(g_engine_config.workspace_root, sizeof(g_engine_config.workspace_root),
                           engine["workspace_root"].as<std::string>());
            }
            if (engine["mode"]) {
                std::string mode = engine["mode"].as<std::string>();
                auto parsed = ParseExecutionMode(mode);
                if (!parsed) {
                    std::cerr << "[配置] 错误: 未知的 engine.mode '" << mode << "'" << std::endl;
                    return false;
                }
                g_engine_config.mode = *parsed;
            }
            if (engine["allow_insecure_fallback"]) {
                g_engine_config.allow_insecure_fallback = engine["allow_insecure_fallback"].as<bool>();
            }
            if (engine["max_output_bytes"]) {
                g_engine_config.max_output_bytes = engine["max_output_bytes"].as<long long>();
            }
            if (engine["max_log_bytes"]) {
                g_engine_config.max_log_bytes = engine["max_log_bytes"].as<long long>();
            }
            if (engine["pool_size"]) {
                g_engine_config.pool_size = engine["pool_size"].as<int>();
            }
            if (engine["server_port"]) {
                g_engine_config.server_port = engine["server_port"].as<int>();
            }
        }

        // 默认资源限制 (可被单次请求覆盖)
        if (config["limits"]) {
            YAML::Node limits = config["limits"];
            ResourceLimits& d = g_engine_config.default_limits;
            if (limits["memory_mb"]) {
                d.memory_bytes = limits["memory_mb"].as<std::uint64_t>() * 1024ULL * 1024ULL;
            }
            if (limits["cpu_fraction"]) {
                d.cpu_fraction = limits["cpu_fraction"].as<double>();
            }
            if (limits["timeout_s"]) {
                d.wall_clock_timeout_seconds = limits["timeout_s"].as<unsigned>();
            }
            if (limits["network_enabled"]) {
                d.network_enabled = limits["network_enabled"].as<bool>();
            }
            d = d.Normalized();
        }

        // Sandbox 配置
        if (config["sandbox"]) {
            YAML::Node sandbox = config["sandbox"];
            std::vector<std::string> dirs;
            std::vector<std::string> files;
            for (int i = 0; i < g_engine_config.mount_count; ++i) dirs.emplace_back(g_engine_config.mount_dirs[i]);
            for (int i = 0; i < g_engine_config.mount_file_count; ++i) files.emplace_back(g_engine_config.mount_files[i]);
            if (sandbox["mount_dirs"]) dirs = ReadStringList(sandbox["mount_dirs"], "sandbox.mount_dirs");
            if (sandbox["mount_files"]) files = ReadStringList(sandbox["mount_files"], "sandbox.mount_files");
            SetMounts(dirs, files);

            if (sandbox["run_as_uid"]) {
                g_engine_config.run_uid = static_cast<uid_t>(sandbox["run_as_uid"].as<unsigned long>());
            }
            if (sandbox["run_as_gid"]) {
                g_engine_config.run_gid = static_cast<gid_t>(sandbox["run_as_gid"].as<unsigned long>());
            }
            if (sandbox["tmpfs_size_mb"]) {
                g_engine_config.run_tmpfs_size_mb = sandbox["tmpfs_size_mb"].as<long long>();
            }
            if (sandbox["pids_limit"]) {
                g_engine_config.pids_limit = sandbox["pids_limit"].as<int>();
            }
            if (sandbox["nproc_limit"]) {
                g_engine_config.nproc_limit = sandbox["nproc_limit"].as<int>();
            }
        }

        // 运行时 ("最小运行时镜像")
        if (config["runtimes"]) {
            YAML::Node runtimes = config["runtimes"];
            if (runtimes["python"]) LoadRuntime(runtimes["python"], Language::kPython);
            if (runtimes["javascript"]) LoadRuntime(runtimes["javascript"], Language::kJavaScript);
        }

        if (g_engine_config.workspace_root[0] == '\0') {
            std::cerr << "[配置] 错误: engine.workspace_root 不能为空" << std::endl;
            return false;
        }
        if (g_engine_config.pool_size <= 0) g_engine_config.pool_size = 4;

        std::cerr << "[配置] 加载完成。WorkRoot: " << g_engine_config.workspace_root
                  << ", Mode: " << ExecutionModeName(g_engine_config.mode)
                  << ", PoolSize: " << g_engine_config.pool_size << std::endl;
        return true;

    } catch (const YAML::Exception& ex) {
        std::cerr << "[配置] YAML 解析失败: " << ex.what() << std::endl;
        return false;
    } catch (const std::exception& ex) {
        std::cerr << "[配置] 加载异常: " << ex.what() << std::endl;
        return false;
    }
} // End LoadConfig
} // namespace saferun
