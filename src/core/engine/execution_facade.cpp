#include "execution_facade.h"
#include "sandbox_internal.h"
#include "sandbox_orchestrator.h"
#include "fallback_executor.h"
#include "cgroup_manager.h"
#include "harness_generator.h"
#include "unit_process.h"

#include <iostream>
#include <mutex>
#include <stdexcept>

#include <unistd.h>

namespace saferun
{

    namespace {

        std::once_flag g_probe_once;
        bool g_isolation_available = false;
        std::string g_probe_detail;

        void RunProbeOnce()
        {
            std::call_once(g_probe_once, [] {
                std::string reason;
                g_isolation_available = SandboxOrchestrator::Probe(&reason);
                g_probe_detail = g_isolation_available ? "ok" : reason;
                std::cerr << "[Facade] 隔离运行时探测: "
                          << (g_isolation_available ? "可用" : "不可用 (" + reason + ")") << std::endl;
            });
        }

    } // anonymous namespace

    bool IsolationRuntimeAvailable()
    {
        RunProbeOnce();
        return g_isolation_available;
    }

    ExecutionFacade::ExecutionFacade(ExecutionMode mode) : mode_(mode)
    {
        EnsureDefaultConfig();
    }

    ExecutionFacade::~ExecutionFacade() = default;

    ExecutionReport ExecutionFacade::Execute(const SubmissionRequest& request, std::stop_token stop)
    {
        if (request.test_cases.empty()) {
            throw std::invalid_argument("test_cases must contain at least one test case");
        }
        if (!request.request_id.empty() && !IsValidRequestId(request.request_id)) {
            throw std::invalid_argument("invalid request_id '" + request.request_id
                                        + "': use up to 64 characters from [A-Za-z0-9_-]");
        }

        // 前置检查: 都不需要创建执行单元
        if (!HasExecutableContent(request.language, request.source_code)) {
            return MakeErrorReport(ErrorKind::kCandidateFault, "Empty submission: no code to execute");
        }

        if (request.entry_point) {
            if (!IsValidIdentifier(request.language, *request.entry_point)) {
                return MakeErrorReport(ErrorKind::kCandidateFault,
                    "Invalid entry point name: " + *request.entry_point);
            }
        } else if (!DeriveEntryPoint(request.language, request.source_code)) {
            return MakeErrorReport(ErrorKind::kCandidateFault,
                "NoEntryPointError: no top-level function definition found in candidate code");
        }

        return Dispatch(request, stop);
    }

    ExecutionReport ExecutionFacade::ExecuteCandidateCode(const std::string& language,
                                                          const std::string& code,
                                                          const std::vector<TestCase>& test_cases)
    {
        if (test_cases.empty()) {
            throw std::invalid_argument("test_cases must contain at least one test case");
        }

        auto parsed = ParseLanguage(language);
        if (!parsed) {
            return MakeErrorReport(ErrorKind::kCandidateFault, "Unsupported language: " + language);
        }

        SubmissionRequest request;
        request.language = *parsed;
        request.source_code = code;
        request.test_cases = test_cases;
        request.limits = g_engine_config.default_limits;
        return Execute(request);
    }

    ExecutionReport ExecutionFacade::Dispatch(const SubmissionRequest& request, std::stop_token stop)
    {
        switch (mode_)
        {
            case ExecutionMode::kIsolated:
                return RunIsolated(request, stop);

            case ExecutionMode::kInsecureFallback:
                return RunFallback(request, stop);

            case ExecutionMode::kAuto:
                break;
        }

        if (IsolationRuntimeAvailable()) {
            return RunIsolated(request, stop);
        }
        if (g_engine_config.allow_insecure_fallback) {
            return RunFallback(request, stop);
        }
        return MakeErrorReport(ErrorKind::kInfrastructure, "Isolation runtime unavailable");
    }

    ExecutionReport ExecutionFacade::RunIsolated(const SubmissionRequest& request, std::stop_token stop)
    {
        if (!orchestrator_) {
            try {
                orchestrator_ = std::make_unique<SandboxOrchestrator>(g_engine_config.workspace_root);
            } catch (const std::exception& e) {
                std::cerr << "[Facade] " << e.what() << std::endl;
                return MakeErrorReport(ErrorKind::kInfrastructure, e.what());
            }
        }
        return orchestrator_->Execute(request, stop);
    }

    ExecutionReport ExecutionFacade::RunFallback(const SubmissionRequest& request, std::stop_token stop)
    {
        if (!fallback_) {
            try {
                fallback_ = std::make_unique<FallbackExecutor>(g_engine_config.workspace_root);
            } catch (const std::exception& e) {
                std::cerr << "[Facade] " << e.what() << std::endl;
                ExecutionReport report = MakeErrorReport(ErrorKind::kInfrastructure, e.what());
                report.detailed_metrics.degraded = true;
                report.warning = kInsecureFallbackWarning;
                return report;
            }
        }
        return fallback_->Execute(request, stop);
    }

    ExecutionReport ExecuteCandidateCode(const std::string& language,
                                         const std::string& code,
                                         const std::vector<TestCase>& test_cases)
    {
        EnsureDefaultConfig();
        // 各次调用之间不共享可变状态: 每次一个 facade (探测结果是进程级缓存)
        ExecutionFacade facade(g_engine_config.mode);
        return facade.ExecuteCandidateCode(language, code, test_cases);
    }

    Value CheckRuntime()
    {
        EnsureDefaultConfig();

        Value runtimes = Value::object();
        bool any_runtime = false;
        for (Language language : {Language::kPython, Language::kJavaScript}) {
            const RuntimeConfig& rt = RuntimeFor(language);
            bool present = access(rt.interpreter, X_OK) == 0;
            any_runtime = any_runtime || present;
            runtimes[LanguageName(language)] = {
                {"interpreter", rt.interpreter},
                {"available", present}
            };
        }

        bool isolation = IsolationRuntimeAvailable();
        bool ready = any_runtime
            && (isolation || g_engine_config.allow_insecure_fallback
                || g_engine_config.mode == ExecutionMode::kInsecureFallback);

        return Value{
            {"isolation_available", isolation},
            {"isolation_detail", g_probe_detail},
            {"cgroup_v2", CgroupManager::IsSupported()},
            {"mode", ExecutionModeName(g_engine_config.mode)},
            {"allow_insecure_fallback", g_engine_config.allow_insecure_fallback},
            {"workspace_root", g_engine_config.workspace_root},
            {"runtimes", runtimes},
            {"ready", ready}
        };
    }

} // namespace saferun
