#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <semaphore>
#include <stop_token>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <nlohmann/json.hpp>

#include "execution.grpc.pb.h"
#include "execution_facade.h"
#include "sandbox_internal.h"
#include "unit_process.h"

using json = nlohmann::json;
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

// 全局并发控制信号量
std::unique_ptr<std::counting_semaphore<>> g_task_sem = nullptr;

namespace {

    // RAII: 归还信号量
    struct SemaphoreGuard {
        ~SemaphoreGuard() { g_task_sem->release(); }
    };

    void FillResponse(const saferun::ExecutionReport& report, saferun::rpc::ExecuteResponse* response)
    {
        response->set_report_json(saferun::ReportToJson(report).dump());
        response->set_status(saferun::ReportStatusName(report.status));
        response->set_passed_count(report.passed_count);
        response->set_failed_count(report.failed_count);
        response->set_error_kind(saferun::ErrorKindName(report.error_kind));
    }

    // 语言已由调用方校验
    Status BuildRequest(const saferun::rpc::ExecuteRequest& req, saferun::Language language,
                        saferun::SubmissionRequest& out)
    {
        out.language = language;
        out.source_code = req.code();

        try {
            out.test_cases = saferun::ParseTestCases(json::parse(req.test_cases_json()));
        } catch (const std::exception& e) {
            return Status(grpc::INVALID_ARGUMENT, std::string("invalid test_cases_json: ") + e.what());
        }
        if (out.test_cases.empty()) {
            return Status(grpc::INVALID_ARGUMENT, "test_cases must contain at least one test case");
        }

        if (!req.entry_point().empty()) out.entry_point = req.entry_point();
        out.limits = saferun::g_engine_config.default_limits;
        if (req.memory_bytes() > 0) out.limits.memory_bytes = req.memory_bytes();
        if (req.cpu_fraction() > 0.0) out.limits.cpu_fraction = req.cpu_fraction();
        if (req.timeout_seconds() > 0) out.limits.wall_clock_timeout_seconds = req.timeout_seconds();
        if (req.network_enabled()) out.limits.network_enabled = true;
        if (!req.request_id().empty() && !saferun::IsValidRequestId(req.request_id())) {
            return Status(grpc::INVALID_ARGUMENT, "request_id must be up to 64 characters from [A-Za-z0-9_-]");
        }
        out.request_id = req.request_id();
        return Status::OK;
    }

} // anonymous namespace

class ExecutionServiceImpl final : public saferun::rpc::ExecutionService::Service {
    Status ExecuteCandidateCode(ServerContext* context, const saferun::rpc::ExecuteRequest* request,
                                saferun::rpc::ExecuteResponse* response) override {
        auto language = saferun::ParseLanguage(request->language());
        if (!language) {
            // 不支持的语言属于候选方错误, 以报告形式返回
            FillResponse(saferun::MakeErrorReport(saferun::ErrorKind::kCandidateFault,
                                                  "Unsupported language: " + request->language()),
                         response);
            return Status::OK;
        }

        saferun::SubmissionRequest submission;
        Status status = BuildRequest(*request, *language, submission);
        if (!status.ok()) {
            std::cerr << "[Server] 拒绝非法请求: " << status.error_message() << std::endl;
            return status;
        }

        if (!g_task_sem->try_acquire()) {
            std::cout << "[Server] ⚠️ High Load - 拒绝请求 (language=" << request->language() << ")" << std::endl;
            return Status(grpc::RESOURCE_EXHAUSTED, "Execution engine is busy");
        }
        SemaphoreGuard guard;

        // 客户端取消 / 超时 -> stop_source -> 执行单元被立即终止
        std::stop_source stop;
        std::jthread watcher([context, &stop](std::stop_token self) {
            while (!self.stop_requested()) {
                if (context->IsCancelled()) {
                    stop.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        saferun::ExecutionReport report;
        try {
            saferun::ExecutionFacade facade(saferun::g_engine_config.mode);
            report = facade.Execute(submission, stop.get_token());
        } catch (const std::invalid_argument& e) {
            return Status(grpc::INVALID_ARGUMENT, e.what());
        }

        watcher.request_stop();

        FillResponse(report, response);

        std::cout << "[Server] ✅ 完成: status=" << response->status()
                  << " passed=" << report.passed_count
                  << " failed=" << report.failed_count << std::endl;

        if (report.error_kind == saferun::ErrorKind::kInfrastructure) {
            std::cerr << "❌ [Server] 基础设施故障: "
                      << report.error_message.value_or("unknown") << std::endl;
        }
        if (report.error_kind == saferun::ErrorKind::kCancelled) {
            return Status(grpc::CANCELLED, "Execution cancelled");
        }
        return Status::OK;
    }

    Status CheckRuntime(ServerContext* /*context*/, const saferun::rpc::CheckRuntimeRequest* /*request*/,
                        saferun::rpc::CheckRuntimeResponse* response) override {
        json report = saferun::CheckRuntime();
        response->set_ready(report.value("ready", false));
        response->set_report_json(report.dump());
        return Status::OK;
    }
};

int main(int argc, char** argv) {
    // 1. 加载配置 (优先命令行参数, 其次 config/engine.yaml, 否则内置默认值)
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (std::filesystem::exists("config/engine.yaml")) {
        config_path = "config/engine.yaml";
    }

    if (!config_path.empty()) {
        if (!saferun::LoadConfig(config_path)) {
            std::cerr << "❌ [Fatal] 配置加载失败: " << config_path << std::endl;
            return 1;
        }
    } else {
        saferun::InitDefaultConfig();
        std::cerr << "[Server] 未找到配置文件, 使用内置默认值" << std::endl;
    }

    // 2. 启动前探测一次隔离运行时 (结果进程内缓存)
    json runtime = saferun::CheckRuntime();
    std::cout << "[Server] 运行环境: " << runtime.dump() << std::endl;
    if (!runtime.value("ready", false)) {
        std::cerr << "[Server] ⚠️ 运行环境未就绪, 请求将返回 infrastructure 错误" << std::endl;
    }

    // 3. 初始化全局信号量
    int pool_size = saferun::g_engine_config.pool_size;
    if (pool_size <= 0) pool_size = 4; // 兜底
    g_task_sem = std::make_unique<std::counting_semaphore<>>(pool_size);
    std::cout << "[Server] 🔥 并发模型已初始化: Max Units = " << pool_size << std::endl;

    // 4. 启动 gRPC Server
    int port = saferun::g_engine_config.server_port;
    if (port <= 0) port = 50061;
    std::string server_address("0.0.0.0:" + std::to_string(port));

    ExecutionServiceImpl service;

    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        std::cerr << "❌ [Fatal] 无法监听: " << server_address << std::endl;
        return 1;
    }
    std::cout << "🚀 [Server] 启动监听: " << server_address << std::endl;

    server->Wait();
    return 0;
}
