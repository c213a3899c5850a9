/**
 * @file main.cpp (saferun)
 * @brief 候选代码执行引擎 (CLI)
 *
 * 约束:
 * 1. stdout 只输出单行 JSON (末尾 \n)
 * 2. debug/log 仅输出到 stderr
 */
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>

#include "execution_facade.h"
#include "harness_generator.h"
#include "sandbox_internal.h"

using json = nlohmann::json;

namespace {

struct CliOptions {
    std::string language;
    std::string source_path;
    std::string tests_path;
    std::optional<std::string> entry_point;
    std::optional<std::string> mode;
    long long memory_mb = -1;
    double cpu_fraction = -1.0;
    long long timeout_s = -1;
    bool network = false;
    bool check_only = false;
    bool emit_harness = false;
    bool self_test = false;
};

void EmitJSONLine(const json& out) {
    std::cout << out.dump() << '\n';
}

void EmitUsageError(const std::string& message) {
    json out;
    out["schema_version"] = 1;
    out["status"] = "error";
    out["error_kind"] = "usage";
    out["error_message"] = message;
    EmitJSONLine(out);
}

bool ReadWholeFile(const std::string& path, std::string& content) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    content = buffer.str();
    return true;
}

bool ParseNumber(const char* raw, long long& out) {
    try {
        std::size_t used = 0;
        out = std::stoll(raw, &used);
        return used == std::string(raw).size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseFraction(const char* raw, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(raw, &used);
        return used == std::string(raw).size();
    } catch (const std::exception&) {
        return false;
    }
}

// 协议自检: 不创建执行单元, 只输出一行固定格式报告
json BuildSelfTestReport() {
    saferun::ExecutionReport report;
    report.status = saferun::ReportStatus::kSuccess;
    report.passed_count = 1;
    report.all_passed = true;
    report.has_metrics = true;
    report.detailed_metrics.success_rate = 1.0;

    saferun::TestResult tr;
    tr.test_case_id = 1;
    tr.input = json::array({1, 2});
    tr.expected_output = 3;
    tr.output = 3;
    tr.passed = true;
    report.test_results.push_back(tr);

    json out = saferun::ReportToJson(report);
    out["schema_version"] = 1;
    return out;
}

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -C <path>         Config file path (optional, built-in defaults otherwise)\n"
              << "  -l <language>     python | javascript\n"
              << "  -s <path>         Candidate source file\n"
              << "  -t <path>         Test cases JSON file (array of {input, expected_output})\n"
              << "  -e <name>         Explicit entry point (default: first top-level function)\n"
              << "  -m <mb>           Memory limit in MiB (default: 128)\n"
              << "  --cpu <fraction>  CPU share, clamped to [0.01, 1.0] (default: 0.5)\n"
              << "  --timeout <s>     Wall-clock timeout in seconds (default: 10)\n"
              << "  --network         Allow network access inside the unit\n"
              << "  --mode <mode>     auto | isolated | insecure\n"
              << "  --check           Print runtime availability report and exit\n"
              << "  --emit-harness    Print the generated harness for the -t test cases (no execution)\n"
              << "  --self_test       Print one-line protocol JSON and exit\n";
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    saferun::InitDefaultConfig();

    int opt;
    static struct option long_opts[] = {
        {"cpu", required_argument, nullptr, 1},
        {"timeout", required_argument, nullptr, 2},
        {"network", no_argument, nullptr, 3},
        {"mode", required_argument, nullptr, 4},
        {"check", no_argument, nullptr, 5},
        {"emit-harness", no_argument, nullptr, 6},
        {"self_test", no_argument, nullptr, 7},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    while ((opt = getopt_long(argc, argv, "C:l:s:t:e:m:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'C':
                if (!saferun::LoadConfig(optarg)) {
                    EmitUsageError(std::string("failed to load config: ") + optarg);
                    return 1;
                }
                break;
            case 'l':
                options.language = optarg;
                break;
            case 's':
                options.source_path = optarg;
                break;
            case 't':
                options.tests_path = optarg;
                break;
            case 'e':
                options.entry_point = std::string(optarg);
                break;
            case 'm':
                if (!ParseNumber(optarg, options.memory_mb) || options.memory_mb <= 0) {
                    EmitUsageError(std::string("invalid memory limit: ") + optarg);
                    return 1;
                }
                break;
            case 1:
                if (!ParseFraction(optarg, options.cpu_fraction)) {
                    EmitUsageError(std::string("invalid cpu fraction: ") + optarg);
                    return 1;
                }
                break;
            case 2:
                if (!ParseNumber(optarg, options.timeout_s) || options.timeout_s <= 0) {
                    EmitUsageError(std::string("invalid timeout: ") + optarg);
                    return 1;
                }
                break;
            case 3:
                options.network = true;
                break;
            case 4:
                options.mode = std::string(optarg);
                break;
            case 5:
                options.check_only = true;
                break;
            case 6:
                options.emit_harness = true;
                break;
            case 7:
                options.self_test = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    if (options.self_test) {
        EmitJSONLine(BuildSelfTestReport());
        return 0;
    }

    saferun::ExecutionMode mode = saferun::g_engine_config.mode;
    if (options.mode) {
        auto parsed = saferun::ParseExecutionMode(*options.mode);
        if (!parsed) {
            EmitUsageError("invalid mode: " + *options.mode);
            return 1;
        }
        mode = *parsed;
        saferun::g_engine_config.mode = mode;
    }

    if (options.check_only) {
        json out = saferun::CheckRuntime();
        EmitJSONLine(out);
        return out.value("ready", false) ? 0 : 2;
    }

    if (options.language.empty() || options.source_path.empty()) {
        EmitUsageError("run mode requires -l <language> and -s <source>");
        return 1;
    }
    auto language = saferun::ParseLanguage(options.language);

    std::string source;
    if (!ReadWholeFile(options.source_path, source)) {
        EmitUsageError("failed to open source file: " + options.source_path);
        return 1;
    }

    std::vector<saferun::TestCase> test_cases;
    if (!options.tests_path.empty()) {
        std::string tests_text;
        if (!ReadWholeFile(options.tests_path, tests_text)) {
            EmitUsageError("failed to open tests file: " + options.tests_path);
            return 1;
        }
        try {
            test_cases = saferun::ParseTestCases(json::parse(tests_text));
        } catch (const std::exception& e) {
            EmitUsageError(std::string("invalid tests file: ") + e.what());
            return 1;
        }
    }

    if (options.emit_harness) {
        if (!language) {
            EmitUsageError("Unsupported language: " + options.language);
            return 1;
        }
        std::optional<std::string> entry = options.entry_point;
        if (!entry) entry = saferun::DeriveEntryPoint(*language, source);
        json out;
        out["schema_version"] = 1;
        out["entry_point"] = entry ? json(*entry) : json(nullptr);
        out["source_file"] = saferun::SourceFileName(*language);
        // harness 会核对用例数; 没有 -t 时生成的 harness 只用于查看
        out["test_count"] = test_cases.size();
        try {
            out["harness"] = saferun::GenerateHarness(*language, test_cases.size(), entry);
        } catch (const std::invalid_argument& e) {
            EmitUsageError(e.what());
            return 1;
        }
        if (!test_cases.empty()) {
            out["tests_file"] = saferun::kTestCasesFileName;
            out["tests"] = saferun::SerializeTestCases(test_cases);
        }
        EmitJSONLine(out);
        return 0;
    }

    if (options.tests_path.empty()) {
        EmitUsageError("run mode requires -t <tests.json>");
        return 1;
    }
    if (test_cases.empty()) {
        EmitUsageError("tests file must contain at least one test case");
        return 1;
    }

    saferun::ExecutionReport report;
    if (!language) {
        report = saferun::MakeErrorReport(saferun::ErrorKind::kCandidateFault,
                                          "Unsupported language: " + options.language);
    } else {
        saferun::SubmissionRequest request;
        request.language = *language;
        request.source_code = std::move(source);
        request.test_cases = std::move(test_cases);
        request.entry_point = options.entry_point;
        request.limits = saferun::g_engine_config.default_limits;
        if (options.memory_mb > 0) {
            request.limits.memory_bytes = static_cast<std::uint64_t>(options.memory_mb) * 1024 * 1024;
        }
        if (options.cpu_fraction >= 0.0) request.limits.cpu_fraction = options.cpu_fraction;
        if (options.timeout_s > 0) {
            request.limits.wall_clock_timeout_seconds = static_cast<unsigned>(options.timeout_s);
        }
        if (options.network) request.limits.network_enabled = true;

        saferun::ExecutionFacade facade(mode);
        report = facade.Execute(request);
    }

    json out = saferun::ReportToJson(report);
    out["schema_version"] = 1;
    EmitJSONLine(out);

    if (report.error_kind == saferun::ErrorKind::kInfrastructure) {
        return 3;
    }
    return 0;
}
