#ifndef SAFERUN_EXECUTION_TYPES_H
#define SAFERUN_EXECUTION_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "value.h"

namespace saferun {

    enum class Language {
        kPython = 0,
        kJavaScript = 1
    };

    /**
     * @brief 解析语言名称 (大小写不敏感)
     * python / python3 / py, javascript / js / node / nodejs
     */
    std::optional<Language> ParseLanguage(const std::string& name);
    const char* LanguageName(Language language);

    enum class ExecutionMode {
        kAuto = 0,          // 首次使用时探测隔离运行时
        kIsolated,          // 强制隔离执行
        kInsecureFallback   // 仅限本地开发: 宿主机直接运行, 无隔离
    };

    std::optional<ExecutionMode> ParseExecutionMode(const std::string& name);
    const char* ExecutionModeName(ExecutionMode mode);

    struct TestCase
    {
        Value input;              // sequence -> 位置参数, map -> 关键字参数, 其他 -> 单参数
        Value expected_output;
        bool is_hidden = false;
        std::string explanation;
    };

    TestCase TestCaseFromJson(const Value& j);
    Value TestCaseToJson(const TestCase& tc);

    /**
     * @brief 解析测试用例数组
     * @throw std::invalid_argument 根节点不是数组或元素不是对象
     */
    std::vector<TestCase> ParseTestCases(const Value& j);

    constexpr std::uint64_t kDefaultMemoryBytes = 128ULL * 1024 * 1024;
    constexpr double kDefaultCpuFraction = 0.5;
    constexpr unsigned kDefaultTimeoutSeconds = 10;
    constexpr double kMinCpuFraction = 0.01; // cpu.max 最小配额 1000us / 100000us

    struct ResourceLimits
    {
        std::uint64_t memory_bytes = kDefaultMemoryBytes;
        double cpu_fraction = kDefaultCpuFraction;
        unsigned wall_clock_timeout_seconds = kDefaultTimeoutSeconds;
        bool network_enabled = false;

        /**
         * @brief 返回规范化后的副本: cpu_fraction 钳制到 [0.01, 1.0], 从不拒绝
         * memory_bytes / wall_clock_timeout_seconds 为 0 时回退到默认值
         */
        ResourceLimits Normalized() const;
    };

    struct SubmissionRequest
    {
        Language language = Language::kPython;
        std::string source_code;
        std::vector<TestCase> test_cases;
        std::optional<std::string> entry_point;
        ResourceLimits limits;
        std::string request_id; // 为空时由执行器生成
    };

    struct TestResult
    {
        int test_case_id = 0;
        Value input;
        Value expected_output;
        bool passed = false;
        Value output;              // null 表示无输出
        std::optional<std::string> error;
        double execution_time_seconds = 0.0;
        bool is_hidden = false;
        std::string explanation;
        std::string stdout_text;
        std::string stderr_text;
        std::string traceback;
    };

    enum class ReportStatus {
        kSuccess,
        kError,
        kTimeout
    };

    const char* ReportStatusName(ReportStatus status);

    // 错误分类: 只有 kInfrastructure 需要调用方告警
    enum class ErrorKind {
        kNone,
        kInfrastructure,
        kTimeout,
        kCandidateFault,
        kProtocol,
        kCancelled
    };

    const char* ErrorKindName(ErrorKind kind);

    struct DetailedMetrics
    {
        double avg_execution_time = 0.0;
        double max_execution_time = 0.0;
        double success_rate = 0.0;
        bool degraded = false; // 非隔离执行
    };

    struct ExecutionReport
    {
        ReportStatus status = ReportStatus::kError;
        ErrorKind error_kind = ErrorKind::kNone;
        int passed_count = 0;
        int failed_count = 0;
        bool all_passed = false;
        double total_execution_time_seconds = 0.0;
        std::vector<TestResult> test_results;
        std::optional<std::string> error_message;
        DetailedMetrics detailed_metrics;
        bool has_metrics = false; // harness 是否已给出 detailed_metrics
        std::optional<std::string> warning;
        std::string logs;         // 哨兵标记之外的原始输出
    };

    ExecutionReport MakeErrorReport(ErrorKind kind, const std::string& message);
    ExecutionReport MakeTimeoutReport();

    Value ReportToJson(const ExecutionReport& report);

    /**
     * @brief 从 harness 输出的 JSON 构造报告
     * @throw nlohmann::json::exception 字段类型不符
     */
    ExecutionReport ReportFromJson(const Value& j);

} // namespace saferun

#endif // SAFERUN_EXECUTION_TYPES_H
