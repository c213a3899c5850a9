#include "execution_types.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace saferun {

    namespace {

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string OptionalString(const Value& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string()) return "";
            return it->get<std::string>();
        }

        Value TestResultToJson(const TestResult& r)
        {
            Value j;
            j["test_case_id"] = r.test_case_id;
            j["input"] = r.input;
            j["expected_output"] = r.expected_output;
            j["passed"] = r.passed;
            j["output"] = r.output;
            j["error"] = r.error ? Value(*r.error) : Value(nullptr);
            j["execution_time_seconds"] = r.execution_time_seconds;
            j["is_hidden"] = r.is_hidden;
            j["explanation"] = r.explanation;
            if (!r.stdout_text.empty()) j["stdout"] = r.stdout_text;
            if (!r.stderr_text.empty()) j["stderr"] = r.stderr_text;
            if (!r.traceback.empty()) j["traceback"] = r.traceback;
            return j;
        }

        TestResult TestResultFromJson(const Value& j)
        {
            TestResult r;
            r.test_case_id = j.value("test_case_id", 0);
            r.input = j.value("input", Value());
            r.expected_output = j.value("expected_output", Value());
            r.passed = j.value("passed", false);
            r.output = j.value("output", Value());
            auto err = j.find("error");
            if (err != j.end() && !err->is_null()) {
                r.error = err->is_string() ? err->get<std::string>() : err->dump();
            }
            r.execution_time_seconds = j.value("execution_time_seconds", 0.0);
            r.is_hidden = j.value("is_hidden", false);
            r.explanation = OptionalString(j, "explanation");
            r.stdout_text = OptionalString(j, "stdout");
            r.stderr_text = OptionalString(j, "stderr");
            r.traceback = OptionalString(j, "traceback");
            return r;
        }

        ErrorKind ParseErrorKind(const std::string& name)
        {
            if (name == "infrastructure") return ErrorKind::kInfrastructure;
            if (name == "timeout") return ErrorKind::kTimeout;
            if (name == "candidate_fault") return ErrorKind::kCandidateFault;
            if (name == "protocol") return ErrorKind::kProtocol;
            if (name == "cancelled") return ErrorKind::kCancelled;
            return ErrorKind::kNone;
        }

    } // anonymous namespace

    std::optional<Language> ParseLanguage(const std::string& name)
    {
        std::string n = ToLower(name);
        if (n == "python" || n == "python3" || n == "py") return Language::kPython;
        if (n == "javascript" || n == "js" || n == "node" || n == "nodejs") return Language::kJavaScript;
        return std::nullopt;
    }

    const char* LanguageName(Language language)
    {
        switch (language) {
            case Language::kPython: return "python";
            case Language::kJavaScript: return "javascript";
        }
        return "unknown";
    }

    std::optional<ExecutionMode> ParseExecutionMode(const std::string& name)
    {
        std::string n = ToLower(name);
        if (n == "auto") return ExecutionMode::kAuto;
        if (n == "isolated") return ExecutionMode::kIsolated;
        if (n == "insecure" || n == "insecure_fallback") return ExecutionMode::kInsecureFallback;
        return std::nullopt;
    }

    const char* ExecutionModeName(ExecutionMode mode)
    {
        switch (mode) {
            case ExecutionMode::kAuto: return "auto";
            case ExecutionMode::kIsolated: return "isolated";
            case ExecutionMode::kInsecureFallback: return "insecure";
        }
        return "unknown";
    }

    TestCase TestCaseFromJson(const Value& j)
    {
        if (!j.is_object()) {
            throw std::invalid_argument(std::string("test case must be an object, got ") + ValueKind(j));
        }
        TestCase tc;
        tc.input = j.value("input", Value());
        tc.expected_output = j.value("expected_output", Value());
        tc.is_hidden = j.value("is_hidden", false);
        tc.explanation = OptionalString(j, "explanation");
        return tc;
    }

    Value TestCaseToJson(const TestCase& tc)
    {
        return Value{
            {"input", tc.input},
            {"expected_output", tc.expected_output},
            {"is_hidden", tc.is_hidden},
            {"explanation", tc.explanation}
        };
    }

    std::vector<TestCase> ParseTestCases(const Value& j)
    {
        if (!j.is_array()) {
            throw std::invalid_argument(std::string("test cases must be a JSON array, got ") + ValueKind(j));
        }
        std::vector<TestCase> cases;
        cases.reserve(j.size());
        for (const auto& item : j) {
            cases.push_back(TestCaseFromJson(item));
        }
        return cases;
    }

    ResourceLimits ResourceLimits::Normalized() const
    {
        ResourceLimits out = *this;
        if (std::isnan(out.cpu_fraction) || out.cpu_fraction < kMinCpuFraction) {
            out.cpu_fraction = kMinCpuFraction;
        } else if (out.cpu_fraction > 1.0) {
            out.cpu_fraction = 1.0;
        }
        if (out.memory_bytes == 0) out.memory_bytes = kDefaultMemoryBytes;
        if (out.wall_clock_timeout_seconds == 0) out.wall_clock_timeout_seconds = kDefaultTimeoutSeconds;
        return out;
    }

    const char* ReportStatusName(ReportStatus status)
    {
        switch (status) {
            case ReportStatus::kSuccess: return "success";
            case ReportStatus::kError: return "error";
            case ReportStatus::kTimeout: return "timeout";
        }
        return "error";
    }

    const char* ErrorKindName(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::kNone: return "none";
            case ErrorKind::kInfrastructure: return "infrastructure";
            case ErrorKind::kTimeout: return "timeout";
            case ErrorKind::kCandidateFault: return "candidate_fault";
            case ErrorKind::kProtocol: return "protocol";
            case ErrorKind::kCancelled: return "cancelled";
        }
        return "none";
    }

    ExecutionReport MakeErrorReport(ErrorKind kind, const std::string& message)
    {
        ExecutionReport report;
        report.status = ReportStatus::kError;
        report.error_kind = kind;
        report.error_message = message;
        return report;
    }

    ExecutionReport MakeTimeoutReport()
    {
        ExecutionReport report;
        report.status = ReportStatus::kTimeout;
        report.error_kind = ErrorKind::kTimeout;
        report.error_message = "Execution timed out";
        return report;
    }

    Value ReportToJson(const ExecutionReport& report)
    {
        Value j;
        j["status"] = ReportStatusName(report.status);
        j["error_kind"] = ErrorKindName(report.error_kind);
        j["passed_count"] = report.passed_count;
        j["failed_count"] = report.failed_count;
        j["all_passed"] = report.all_passed;
        j["total_execution_time_seconds"] = report.total_execution_time_seconds;

        Value results = Value::array();
        for (const auto& r : report.test_results) {
            results.push_back(TestResultToJson(r));
        }
        j["test_results"] = std::move(results);

        j["error_message"] = report.error_message ? Value(*report.error_message) : Value(nullptr);
        j["detailed_metrics"] = {
            {"avg_execution_time", report.detailed_metrics.avg_execution_time},
            {"max_execution_time", report.detailed_metrics.max_execution_time},
            {"success_rate", report.detailed_metrics.success_rate},
            {"degraded", report.detailed_metrics.degraded}
        };
        if (report.warning) j["warning"] = *report.warning;
        j["logs"] = report.logs;
        return j;
    }

    ExecutionReport ReportFromJson(const Value& j)
    {
        ExecutionReport report;
        const std::string status = j.value("status", std::string("error"));
        if (status == "success") {
            report.status = ReportStatus::kSuccess;
        } else if (status == "timeout") {
            report.status = ReportStatus::kTimeout;
        } else {
            report.status = ReportStatus::kError;
        }

        report.error_kind = ParseErrorKind(OptionalString(j, "error_kind"));
        if (report.status == ReportStatus::kError && report.error_kind == ErrorKind::kNone) {
            report.error_kind = ErrorKind::kCandidateFault;
        }

        report.passed_count = j.value("passed_count", 0);
        report.failed_count = j.value("failed_count", 0);
        report.all_passed = j.value("all_passed", false);
        report.total_execution_time_seconds = j.value("total_execution_time_seconds", 0.0);

        auto results = j.find("test_results");
        if (results != j.end() && results->is_array()) {
            for (const auto& item : *results) {
                report.test_results.push_back(TestResultFromJson(item));
            }
        }

        auto msg = j.find("error_message");
        if (msg != j.end() && msg->is_string()) {
            report.error_message = msg->get<std::string>();
        }

        auto metrics = j.find("detailed_metrics");
        if (metrics != j.end() && metrics->is_object()) {
            report.has_metrics = true;
            report.detailed_metrics.avg_execution_time = metrics->value("avg_execution_time", 0.0);
            report.detailed_metrics.max_execution_time = metrics->value("max_execution_time", 0.0);
            report.detailed_metrics.success_rate = metrics->value("success_rate", 0.0);
        }
        return report;
    }

} // namespace saferun
