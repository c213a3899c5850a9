#include "result_protocol.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace saferun {

    namespace {

        std::string Trim(const std::string& s)
        {
            std::size_t begin = 0;
            std::size_t end = s.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
            return s.substr(begin, end - begin);
        }

    } // anonymous namespace

    std::string TruncateLog(const std::string& text, std::size_t max_bytes)
    {
        if (text.size() <= max_bytes) return text;
        std::size_t cut = max_bytes;
        // 回退到 UTF-8 字符边界
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        return text.substr(0, cut) + "\n...[truncated " + std::to_string(text.size() - cut) + " bytes]";
    }

    std::optional<ResultBlock> ExtractResultBlock(const std::string& output)
    {
        const std::string start_marker = kResultStartMarker;
        const std::string end_marker = kResultEndMarker;

        std::size_t end_pos = output.rfind(end_marker);
        if (end_pos == std::string::npos) return std::nullopt;

        if (end_pos < start_marker.size()) return std::nullopt;
        std::size_t start_pos = output.rfind(start_marker, end_pos - start_marker.size());
        if (start_pos == std::string::npos) return std::nullopt;

        std::size_t payload_begin = start_pos + start_marker.size();
        ResultBlock block;
        block.payload = Trim(output.substr(payload_begin, end_pos - payload_begin));

        std::size_t tail_begin = end_pos + end_marker.size();
        std::string head = output.substr(0, start_pos);
        std::string tail = tail_begin < output.size() ? output.substr(tail_begin) : std::string();
        // 标记所在行的换行符不属于日志
        if (!tail.empty() && tail.front() == '\n') tail.erase(0, 1);
        block.logs = head + tail;
        return block;
    }

    void FinalizeReport(ExecutionReport& report)
    {
        const std::size_t total = report.test_results.size();

        int passed = 0;
        double total_time = 0.0;
        double max_time = 0.0;
        for (const auto& r : report.test_results) {
            if (r.passed) ++passed;
            total_time += r.execution_time_seconds;
            max_time = std::max(max_time, r.execution_time_seconds);
        }

        if (report.status == ReportStatus::kSuccess || total > 0) {
            report.passed_count = passed;
            report.failed_count = static_cast<int>(total) - passed;
        }
        report.all_passed = report.status == ReportStatus::kSuccess
            && total > 0 && report.failed_count == 0;

        if (report.total_execution_time_seconds <= 0.0) {
            report.total_execution_time_seconds = total_time;
        }

        if (!report.has_metrics) {
            report.detailed_metrics.avg_execution_time = total > 0 ? report.total_execution_time_seconds / total : 0.0;
            report.detailed_metrics.max_execution_time = max_time;
            report.detailed_metrics.success_rate = total > 0 ? static_cast<double>(passed) / total : 0.0;
            report.has_metrics = true;
        }
    }

    void VerifyUnitResults(ExecutionReport& report, const std::vector<TestCase>& test_cases)
    {
        if (report.status != ReportStatus::kSuccess) {
            report.test_results.clear();
            report.passed_count = 0;
            report.failed_count = 0;
            report.all_passed = false;
            return;
        }

        auto reject = [&report](const std::string& why) {
            ExecutionReport err = MakeErrorReport(ErrorKind::kProtocol, "Inconsistent result block: " + why);
            err.logs = std::move(report.logs);
            report = std::move(err);
        };

        if (report.test_results.size() != test_cases.size()) {
            reject("expected " + std::to_string(test_cases.size()) + " test results, found "
                   + std::to_string(report.test_results.size()));
            return;
        }

        for (std::size_t i = 0; i < test_cases.size(); ++i) {
            TestResult& r = report.test_results[i];
            const TestCase& tc = test_cases[i];
            if (r.test_case_id != static_cast<int>(i) + 1) {
                reject("test result #" + std::to_string(i + 1) + " has test_case_id "
                       + std::to_string(r.test_case_id));
                return;
            }
            r.input = tc.input;
            r.expected_output = tc.expected_output;
            r.is_hidden = tc.is_hidden;
            r.explanation = tc.explanation;
            r.passed = !r.error.has_value() && ValuesEqual(r.output, tc.expected_output);
        }

        // 单元给出的汇总同样不可信
        report.has_metrics = false;
        FinalizeReport(report);
    }

    ExecutionReport ParseUnitOutput(const std::string& output, std::size_t max_log_bytes)
    {
        auto block = ExtractResultBlock(output);
        if (!block) {
            ExecutionReport report = MakeErrorReport(
                ErrorKind::kProtocol, "Result markers not found in execution output");
            report.logs = TruncateLog(output, max_log_bytes);
            return report;
        }

        Value parsed = Value::parse(block->payload, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            ExecutionReport report = MakeErrorReport(
                ErrorKind::kProtocol, "Malformed result block: payload is not a JSON object");
            report.logs = TruncateLog(output, max_log_bytes);
            return report;
        }

        ExecutionReport report;
        try {
            report = ReportFromJson(parsed);
        } catch (const Value::exception& ex) {
            ExecutionReport err = MakeErrorReport(
                ErrorKind::kProtocol, std::string("Malformed result block: ") + ex.what());
            err.logs = TruncateLog(output, max_log_bytes);
            return err;
        }

        FinalizeReport(report);
        report.logs = TruncateLog(block->logs, max_log_bytes);
        return report;
    }

} // namespace saferun
