#include <string>
#include <vector>

#include "../test_common.h"
#include "result_protocol.h"

using namespace saferun;
using saferun_test::Expect;

namespace {

std::string Wrap(const std::string& payload) {
    return std::string("\n") + kResultStartMarker + "\n" + payload + "\n" + kResultEndMarker + "\n";
}

const char* kTwoTests = R"({
  "status": "success", "error_kind": "none",
  "test_results": [
    {"test_case_id": 1, "input": [1, 2], "expected_output": 3, "passed": true, "output": 3,
     "error": null, "execution_time_seconds": 0.002},
    {"test_case_id": 2, "input": [2, 2], "expected_output": 5, "passed": false, "output": 4,
     "error": null, "execution_time_seconds": 0.004}
  ],
  "error_message": null
})";

void TestExtraction() {
    auto block = ExtractResultBlock("noise before" + Wrap("{\"a\": 1}") + "noise after");
    Expect(block.has_value(), "extract_basic");
    Expect(block && block->payload == "{\"a\": 1}", "extract_payload_trimmed");
    Expect(block && block->logs == "noise before\nnoise after", "extract_logs_outside_markers");

    Expect(!ExtractResultBlock("no markers at all").has_value(), "extract_missing_markers");
    Expect(!ExtractResultBlock(std::string(kResultStartMarker) + "\n{}\n").has_value(), "extract_missing_end");
    Expect(!ExtractResultBlock(std::string(kResultEndMarker) + "\n").has_value(), "extract_end_only");

    // 候选代码打印了伪造的结果块: 取最后一个 END 之前的最后一个 START
    std::string forged = Wrap(R"({"status": "success", "passed_count": 99})");
    auto last = ExtractResultBlock(forged + Wrap("{\"real\": true}"));
    Expect(last && last->payload == "{\"real\": true}", "extract_last_block_wins");
}

void TestParse() {
    ExecutionReport report = ParseUnitOutput("print from candidate\n" + Wrap(kTwoTests), 1024);
    Expect(report.status == ReportStatus::kSuccess, "parse_success_status");
    Expect(report.passed_count == 1 && report.failed_count == 1, "parse_counts_recomputed");
    Expect(!report.all_passed, "parse_not_all_passed");
    Expect(report.test_results.size() == 2 && report.test_results[1].output == 4, "parse_second_output_is_4");
    // harness 在起始标记前补的换行保留在日志中
    Expect(report.logs == "print from candidate\n\n", "parse_logs_kept");
    Expect(report.has_metrics && report.detailed_metrics.success_rate == 0.5, "parse_metrics_filled");
    Expect(report.total_execution_time_seconds > 0.0059 && report.total_execution_time_seconds < 0.0061,
           "parse_total_time_summed");

    ExecutionReport missing = ParseUnitOutput("Traceback: killed", 1024);
    Expect(missing.status == ReportStatus::kError && missing.error_kind == ErrorKind::kProtocol,
           "parse_missing_markers_is_protocol_error");
    Expect(missing.error_message && *missing.error_message == "Result markers not found in execution output",
           "parse_missing_markers_message");
    Expect(missing.logs == "Traceback: killed", "parse_missing_markers_logs");

    ExecutionReport malformed = ParseUnitOutput(Wrap("{not json"), 1024);
    Expect(malformed.error_kind == ErrorKind::kProtocol
           && malformed.error_message->rfind("Malformed result block", 0) == 0, "parse_malformed_payload");

    ExecutionReport wrong_type = ParseUnitOutput(Wrap(R"({"status": "success", "passed_count": "x"})"), 1024);
    Expect(wrong_type.error_kind == ErrorKind::kProtocol, "parse_wrong_field_type");

    // harness 中转义过的标记文本被还原进 stdout, 不影响提取
    std::string escaped = R"({"status": "success", "test_results": [{"test_case_id": 1, "passed": true,
        "output": 1, "expected_output": 1, "stdout": "\u005f_RESULTS_JSON_END__\n"}]})";
    ExecutionReport esc = ParseUnitOutput(Wrap(escaped), 1024);
    Expect(esc.status == ReportStatus::kSuccess
           && esc.test_results.size() == 1
           && esc.test_results[0].stdout_text == std::string(kResultEndMarker) + "\n", "parse_escaped_marker_in_stdout");

    ExecutionReport err = ParseUnitOutput(Wrap(R"({"status": "error", "error_kind": "candidate_fault",
        "test_results": [], "error_message": "NoEntryPointError: no top-level function definition found in candidate code"})"), 1024);
    Expect(err.status == ReportStatus::kError && err.passed_count == 0 && !err.all_passed, "parse_error_report");
}

std::vector<TestCase> AddCases() {
    return ParseTestCases(Value::parse(
        R"([{"input": [1, 2], "expected_output": 3}, {"input": [2, 2], "expected_output": 5, "is_hidden": true}])"));
}

void TestVerifyUnitResults() {
    // 候选代码自己写出结果块后直接退出: id 为 0, 输入为空, 全部标记通过
    ExecutionReport forged = ParseUnitOutput(Wrap(R"({"status": "success", "test_results": [
        {"test_case_id": 0, "input": null, "expected_output": 99, "passed": true, "output": 99},
        {"test_case_id": 0, "input": null, "expected_output": 99, "passed": true, "output": 99}]})"), 1024);
    Expect(forged.all_passed, "verify_precondition_parser_accepts_block");
    VerifyUnitResults(forged, AddCases());
    Expect(forged.status == ReportStatus::kError && forged.error_kind == ErrorKind::kProtocol
           && !forged.all_passed && forged.passed_count == 0 && forged.test_results.empty(),
           "verify_wrong_ids_is_protocol_error", forged.error_message.value_or(""));

    ExecutionReport short_block = ParseUnitOutput(Wrap(R"({"status": "success", "test_results": [
        {"test_case_id": 1, "passed": true, "output": 3}]})"), 1024);
    VerifyUnitResults(short_block, AddCases());
    Expect(short_block.error_kind == ErrorKind::kProtocol
           && short_block.error_message->find("expected 2 test results, found 1") != std::string::npos,
           "verify_count_mismatch_is_protocol_error");

    // id 正确但 passed 被改写: 宿主用自己的比较器重判, 输入与期望值以请求为准
    ExecutionReport lied = ParseUnitOutput("log line\n" + Wrap(R"({"status": "success", "test_results": [
        {"test_case_id": 1, "input": "x", "expected_output": 3, "passed": false, "output": 3},
        {"test_case_id": 2, "input": "y", "expected_output": 4, "passed": true, "output": 4}],
        "detailed_metrics": {"avg_execution_time": 0, "max_execution_time": 0, "success_rate": 1.0}})"), 1024);
    VerifyUnitResults(lied, AddCases());
    Expect(lied.status == ReportStatus::kSuccess && lied.passed_count == 1 && lied.failed_count == 1
           && !lied.all_passed, "verify_passed_recomputed_by_host");
    Expect(lied.test_results.size() == 2 && lied.test_results[0].passed && !lied.test_results[1].passed,
           "verify_per_test_verdicts");
    Expect(lied.test_results.size() == 2 && lied.test_results[0].input == Value::parse("[1, 2]")
           && lied.test_results[1].expected_output == 5 && lied.test_results[1].is_hidden,
           "verify_request_fields_restored");
    Expect(lied.detailed_metrics.success_rate == 0.5, "verify_metrics_recomputed");
    Expect(lied.logs == "log line\n\n", "verify_logs_kept");

    // 带 error 的结果即使输出相等也不算通过
    ExecutionReport errored = ParseUnitOutput(Wrap(R"({"status": "success", "test_results": [
        {"test_case_id": 1, "passed": true, "output": 3, "error": "Test exceeded soft time limit of 1s"},
        {"test_case_id": 2, "passed": true, "output": 5}]})"), 1024);
    VerifyUnitResults(errored, AddCases());
    Expect(errored.passed_count == 1 && !errored.test_results[0].passed, "verify_error_never_passes");

    // 非 success 报告不携带可计分结果
    ExecutionReport failed = ParseUnitOutput(Wrap(R"({"status": "error", "error_kind": "candidate_fault",
        "error_message": "boom", "test_results": [{"test_case_id": 1, "passed": true, "output": 3}]})"), 1024);
    VerifyUnitResults(failed, AddCases());
    Expect(failed.status == ReportStatus::kError && failed.test_results.empty() && failed.passed_count == 0
           && failed.error_message.value_or("") == "boom", "verify_error_report_drops_results");
}

void TestTruncate() {
    Expect(TruncateLog("short", 10) == "short", "truncate_noop");
    std::string t = TruncateLog(std::string(100, 'a'), 10);
    Expect(t.rfind(std::string(10, 'a'), 0) == 0 && t.find("truncated 90 bytes") != std::string::npos,
           "truncate_marks_dropped_bytes");
    // "é" = 0xC3 0xA9: 不能切在中间
    std::string utf = "a\xC3\xA9";
    std::string cut = TruncateLog(utf, 2);
    Expect(cut.rfind("a\n", 0) == 0, "truncate_utf8_boundary");
}

}  // namespace

int main() {
    std::cout << "=== Result Protocol Test ===" << std::endl;
    TestExtraction();
    TestParse();
    TestVerifyUnitResults();
    TestTruncate();
    return saferun_test::Finish("Result Protocol Test");
}
