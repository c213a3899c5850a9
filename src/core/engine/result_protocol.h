#ifndef SAFERUN_RESULT_PROTOCOL_H
#define SAFERUN_RESULT_PROTOCOL_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "execution_types.h"

namespace saferun {

    // 宿主 <-> 执行单元线协议: 两行字面量之间是一个 JSON 对象
    constexpr const char* kResultStartMarker = "__RESULTS_JSON_START__";
    constexpr const char* kResultEndMarker = "__RESULTS_JSON_END__";

    struct ResultBlock
    {
        std::string payload; // 两个哨兵之间的文本 (已去除首尾空白)
        std::string logs;    // 哨兵之外的全部文本, 原样保留
    };

    /**
     * @brief 在合并输出流中定位结果块
     * 取最后一个 END, 以及它之前最后一个 START; 候选代码自己打印的
     * 伪造标记总是出现在 harness 的真实结果块之前。
     * @return 未找到成对标记时返回 std::nullopt
     */
    std::optional<ResultBlock> ExtractResultBlock(const std::string& output);

    /**
     * @brief 将执行单元输出解析为报告 (从不抛出)
     * 缺失哨兵或 JSON 非法 -> status:error, ErrorKind::kProtocol, 原始输出进入 logs
     * @param max_log_bytes logs 字段上限, 超出部分截断并追加提示
     */
    ExecutionReport ParseUnitOutput(const std::string& output, std::size_t max_log_bytes);

    /**
     * @brief 按 test_results 重新计算计数与汇总指标
     * status == success 时保证 passed_count + failed_count == test_results.size()
     */
    void FinalizeReport(ExecutionReport& report);

    /**
     * @brief 以请求为准核对执行单元给出的结果
     * 单元内的候选代码可以写出完整的伪造结果块, 因此宿主不采信
     * 单元给出的 passed / input / expected_output:
     * - success 报告必须恰好有 N 条结果, test_case_id 依次为 1..N, 否则转为 ProtocolError
     * - input / expected_output / is_hidden / explanation 从请求覆盖
     * - passed = 无 error 且 ValuesEqual(output, expected_output), 随后重算计数与指标
     * - 非 success 报告不带可计分的结果
     */
    void VerifyUnitResults(ExecutionReport& report, const std::vector<TestCase>& test_cases);

    /**
     * @brief 把文本截断到 max_bytes (不切断 UTF-8 多字节序列)
     */
    std::string TruncateLog(const std::string& text, std::size_t max_bytes);

} // namespace saferun

#endif // SAFERUN_RESULT_PROTOCOL_H
