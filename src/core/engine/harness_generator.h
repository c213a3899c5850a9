#ifndef SAFERUN_HARNESS_GENERATOR_H
#define SAFERUN_HARNESS_GENERATOR_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "execution_types.h"

namespace saferun {

    struct HarnessOptions
    {
        // 每个测试用例的软时钟 (秒), 0 表示关闭; 仅非隔离路径使用
        double soft_test_limit_seconds = 0.0;
    };

    /**
     * @brief 静态扫描候选代码, 找到第一个顶层 (第 0 列) 函数定义
     *
     * Python: def name(
     * JavaScript: function name( / const|let|var name = function
     *             / const|let|var name = (args) => / const|let|var name = arg =>
     *
     * 多种形式同时存在时取源码中最靠前的一个。嵌套函数、类方法与 async
     * 定义不识别。harness 内部使用完全相同的规则。
     */
    std::optional<std::string> DeriveEntryPoint(Language language, const std::string& source);

    bool IsValidIdentifier(Language language, const std::string& name);

    /**
     * @brief 源码去掉空行与注释后是否还有内容
     */
    bool HasExecutableContent(Language language, const std::string& source);

    /**
     * @brief 生成自包含的 runner 源码
     * runner 从自身所在目录读取 SourceFileName() 与 tests.json,
     * 在哨兵标记之间输出一个 JSON 结果对象。
     *
     * @param test_count runner 会校验 tests.json 中的用例数与之一致
     * @param entry_point 为空时 runner 按 DeriveEntryPoint 的规则自行推导
     * @throw std::invalid_argument entry_point 不是合法标识符
     */
    std::string GenerateHarness(Language language,
                                std::size_t test_count,
                                const std::optional<std::string>& entry_point,
                                const HarnessOptions& options = HarnessOptions{});

    /**
     * @brief tests.json 的内容
     */
    std::string SerializeTestCases(const std::vector<TestCase>& test_cases);

    const char* SourceFileName(Language language);   // solution.py / solution.js
    const char* HarnessFileName(Language language);  // harness.py / harness.js
    constexpr const char* kTestCasesFileName = "tests.json";

} // namespace saferun

#endif // SAFERUN_HARNESS_GENERATOR_H
