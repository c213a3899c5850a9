#ifndef SAFERUN_VALUE_H
#define SAFERUN_VALUE_H

#include <nlohmann/json.hpp>

namespace saferun {

    /**
     * @brief 测试输入/输出的通用值类型
     * 标签联合: null, bool, number, string, sequence<Value>, map<string, Value>
     * 直接复用 JSON 文档模型, 与宿主-单元之间的线协议保持一致。
     */
    using Value = nlohmann::json;

    /**
     * @brief 结构化深度相等
     * - 标量按值比较 (整数精确比较, 整数与浮点按数值比较)
     * - 序列: 长度一致才逐元素比较
     * - 映射: 键集合完全一致后递归比较
     * - null == null; 不同变体 (含 bool 与 number) 一律不等
     *
     * Python / JavaScript harness 内嵌同一规则的独立实现, 三者必须一致。
     */
    bool ValuesEqual(const Value& actual, const Value& expected);

    /**
     * @brief 变体名称 (null/bool/number/string/sequence/map), 用于诊断信息
     */
    const char* ValueKind(const Value& v);

} // namespace saferun

#endif // SAFERUN_VALUE_H
