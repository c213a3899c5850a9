#include <string>

#include "../test_common.h"
#include "value.h"

using saferun::Value;
using saferun::ValuesEqual;
using saferun_test::Expect;

int main() {
    std::cout << "=== Comparator Test ===" << std::endl;

    // 标量
    Expect(ValuesEqual(Value(3), Value(3)), "int_equal");
    Expect(!ValuesEqual(Value(3), Value(4)), "int_not_equal");
    Expect(ValuesEqual(Value(1), Value(1.0)), "int_float_numeric");
    Expect(ValuesEqual(Value(0.5), Value(0.5)), "float_equal");
    Expect(ValuesEqual(Value("abc"), Value("abc")), "string_equal");
    Expect(!ValuesEqual(Value("1"), Value(1)), "string_vs_number");
    Expect(ValuesEqual(Value(nullptr), Value(nullptr)), "null_equal_null");
    Expect(!ValuesEqual(Value(nullptr), Value(0)), "null_vs_zero");
    Expect(!ValuesEqual(Value(true), Value(1)), "bool_vs_number");
    Expect(!ValuesEqual(Value(false), Value(0)), "false_vs_zero");
    Expect(ValuesEqual(Value(false), Value(false)), "bool_equal");

    // 整数精确比较 (经 double 会相等)
    Expect(!ValuesEqual(Value(9007199254740993LL), Value(9007199254740992LL)), "large_int_exact");
    Expect(!ValuesEqual(Value(-1), Value(18446744073709551615ULL)), "signed_vs_unsigned");

    // 序列
    Expect(ValuesEqual(Value::parse("[1, 2, 3]"), Value::parse("[1, 2, 3]")), "sequence_equal");
    Expect(!ValuesEqual(Value::parse("[1, 2]"), Value::parse("[1, 2, 3]")), "sequence_length_mismatch");
    Expect(!ValuesEqual(Value::parse("[1, 2, 3]"), Value::parse("[1, 2]")), "sequence_length_mismatch_rev");
    Expect(!ValuesEqual(Value::parse("[2, 1]"), Value::parse("[1, 2]")), "sequence_order_matters");
    Expect(ValuesEqual(Value::parse("[]"), Value::parse("[]")), "empty_sequences");

    // 映射
    Expect(ValuesEqual(Value::parse(R"({"a": 1, "b": [1, 2]})"),
                       Value::parse(R"({"b": [1, 2], "a": 1})")), "map_key_order_irrelevant");
    Expect(!ValuesEqual(Value::parse(R"({"a": 1})"), Value::parse(R"({"a": 1, "b": 2})")), "map_missing_key");
    Expect(!ValuesEqual(Value::parse(R"({"a": 1, "c": 2})"), Value::parse(R"({"a": 1, "b": 2})")), "map_different_keys");
    Expect(!ValuesEqual(Value::parse(R"({"a": 1})"), Value::parse(R"({"a": 2})")), "map_value_mismatch");

    // 变体不同一律不等
    Expect(!ValuesEqual(Value::parse("[]"), Value::parse("{}")), "sequence_vs_map_empty");
    Expect(!ValuesEqual(Value::parse(R"([["a", 1]])"), Value::parse(R"({"a": 1})")), "sequence_vs_map_equivalent");

    // 嵌套
    Expect(ValuesEqual(Value::parse(R"({"x": [{"y": null}, [1.0, "s"]]})"),
                       Value::parse(R"({"x": [{"y": null}, [1, "s"]]})")), "nested_equal");
    Expect(!ValuesEqual(Value::parse(R"({"x": [{"y": null}, [1, "s"]]})"),
                        Value::parse(R"({"x": [{"y": 0}, [1, "s"]]})")), "nested_mismatch");

    Expect(std::string(saferun::ValueKind(Value::parse("[]"))) == "sequence", "kind_sequence");
    Expect(std::string(saferun::ValueKind(Value::parse("{}"))) == "map", "kind_map");
    Expect(std::string(saferun::ValueKind(Value(true))) == "bool", "kind_bool");

    return saferun_test::Finish("Comparator Test");
}
