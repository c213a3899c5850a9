#include "value.h"

#include <cstdint>

namespace saferun {

    namespace {

        bool NumbersEqual(const Value& a, const Value& b)
        {
            // 整数之间精确比较, 避免大整数经 double 转换后误判相等
            if (a.is_number_integer() && b.is_number_integer()) {
                if (a.is_number_unsigned() && b.is_number_unsigned()) {
                    return a.get<std::uint64_t>() == b.get<std::uint64_t>();
                }
                if (a.is_number_unsigned()) {
                    std::int64_t bv = b.get<std::int64_t>();
                    return bv >= 0 && a.get<std::uint64_t>() == static_cast<std::uint64_t>(bv);
                }
                if (b.is_number_unsigned()) {
                    std::int64_t av = a.get<std::int64_t>();
                    return av >= 0 && static_cast<std::uint64_t>(av) == b.get<std::uint64_t>();
                }
                return a.get<std::int64_t>() == b.get<std::int64_t>();
            }
            return a.get<double>() == b.get<double>();
        }

    } // anonymous namespace

    const char* ValueKind(const Value& v)
    {
        if (v.is_null()) return "null";
        if (v.is_boolean()) return "bool";
        if (v.is_number()) return "number";
        if (v.is_string()) return "string";
        if (v.is_array()) return "sequence";
        if (v.is_object()) return "map";
        return "unsupported";
    }

    bool ValuesEqual(const Value& actual, const Value& expected)
    {
        if (actual.is_null() || expected.is_null()) {
            return actual.is_null() && expected.is_null();
        }

        if (actual.is_boolean() || expected.is_boolean()) {
            return actual.is_boolean() && expected.is_boolean()
                && actual.get<bool>() == expected.get<bool>();
        }

        if (actual.is_number() || expected.is_number()) {
            return actual.is_number() && expected.is_number() && NumbersEqual(actual, expected);
        }

        if (actual.is_string() || expected.is_string()) {
            return actual.is_string() && expected.is_string()
                && actual.get_ref<const std::string&>() == expected.get_ref<const std::string&>();
        }

        if (actual.is_array() || expected.is_array()) {
            if (!actual.is_array() || !expected.is_array()) return false;
            if (actual.size() != expected.size()) return false;
            for (std::size_t i = 0; i < actual.size(); ++i) {
                if (!ValuesEqual(actual[i], expected[i])) return false;
            }
            return true;
        }

        if (actual.is_object() && expected.is_object()) {
            if (actual.size() != expected.size()) return false;
            for (auto it = expected.begin(); it != expected.end(); ++it) {
                auto found = actual.find(it.key());
                if (found == actual.end()) return false;
                if (!ValuesEqual(*found, it.value())) return false;
            }
            return true;
        }

        // binary / discarded 不属于 Value 联合
        return false;
    }

} // namespace saferun
