#include "harness_generator.h"
#include "harness_templates.h"

#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace saferun {

    namespace {

        const std::regex& PythonDefPattern()
        {
            static const std::regex pattern(R"(^def\s+([A-Za-z_][A-Za-z0-9_]*)\s*\()");
            return pattern;
        }

        const std::regex& JsFunctionPattern()
        {
            static const std::regex pattern(R"(^function\s+([A-Za-z_$][A-Za-z0-9_$]*)\s*\()");
            return pattern;
        }

        const std::regex& JsAssignmentPattern()
        {
            static const std::regex pattern(
                R"(^(?:const|let|var)\s+([A-Za-z_$][A-Za-z0-9_$]*)\s*=\s*)"
                R"((?:function\b|\([^)]*\)\s*=>|[A-Za-z_$][A-Za-z0-9_$]*\s*=>))");
            return pattern;
        }

        std::vector<std::string> SplitLines(const std::string& source)
        {
            std::vector<std::string> lines;
            std::size_t start = 0;
            while (start <= source.size()) {
                std::size_t end = source.find('\n', start);
                if (end == std::string::npos) end = source.size();
                std::string line = source.substr(start, end - start);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                lines.push_back(std::move(line));
                start = end + 1;
            }
            return lines;
        }

        void ReplaceAll(std::string& text, const std::string& from, const std::string& to)
        {
            std::size_t pos = 0;
            while ((pos = text.find(from, pos)) != std::string::npos) {
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
        }

        bool IsBlank(const std::string& line)
        {
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        // 去掉 // 行注释与 /* */ 块注释 (不识别字符串字面量中的注释符号)
        std::string StripJsComments(const std::string& source)
        {
            std::string out;
            out.reserve(source.size());
            std::size_t i = 0;
            while (i < source.size()) {
                if (source.compare(i, 2, "//") == 0) {
                    std::size_t nl = source.find('\n', i);
                    if (nl == std::string::npos) break;
                    i = nl;
                } else if (source.compare(i, 2, "/*") == 0) {
                    std::size_t close = source.find("*/", i + 2);
                    if (close == std::string::npos) break;
                    i = close + 2;
                } else {
                    out.push_back(source[i++]);
                }
            }
            return out;
        }

        std::string FormatSoftLimit(double seconds)
        {
            if (!(seconds > 0.0)) return "0";
            std::ostringstream oss;
            oss.precision(6);
            oss << std::fixed << seconds;
            return oss.str();
        }

    } // anonymous namespace

    std::optional<std::string> DeriveEntryPoint(Language language, const std::string& source)
    {
        std::smatch match;
        for (const auto& line : SplitLines(source)) {
            if (language == Language::kPython) {
                if (std::regex_search(line, match, PythonDefPattern())) return match[1].str();
            } else {
                if (std::regex_search(line, match, JsFunctionPattern())) return match[1].str();
                if (std::regex_search(line, match, JsAssignmentPattern())) return match[1].str();
            }
        }
        return std::nullopt;
    }

    bool IsValidIdentifier(Language language, const std::string& name)
    {
        if (name.empty() || name.size() > 128) return false;
        auto head_ok = [language](unsigned char c) {
            return std::isalpha(c) || c == '_' || (language == Language::kJavaScript && c == '$');
        };
        if (!head_ok(static_cast<unsigned char>(name[0]))) return false;
        for (unsigned char c : name) {
            if (!head_ok(c) && !std::isdigit(c)) return false;
        }
        return true;
    }

    bool HasExecutableContent(Language language, const std::string& source)
    {
        const std::string text = language == Language::kJavaScript ? StripJsComments(source) : source;
        for (const auto& line : SplitLines(text)) {
            if (IsBlank(line)) continue;
            if (language == Language::kPython) {
                std::size_t first = line.find_first_not_of(" \t");
                if (line[first] == '#') continue;
            }
            return true;
        }
        return false;
    }

    std::string GenerateHarness(Language language,
                                std::size_t test_count,
                                const std::optional<std::string>& entry_point,
                                const HarnessOptions& options)
    {
        std::string entry_literal;
        if (entry_point) {
            if (!IsValidIdentifier(language, *entry_point)) {
                throw std::invalid_argument("invalid entry point identifier: " + *entry_point);
            }
            // 合法标识符的 JSON 字符串同时也是合法的 Python / JS 字符串字面量
            entry_literal = Value(*entry_point).dump();
        } else {
            entry_literal = language == Language::kPython ? "None" : "null";
        }

        std::string source = language == Language::kPython
            ? kPythonHarnessTemplate
            : kJavaScriptHarnessTemplate;
        ReplaceAll(source, "{{ENTRY_POINT}}", entry_literal);
        ReplaceAll(source, "{{TEST_COUNT}}", std::to_string(test_count));
        ReplaceAll(source, "{{SOFT_LIMIT}}", FormatSoftLimit(options.soft_test_limit_seconds));
        return source;
    }

    std::string SerializeTestCases(const std::vector<TestCase>& test_cases)
    {
        Value array = Value::array();
        for (const auto& tc : test_cases) {
            array.push_back(TestCaseToJson(tc));
        }
        return array.dump();
    }

    const char* SourceFileName(Language language)
    {
        return language == Language::kPython ? "solution.py" : "solution.js";
    }

    const char* HarnessFileName(Language language)
    {
        return language == Language::kPython ? "harness.py" : "harness.js";
    }

} // namespace saferun
