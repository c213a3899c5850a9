#include "safety_checker.h"

#include <regex>
#include <set>
#include <sstream>

namespace saferun {

    namespace {

        const std::set<std::string>& DangerousPythonModules()
        {
            static const std::set<std::string> modules = {
                "os", "sys", "subprocess", "shutil", "socket", "requests",
                "urllib", "http", "ftplib", "telnetlib", "importlib"
            };
            return modules;
        }

        std::string TopLevelModule(const std::string& dotted)
        {
            return dotted.substr(0, dotted.find('.'));
        }

        std::string StripTrailingComment(const std::string& line)
        {
            std::size_t hash = line.find('#');
            return hash == std::string::npos ? line : line.substr(0, hash);
        }

        SafetyVerdict Reject(const std::string& reason)
        {
            return SafetyVerdict{false, reason};
        }

    } // anonymous namespace

    SafetyVerdict SafetyChecker::Check(Language language, const std::string& source)
    {
        return language == Language::kPython ? CheckPython(source) : CheckJavaScript(source);
    }

    SafetyVerdict SafetyChecker::CheckPython(const std::string& source)
    {
        static const std::regex import_re(R"(^\s*import\s+(.+)$)");
        static const std::regex from_re(R"(^\s*from\s+([A-Za-z_][A-Za-z0-9_.]*)\s+import\b)");
        static const std::regex call_re(R"((^|[^A-Za-z0-9_.])(exec|eval|compile|__import__)\s*\()");
        static const std::regex attr_re(
            R"((^|[^A-Za-z0-9_.])(os|sys|subprocess|shutil|socket|requests|urllib|http|ftplib|telnetlib|importlib)\.(system|popen|spawn|exec)\b)");

        std::istringstream in(source);
        std::string raw;
        std::smatch m;
        while (std::getline(in, raw)) {
            const std::string line = StripTrailingComment(raw);

            if (std::regex_search(line, m, import_re)) {
                // import a, b.c as d
                std::istringstream names(m[1].str());
                std::string item;
                while (std::getline(names, item, ',')) {
                    std::istringstream words(item);
                    std::string name;
                    words >> name;
                    if (DangerousPythonModules().count(TopLevelModule(name))) {
                        return Reject("Unsafe module import: " + name);
                    }
                }
            }
            if (std::regex_search(line, m, from_re)) {
                if (DangerousPythonModules().count(TopLevelModule(m[1].str()))) {
                    return Reject("Unsafe module import: " + m[1].str());
                }
            }
            if (std::regex_search(line, m, call_re)) {
                return Reject("Unsafe function call: " + m[2].str());
            }
            if (std::regex_search(line, m, attr_re)) {
                return Reject("Unsafe attribute access: " + m[2].str() + "." + m[3].str());
            }
        }
        return SafetyVerdict{};
    }

    SafetyVerdict SafetyChecker::CheckJavaScript(const std::string& source)
    {
        struct Rule {
            std::regex pattern;
            const char* reason;
        };
        static const Rule rules[] = {
            {std::regex(R"(\brequire\s*\()"), "Unsafe module access: require()"},
            {std::regex(R"(\bprocess\s*\.)"), "Unsafe global access: process"},
            {std::regex(R"(child_process)"), "Unsafe module access: child_process"},
            {std::regex(R"((^|[^A-Za-z0-9_$.])eval\s*\()"), "Unsafe function call: eval"},
            {std::regex(R"(\bFunction\s*\()"), "Unsafe function call: Function constructor"},
            {std::regex(R"((^|[^A-Za-z0-9_$.])import\s*\()"), "Unsafe dynamic import()"},
        };

        std::istringstream in(source);
        std::string line;
        while (std::getline(in, line)) {
            std::size_t first = line.find_first_not_of(" \t");
            if (first != std::string::npos && line.compare(first, 2, "//") == 0) continue;
            for (const auto& rule : rules) {
                if (std::regex_search(line, rule.pattern)) {
                    return Reject(rule.reason);
                }
            }
        }
        return SafetyVerdict{};
    }

} // namespace saferun
