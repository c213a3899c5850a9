#ifndef SAFERUN_TEST_COMMON_H
#define SAFERUN_TEST_COMMON_H

#include <iostream>
#include <string>

// ANSI Colors
#define GREEN "\033[0;32m"
#define RED "\033[0;31m"
#define YELLOW "\033[0;33m"
#define RESET "\033[0m"

namespace saferun_test {

    inline int g_failures = 0;

    inline void Expect(bool ok, const std::string& name, const std::string& detail = "")
    {
        std::cout << "Testing " << name << "...";
        if (ok) {
            std::cout << GREEN << " [PASS]" << RESET << std::endl;
        } else {
            ++g_failures;
            std::cout << RED << " [FAIL] " << detail << RESET << std::endl;
        }
    }

    inline void Skip(const std::string& name, const std::string& reason)
    {
        std::cout << "Testing " << name << "..." << YELLOW << " [SKIP] " << reason << RESET << std::endl;
    }

    // 退出码 = 失败用例数 (CTest 以非零判定失败)
    inline int Finish(const std::string& suite)
    {
        if (g_failures == 0) {
            std::cout << GREEN << "=== " << suite << ": all passed ===" << RESET << std::endl;
        } else {
            std::cout << RED << "=== " << suite << ": " << g_failures << " failed ===" << RESET << std::endl;
        }
        return g_failures;
    }

} // namespace saferun_test

#endif // SAFERUN_TEST_COMMON_H
