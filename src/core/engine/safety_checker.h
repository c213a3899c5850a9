#ifndef SAFERUN_SAFETY_CHECKER_H
#define SAFERUN_SAFETY_CHECKER_H

#include <string>

#include "execution_types.h"

namespace saferun {

    struct SafetyVerdict
    {
        bool safe = true;
        std::string reason; // safe == false 时给出第一处命中
    };

    /**
     * @brief 非隔离路径的静态预检
     * 只是降级模式下的最后一道门槛, 不能替代隔离: 基于逐行正则,
     * 注释行会跳过, 字符串字面量中的内容可能误报。
     */
    class SafetyChecker
    {
    public:
        static SafetyVerdict Check(Language language, const std::string& source);

    private:
        static SafetyVerdict CheckPython(const std::string& source);
        static SafetyVerdict CheckJavaScript(const std::string& source);
    };

} // namespace saferun

#endif // SAFERUN_SAFETY_CHECKER_H
