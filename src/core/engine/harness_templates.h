#ifndef SAFERUN_HARNESS_TEMPLATES_H
#define SAFERUN_HARNESS_TEMPLATES_H

namespace saferun {

    // runner 模板, 占位符: {{ENTRY_POINT}} {{TEST_COUNT}} {{SOFT_LIMIT}}
    extern const char* const kPythonHarnessTemplate;
    extern const char* const kJavaScriptHarnessTemplate;

} // namespace saferun

#endif // SAFERUN_HARNESS_TEMPLATES_H
