#include "judge/result.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void test_result::fail(const string &reason) {
    success = false;
    fail_reason.push_back(reason);
}

void to_json(json &j, const file_result &result) {
    j = {{"path", result.path},
         {"expected", result.expected},
         {"success", result.success}};
    if (result.content) j["content"] = *result.content;
    if (!result.error.empty()) j["error"] = result.error;
}

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name},
         {"title", result.title},
         {"success", result.success},
         {"fail_reason", result.fail_reason},
         {"stdout", result.actual_stdout},
         {"stderr", result.actual_stderr},
         {"exit_code", result.exit_code},
         {"files", result.files},
         {"command", result.command}};
    if (result.input) j["stdin"] = *result.input;
    if (result.expected_stdout) j["stdout_expected"] = *result.expected_stdout;
    if (result.expected_stderr) j["stderr_expected"] = *result.expected_stderr;

    // 运行信息和自定义字段放在顶层，但不能覆盖上面的字段
    for (auto &[key, value] : result.usage)
        if (!j.count(key)) j[key] = value;
    for (auto &[key, value] : result.extra.items())
        if (!j.count(key)) j[key] = value;
}

void to_json(json &j, const stage_result &result) {
    j = {{"success", result.success}};
    if (result.fatal) {
        j["fatal"] = true;
        j["error"] = result.error;
    }
    if (result.compilation) {
        j["compile"] = {{"command", result.compilation->command},
                        {"exit_code", result.compilation->exit_code},
                        {"stdout", result.compilation->out},
                        {"stderr", result.compilation->err}};
    }
    if (result.tests)
        j["tests"] = *result.tests;
}

}  // namespace grader
