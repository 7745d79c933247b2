#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 一个期望文件的比较结果
 */
struct file_result {
    std::string path;

    /**
     * @brief 选手程序生成的文件内容，文件不存在时为空
     */
    std::optional<std::string> content;

    std::string expected;

    bool success = false;

    /**
     * @brief 文件读取错误，比如 "file not found"
     */
    std::string error;
};

/**
 * @brief 一个测试点在一个评测阶段的评测结果
 */
struct test_result {
    std::string name;

    std::string title;

    /**
     * @brief 测试点是否通过，为所有比较项以及自定义检查函数结果的与
     */
    bool success = true;

    /**
     * @brief 测试点未通过的原因，每项一句
     */
    std::vector<std::string> fail_reason;

    /**
     * @brief 选手程序的 stdin 内容，没有 stdin 时为空
     */
    std::optional<std::string> input;

    /**
     * @brief 选手程序的 stdout，已截断到测试点的 stdio_max_bytes
     */
    std::string actual_stdout;

    /**
     * @brief 选手程序的 stderr，已截断到测试点的 stdio_max_bytes
     */
    std::string actual_stderr;

    std::optional<std::string> expected_stdout;

    std::optional<std::string> expected_stderr;

    /**
     * @brief 选手程序的返回值
     * 若 isolate 的 metadata 中有 exitcode，以 metadata 为准
     */
    int exit_code = -1;

    /**
     * @brief isolate 报告的运行信息，key 不含连字符
     * 比如 time、timewall、maxrss、cgmem、status、message、killed
     */
    std::map<std::string, std::string> usage;

    std::vector<file_result> files;

    /**
     * @brief 用于展示的命令行，比如 ./main a b < case1.in
     */
    std::string command;

    /**
     * @brief 自定义检查函数添加的字段
     */
    nlohmann::json extra = nlohmann::json::object();

    /**
     * @brief 标记测试点未通过，并记录原因
     */
    void fail(const std::string &reason);
};

/**
 * @brief 一个评测阶段的结果
 */
struct stage_result {
    /**
     * @brief 阶段是否成功，编译失败或者有测试点未通过时为假
     */
    bool success = true;

    /**
     * @brief 致命错误，后续评测阶段将不再执行
     */
    bool fatal = false;

    /**
     * @brief 致命错误的描述
     */
    std::string error;

    /**
     * @brief 编译结果，不需要编译的阶段为空
     */
    std::optional<run_result> compilation;

    /**
     * @brief 各测试点的评测结果，按测试点注册顺序排列
     * 编译失败时没有执行任何测试点，此项为空
     */
    std::optional<std::vector<test_result>> tests;
};

void to_json(nlohmann::json &j, const file_result &result);

void to_json(nlohmann::json &j, const test_result &result);

void to_json(nlohmann::json &j, const stage_result &result);

}  // namespace grader
