#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "judge/evaluation.hpp"

namespace grader {

/**
 * @brief config.yml 中 tests[].files 的一项
 */
struct file_config {
    /**
     * @brief 选手程序生成的文件在沙箱内的路径
     */
    std::string path;

    /**
     * @brief 期望的文件内容，相对于题目目录
     */
    std::string expected;
};

/**
 * @brief config.yml 中 tests 的一项
 */
struct test_config {
    std::optional<std::string> name;
    std::optional<std::string> title;
    int exit_code = 0;
    std::vector<std::string> args;
    std::vector<file_config> files;
    std::vector<std::string> filters;
    std::map<std::string, std::string> env;
    std::optional<std::size_t> stdio_max_bytes;
};

/**
 * @brief 题目配置 config.yml
 * 
 * filters:
 *   - rstrip
 * limits:
 *   wall-time: 0.1
 * tests:
 *   - name: args
 *     args: [1, 2]
 *     exit_code: 3
 *     files:
 *       - path: out.txt
 *         expected: out.expected
 */
struct task_config {
    std::vector<std::string> filters;

    /**
     * @brief 按配置文件中的顺序保存的资源限制
     */
    std::vector<std::pair<std::string, double>> limits;

    std::vector<test_config> tests;
};

/**
 * @brief 解析 config.yml
 * @param file 配置文件路径，文件不存在时返回空配置
 * @throw config_error 若 YAML 格式错误、值类型错误或存在未知字段
 */
task_config read_task_config(const std::filesystem::path &file);

/**
 * @brief 将配置应用到评测上
 * 未知的资源限制会被忽略并记录日志
 * @throw config_error 若 filter 不存在或文件路径不合法
 */
void apply_task_config(evaluation &eval, const task_config &config);

/**
 * @brief 加载题目目录下的所有测试点
 * 1. 根据 <name>.out、<name>.err、<name>.test.py 发现测试点；
 * 2. 应用 config.yml；
 * 3. 执行 script.py 的 gen_tests。
 * @param eval 刚创建的评测，测试点会注册到这个评测中
 * @throw config_error 若题目配置错误，此时 eval 不应再被使用
 */
void load_task(evaluation &eval);

}  // namespace grader
