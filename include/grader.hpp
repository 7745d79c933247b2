#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 评测一份提交
 * 在编号为 BOX_ID 的 isolate 沙箱中依次执行 download、normal run、run with sanitizer 三个阶段。
 * 
 * 返回值为各阶段结果组成的数组，每一项形如
 * {"name": "normal run", "success": true, "compile": {...}, "tests": [...]}
 * 不需要报告结果的阶段（比如成功的 download）不出现在数组中。
 * 
 * @param task_path 题目目录
 * @param submission_path 选手提交的文件，C 源文件或者 tar 包
 * @param result_path 存放评测报告的文件夹，不为空时会被创建
 * @param meta 附加信息，提供给题目脚本使用
 * @throw config_error 若题目配置错误
 * @throw sandbox_error 若 isolate 无法执行
 */
nlohmann::json evaluate(const std::filesystem::path &task_path,
                        const std::filesystem::path &submission_path,
                        const std::filesystem::path &result_path,
                        const std::map<std::string, std::string> &meta = {});

}  // namespace grader
