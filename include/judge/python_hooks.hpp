#pragma once

#include <filesystem>
#include "judge/evaluation.hpp"

/**
 * 题目可以用 Python 脚本扩展评测：
 * 1. <name>.test.py 中的 check(result, evaluation) 作为测试点 name 的自定义检查函数，
 *    result 是评测结果的 dict 副本，脚本新增的字段会保存到评测结果中，返回值决定测试点是否通过；
 * 2. script.py 中的 gen_tests(evaluation) 在加载题目时调用，可以通过
 *    evaluation.create_test(name) 生成测试点。
 * 
 * 脚本只能访问 grader 模块暴露的 Evaluation 和 Test 对象，不能访问沙箱。
 */
namespace grader {

/**
 * @brief 加载 Python 脚本中的 check 函数作为测试点的自定义检查函数
 * 脚本中没有 check 函数时不做任何事
 * @param t 测试点
 * @param script 脚本路径
 * @throw config_error 若脚本执行出错
 */
void bind_python_checker(test &t, const std::filesystem::path &script);

/**
 * @brief 执行 Python 脚本中的 gen_tests 函数生成测试点
 * 脚本中没有 gen_tests 函数时不做任何事
 * @param eval 当前评测
 * @param script 脚本路径
 * @throw config_error 若脚本执行出错
 */
void run_python_generator(evaluation &eval, const std::filesystem::path &script);

}  // namespace grader
