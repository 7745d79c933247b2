#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "judge/filter.hpp"
#include "judge/limits.hpp"
#include "judge/result.hpp"
#include "judge/test.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 表示一次评测（一份提交对一道题）
 * 持有题目的所有测试点、题目级的 filter 和资源限制，以及评测使用的沙箱。
 * 每份提交创建一个 evaluation，评测结束后销毁。
 */
struct evaluation {
    /**
     * @brief 题目目录
     * 
     * task_path
     * ├── config.yml // 题目配置，可选
     * ├── script.py // 生成测试点的脚本，可选
     * ├── case1.in // 测试点 case1 的 stdin
     * ├── case1.out // 测试点 case1 期望的 stdout
     * ├── case1.err // 测试点 case1 期望的 stderr
     * └── case1.test.py // 测试点 case1 的自定义检查脚本
     */
    const std::filesystem::path task_path;

    /**
     * @brief 评测使用的沙箱，已经初始化
     */
    sandbox &box;

    /**
     * @brief 题目级的 filter，对所有测试点的所有比较项生效
     */
    std::vector<filter_ptr> filters;

    /**
     * @brief 题目级的资源限制，对所有测试点生效
     */
    resource_limits limits;

    /**
     * @brief 调用方传入的附加信息（比如提交者），提供给题目脚本使用
     */
    std::map<std::string, std::string> meta;

    evaluation(const std::filesystem::path &task_path, sandbox &box, const std::map<std::string, std::string> &meta = {});

    evaluation(const evaluation &) = delete;
    evaluation &operator=(const evaluation &) = delete;

    /**
     * @brief 查找或创建测试点
     * 若测试点已经存在，直接返回已有的测试点，不做任何修改。
     * 否则创建测试点，若题目目录下存在 <name>.in、<name>.out、<name>.err，
     * 则分别作为 stdin、期望的 stdout、期望的 stderr，并触发 on_test_created 回调。
     * @param name 测试点名称
     * @return 测试点，生命周期与 evaluation 相同
     */
    test &create_test(const std::string &name);

    /**
     * @brief 根据名称查找测试点
     * @return 测试点，不存在时为 nullptr
     */
    test *find_test(const std::string &name);

    /**
     * @brief 按注册顺序返回所有测试点
     */
    std::vector<test *> tests() const;

    /**
     * @brief 题目目录下的文件路径
     * @param path 相对于题目目录的路径，不允许包含 ../
     */
    std::filesystem::path task_file(const std::string &path) const;

    /**
     * @brief 注册测试点创建时的回调函数
     * 加载器通过这个回调为测试点绑定 <name>.test.py 等需要按名称查找的资源
     */
    void on_test_created(std::function<void(test &)> callback);

    /**
     * @brief 在沙箱内运行 ./main 评测一个测试点
     * 沙箱内必须已经编译好 main。
     * 比较失败不会抛出异常，而是记录在 test_result 中。
     * @param t 要评测的测试点
     * @param env 额外的环境变量，覆盖测试点的同名环境变量
     * @param title 评测结果中的标题，为空时使用测试点标题
     * @return 评测结果
     * @throw sandbox_error 若 isolate 无法启动
     */
    test_result evaluate(const test &t, const std::map<std::string, std::string> &env = {}, const std::string &title = "");

private:
    std::vector<std::unique_ptr<test>> test_list;
    std::map<std::string, test *> test_index;
    std::vector<std::function<void(test &)>> test_created;
};

}  // namespace grader
