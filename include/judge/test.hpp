#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "judge/filter.hpp"
#include "judge/fixture.hpp"

namespace grader {

struct evaluation;
struct test_result;

/**
 * @brief 测试点的自定义检查函数
 * 在所有内置比较完成后调用，返回值会和内置比较的结果取与。
 * 检查函数只能读取测试点结果，附加字段写入 extra。
 * 抛出 check_error 时该测试点失败，失败原因为异常信息。
 */
typedef std::function<bool(const test_result &result, nlohmann::json &extra, evaluation &eval)> checker;

/**
 * @brief 期望选手程序生成的文件
 */
struct expected_file {
    /**
     * @brief 文件在沙箱内的路径（相对沙箱根目录）
     */
    std::string path;

    /**
     * @brief 期望的文件内容
     */
    fixture_uptr expected;
};

/**
 * @brief 表示一个测试点
 * 测试点在加载题目时创建，创建后只有 title 可以修改。
 * 没有指定的比较项（stdout、stderr、文件）不会被比较。
 */
struct test {
    /**
     * @brief 测试点名称，在一道题内唯一
     */
    const std::string name;

    /**
     * @brief 传给选手程序的命令行参数（不含 ./main）
     */
    std::vector<std::string> args;

    /**
     * @brief 期望的返回值
     */
    int exit_code = 0;

    /**
     * @brief 作为选手程序 stdin 的数据，为空则 stdin 为空
     */
    fixture_uptr input;

    /**
     * @brief 期望的 stdout，为空则不比较 stdout
     */
    fixture_uptr expected_stdout;

    /**
     * @brief 期望的 stderr，为空则不比较 stderr
     */
    fixture_uptr expected_stderr;

    /**
     * @brief 期望选手程序生成的文件，按顺序比较
     */
    std::vector<expected_file> files;

    /**
     * @brief 本测试点额外使用的 filter，追加在题目的 filter 之后
     */
    std::vector<filter_ptr> filters;

    /**
     * @brief 传给选手程序的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 自定义检查函数，可以为空
     */
    checker check;

    /**
     * @brief stdout 和 stderr 分别最多保存多少字节
     * @note 默认为 100KB
     */
    std::size_t stdio_max_bytes;

    explicit test(const std::string &name);

    /**
     * @brief 测试点标题，没有设置时为测试点名称
     */
    std::string title() const;

    void set_title(const std::string &title);

private:
    std::string custom_title;
};

}  // namespace grader
