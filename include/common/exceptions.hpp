#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是 fork 失败、文件系统出错等与选手程序无关的问题
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示题目配置错误
 * 包括 config.yml 格式错误、引用了不存在的 filter、题目脚本执行出错。
 * 加载题目时抛出，整个评测将被中止。
 */
struct config_error : public grader_exception {
    config_error();
    explicit config_error(const std::string &message);
};

/**
 * @brief 表示测试点的自定义检查函数执行出错
 * 评测时抛出，只影响当前测试点，异常信息会作为测试点的失败原因。
 */
struct check_error : public grader_exception {
    explicit check_error(const std::string &message);
};

/**
 * @brief 表示 isolate 本身执行失败
 * 比如 isolate --init 失败，或者无法启动 isolate。
 * 选手程序返回非零值不会产生这个异常。
 */
struct sandbox_error : public grader_exception {
    /**
     * @brief 执行失败的命令行
     */
    const std::string command;

    /**
     * @brief 执行失败的命令的输出，通常是 isolate 的 stderr
     */
    const std::string output;

    sandbox_error(const std::string &message, const std::string &command, const std::string &output);
};

}  // namespace grader
