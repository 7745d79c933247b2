#pragma once

#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace grader {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    /**
     * @brief 外部程序的返回值，如果外部程序因为信号崩溃而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 外部程序的 stdout 输出（最多 max_output 字节）
     */
    std::string out;

    /**
     * @brief 外部程序的 stderr 输出（最多 max_output 字节）
     */
    std::string err;
};

struct process_options {
    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 作为 stdin 的文件，为空时 stdin 为 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief stdout 和 stderr 分别最多保存多少字节
     * 超出部分会被读出并丢弃，以免外部程序因为管道写满而阻塞
     */
    std::size_t max_output = std::numeric_limits<std::size_t>::max();
};

/**
 * @brief 执行外部命令，并捕获 stdout 和 stderr
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param options 环境变量、stdin 和输出限制
 * @return 外部命令的返回值和输出
 * @throw std::system_error 若 fork、创建管道失败，或者外部命令无法执行（比如不存在）
 */
process_result exec_program(const std::vector<std::string> &argv, const process_options &options = {});

/**
 * @brief 调用外部程序并捕获输出
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path isolate("/usr/local/bin/isolate");
 *     auto result = capture_process(isolate, "--box-id=0", "--init");
 * @endcode
 */
template <typename... Args>
process_result capture_process(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return exec_program(list);
}

/**
 * @brief 按照 POSIX shell 的规则转义一个参数
 * 不需要转义的参数原样返回，否则用单引号包裹
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 将参数列表转义后用空格连接，结果可以直接粘贴到 shell 中执行
 */
std::string shell_join(const std::vector<std::string> &args);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

}  // namespace grader
