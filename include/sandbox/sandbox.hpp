#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "common/utils.hpp"

/**
 * 这个头文件包含沙箱的抽象
 * 沙箱拥有一个独立的根目录（选手程序看到的工作目录），
 * 所有选手程序、编译器都在沙箱内运行，并受到资源限制。
 */
namespace grader {

/**
 * @brief 表示一次在沙箱内执行命令的请求
 */
struct run_request {
    /**
     * @brief 要执行的命令，路径相对于沙箱根目录
     * @code{.cpp}
     * {"./main", "arg1"}
     * @endcode
     */
    std::vector<std::string> command;

    /**
     * @brief 传给沙箱内程序的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 资源限制，按顺序转换为沙箱的命令行参数
     * @code{.cpp}
     * {{"wall-time", "0.5"}, {"processes", "10"}}
     * @endcode
     */
    std::vector<std::pair<std::string, std::string>> limits;

    /**
     * @brief 是否将评测系统的全部环境变量传给沙箱内的程序
     * 编译器需要 PATH 等环境变量，选手程序不需要
     */
    bool full_env = false;

    /**
     * @brief 作为程序 stdin 的文件，为空则 stdin 为空
     */
    std::filesystem::path stdin_file;

    /**
     * @brief stdout、stderr 分别最多保存多少字节
     */
    std::size_t max_output = std::numeric_limits<std::size_t>::max();
};

/**
 * @brief 沙箱内命令的执行结果
 */
struct run_result : public process_result {
    /**
     * @brief 沙箱运行结束后产生的运行信息
     * key 已经去掉了连字符，比如 timewall、maxrss、cgmem、exitcode、status
     */
    std::map<std::string, std::string> metadata;

    /**
     * @brief 实际执行的命令行（已转义）
     */
    std::string command;
};

/**
 * @brief 沙箱内的临时文件，离开作用域时自动删除
 * 无论是正常离开作用域还是因为异常离开作用域都会删除文件
 */
struct temporary_file {
    explicit temporary_file(const std::filesystem::path &path);
    temporary_file(temporary_file &&other);
    ~temporary_file();

    const std::filesystem::path &path() const;

    /**
     * @brief 以读写方式打开的文件流
     */
    std::fstream &stream();

    /**
     * @brief 将已经写入的内容刷新到磁盘，以便其他进程读取
     */
    void flush();

private:
    std::filesystem::path file_path;
    std::fstream file;
};

/**
 * @brief 表示一个隔离的运行环境
 * 子类负责沙箱的生命周期和命令执行，文件访问和编译由本类基于 root() 和 execute() 实现。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 清理并初始化沙箱，可以重复调用
     * @throw sandbox_error 若沙箱工具初始化失败
     */
    virtual void init() = 0;

    /**
     * @brief 清理沙箱，删除沙箱根目录内的所有文件
     * @throw sandbox_error 若沙箱工具清理失败
     */
    virtual void cleanup() = 0;

    /**
     * @brief 沙箱的根目录在宿主机上的路径
     */
    virtual std::filesystem::path root() const = 0;

    /**
     * @brief 在沙箱内执行命令，阻塞直到命令结束
     * 命令返回非零值不是错误，调用者需要自行检查返回值
     * @throw sandbox_error 若沙箱工具无法启动
     */
    virtual run_result execute(const run_request &request) = 0;

    /**
     * @brief 在沙箱内执行辅助命令（编译器、解压程序等）
     * 这些命令可以使用全部环境变量，并允许最多 100 个进程
     * @param command 要执行的命令
     * @param env 额外的环境变量
     */
    run_result run(const std::vector<std::string> &command, const std::map<std::string, std::string> &env = {});

    /**
     * @brief 同 run，但命令返回非零值时抛出 sandbox_error
     */
    run_result run_checked(const std::vector<std::string> &command, const std::map<std::string, std::string> &env = {});

    /**
     * @brief 在沙箱内编译 C 程序，生成可执行文件 main
     * 默认编译选项为 -g -lm -Wall -pedantic
     * @param flags 额外的编译选项，比如 -fsanitize=address
     * @param sources 要编译的源文件，为空则编译沙箱根目录下的所有 .c 文件
     * @return 编译器的执行结果，command 为实际执行的编译命令
     */
    run_result compile(const std::vector<std::string> &flags = {}, std::vector<std::string> sources = {});

    /**
     * @brief 沙箱内文件在宿主机上的路径
     * @param path 相对于沙箱根目录的路径，不允许包含 ../
     */
    std::filesystem::path system_path(const std::string &path = "") const;

    bool exists(const std::string &path) const;

    /**
     * @brief 打开沙箱内的文件
     * @throw std::filesystem::filesystem_error 若文件不存在
     */
    std::ifstream open(const std::string &path) const;

    /**
     * @brief 读取沙箱内文件的全部内容
     * @throw std::filesystem::filesystem_error 若文件不存在
     */
    std::string read(const std::string &path) const;

    /**
     * @brief 在沙箱根目录下创建一个随机命名的临时文件
     * @param suffix 文件名后缀
     */
    temporary_file open_temporary(const std::string &suffix);

    /**
     * @brief 将宿主机上的文件复制到沙箱内
     * @param local 宿主机上的文件
     * @param box_path 沙箱内的路径，已存在时覆盖
     */
    void copy(const std::filesystem::path &local, const std::string &box_path);
};

}  // namespace grader
