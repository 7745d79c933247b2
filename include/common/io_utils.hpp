#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::filesystem::filesystem_error 若文件不存在或无法读取
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 沙箱内的路径来自题目配置和选手程序，而评测系统需要 root 权限运行，
 * 如果拿到的文件名包含 "../"，有可能读到或覆盖沙箱外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    std::filesystem::path file() const;

    void release();
private:
    int fd;
    bool valid;
    std::filesystem::path lock_file;
};

/**
 * @brief 对文件加锁，文件不存在时会自动创建
 * 锁在进程间有效，持有锁的进程退出后锁自动释放
 * @param path 锁文件
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_file(const std::filesystem::path &path, bool shared);

}  // namespace grader
