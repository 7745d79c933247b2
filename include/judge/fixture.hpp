#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace grader {

/**
 * @class fixture
 * @brief 测试数据的来源，比如题目目录下的 case1.in，或者题目脚本生成的文本
 */
struct fixture {
    /**
     * @brief 测试数据的显示名称
     * 对于文件，是文件名（不含目录）；对于文本，由创建者指定，比如 case1.in
     * 评测结果中的命令行会用这个名称表示 stdin 重定向
     */
    std::string name;

    explicit fixture(const std::string &name);
    virtual ~fixture();

    /**
     * @brief 读取测试数据的全部内容
     * @throw std::filesystem::filesystem_error 若文件不存在
     */
    virtual std::string read() const = 0;

    /**
     * @brief 测试数据在宿主机上的文件路径，内存中的数据返回空路径
     */
    virtual std::filesystem::path path() const;
};

/**
 * @brief 表示宿主机上的一个测试数据文件
 */
struct file_fixture : public fixture {
    std::filesystem::path file;

    explicit file_fixture(const std::filesystem::path &file);

    std::string read() const override;

    std::filesystem::path path() const override;
};

/**
 * @brief 表示已经知道内容的测试数据（不需要读文件）
 */
struct text_fixture : public fixture {
    std::string text;

    text_fixture(const std::string &name, const std::string &text);

    std::string read() const override;
};

typedef std::unique_ptr<fixture> fixture_uptr;

}  // namespace grader
