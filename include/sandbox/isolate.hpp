#pragma once

#include "common/io_utils.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 基于 isolate 的沙箱
 * isolate 使用 namespace 和 cgroup 隔离程序，每个沙箱有一个编号，
 * 对应 isolate 的一个 box。运行结束后 isolate 将 metadata 写入
 * STATE_DIR/grader-meta-<box id>。
 * 
 * 从 init() 开始直到析构，本对象独占 STATE_DIR/grader-box-<box id>.lock，
 * 因此同一个沙箱编号同时只能有一个评测在进行，不同编号的评测互不影响。
 */
struct isolate_sandbox : public sandbox {
    /**
     * @param box_id isolate 的沙箱编号
     */
    explicit isolate_sandbox(int box_id);

    /**
     * @brief 清理沙箱（DEBUG 模式下保留沙箱以便检查）
     */
    ~isolate_sandbox() override;

    void init() override;

    void cleanup() override;

    std::filesystem::path root() const override;

    run_result execute(const run_request &request) override;

    /**
     * @brief 生成执行 request 所用的 isolate 命令行
     */
    std::vector<std::string> build_command(const run_request &request) const;

    /**
     * @brief 本沙箱的 metadata 文件路径
     */
    std::filesystem::path metadata_file() const;

private:
    int box_id;
    bool initialized = false;
    std::filesystem::path box_dir;
    scoped_file_lock lock;

    std::string box_flag() const;

    /**
     * @brief 执行 isolate --init 或 isolate --cleanup
     * @throw sandbox_error 若 isolate 无法启动或返回值不为 0
     */
    process_result control(const std::string &action);
};

}  // namespace grader
