#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "judge/evaluation.hpp"
#include "judge/result.hpp"

namespace grader {

/**
 * @brief 评测流水线的一个阶段
 * 所有阶段按固定顺序在同一个沙箱内执行，后面的阶段可以看到前面阶段留下的文件。
 */
struct stage {
    virtual ~stage();

    /**
     * @brief 执行这个阶段
     * @param eval 当前评测，download 之后的阶段执行时沙箱内已经安装好选手提交
     * @return 阶段的评测结果，不需要报告结果时为空。
     *         结果的 fatal 为 true 时，后续阶段不再执行
     * @throw sandbox_error 若 isolate 无法执行
     */
    virtual std::optional<stage_result> run(evaluation &eval) = 0;
};

/**
 * @brief 将选手提交复制到沙箱中的 submit 并安装
 * 提交是 tar 包（包括 gzip 压缩的 tar 包）时解压到沙箱根目录，
 * 否则视为单个 C 源文件，重命名为 submit.c。
 * 复制或安装失败时返回 fatal 的结果。
 */
struct download_stage : public stage {
    /**
     * @brief 宿主机上的选手提交，为空时沙箱内应已存在 submit
     */
    std::filesystem::path submission;

    explicit download_stage(const std::filesystem::path &submission = {});

    std::optional<stage_result> run(evaluation &eval) override;
};

/**
 * @brief 编译沙箱内的所有 C 源文件，并运行所有测试点
 * 编译失败时只报告编译信息，不运行测试点。
 */
struct build_stage : public stage {
    /**
     * @brief 额外的编译选项，比如 -fsanitize=address
     */
    std::vector<std::string> flags;

    explicit build_stage(const std::vector<std::string> &flags = {});

    std::optional<stage_result> run(evaluation &eval) override;
};

/**
 * @brief 判断文件内容是否是 tar 包
 * 检查 ustar 魔数（偏移 257）或者 gzip 魔数（1f 8b）
 */
bool is_archive(const std::string &header);

}  // namespace grader
