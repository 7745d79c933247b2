#pragma once

#include <string>

namespace grader {

/**
 * @brief isolate 在 metadata 的 status 字段中报告的运行状态
 * 程序正常退出（返回值为 0）时 isolate 不写 status 字段
 */
enum class run_status {
    /**
     * @brief 程序正常结束，返回值为 0
     */
    OK = 0,

    /**
     * @brief 程序以非零返回值结束（RE）
     * 返回值由 exitcode 字段给出，由返回值比较负责判定
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 程序被信号杀死（SG），信号由 exitsig 字段给出
     */
    SIGNALED = 2,

    /**
     * @brief 程序超出时间限制被 isolate 杀死（TO）
     * 可能是时钟时间或者 CPU 时间超限，具体见 message 字段
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief isolate 内部错误（XX）
     */
    INTERNAL_ERROR = 4
};

/**
 * @brief 将 metadata 中 status 字段的两字母代码转换为 run_status
 * 空串表示 OK，不认识的代码视为 INTERNAL_ERROR
 */
run_status parse_run_status(const std::string &code);

const char *get_display_message(run_status);

}  // namespace grader
