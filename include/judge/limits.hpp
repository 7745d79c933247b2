#pragma once

#include <string>
#include <utility>
#include <vector>

namespace grader {

/**
 * @brief 选手程序运行时的资源限制
 * 每一项都对应 isolate 的一个同名命令行参数，比如 wall_time 对应 --wall-time。
 * 题目可以通过 config.yml 的 limits 覆盖其中的某几项，对整个题目生效。
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制
     * @note 单位为秒
     */
    double wall_time = 0.5;

    /**
     * @brief CPU 时间限制
     * @note 单位为秒，0 表示不限制
     */
    double time = 0;

    /**
     * @brief 进程数限制
     */
    long processes = 10;

    /**
     * @brief 栈空间限制
     * @note 单位为 KB，0 表示使用 isolate 的默认值
     */
    long stack = 0;

    /**
     * @brief cgroup 内存限制，包括所有子进程
     * @note 单位为 KB
     */
    long cg_mem = 5 * 1024 * 1024;

    /**
     * @brief 文件输出限制，限制应用程序最多能写入多大的文件
     * @note 单位为 KB
     */
    long fsize = 1024 * 1024;

    /**
     * @brief 根据 isolate 参数名修改一项资源限制
     * @param name 资源限制名，比如 wall-time、cg-mem
     * @param value 新的限制值，必须是非负的有限数
     * @return false 若不存在这项资源限制或者值不合法，此时不修改任何限制
     */
    bool set(const std::string &name, double value);

    /**
     * @brief 按固定顺序列出所有资源限制，用于生成 isolate 的命令行参数
     * @return (isolate 参数名, 值) 列表
     */
    std::vector<std::pair<std::string, std::string>> to_flags() const;
};

}  // namespace grader
