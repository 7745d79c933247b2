#pragma once

#include <filesystem>

namespace grader {

/**
 * @brief isolate 可执行文件的路径
 * 可以通过命令行参数 --isolate 或者环境变量 ISOLATE 指定
 * @defaultValue isolate（从 PATH 中查找）
 */
extern std::filesystem::path ISOLATE_PATH;

/**
 * @brief 编译选手程序使用的编译器，在沙箱内执行
 * 可以通过命令行参数 --compiler 或者环境变量 COMPILER 指定
 * @defaultValue /usr/bin/gcc
 */
extern std::filesystem::path COMPILER_PATH;

/**
 * @brief 本评测进程使用的 isolate 沙箱编号
 * isolate 的 metadata 文件和沙箱锁文件都根据这个编号区分，
 * 因此同一台机器上同时运行的多个评测进程必须使用不同的编号。
 * 
 * /tmp
 * ├── grader-box-0.lock // 沙箱 0 的锁文件，评测期间独占
 * └── grader-meta-0 // 沙箱 0 最近一次运行的 metadata 文件
 */
extern int BOX_ID;

/**
 * @brief 存放沙箱锁文件和 metadata 文件的文件夹
 * @defaultValue /tmp
 */
extern std::filesystem::path STATE_DIR;

/**
 * @brief 选手程序标准输出、标准错误保存的默认最大字节数
 */
extern std::size_t DEFAULT_STDIO_MAX_BYTES;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测结束后不会清理沙箱，
 * 以便手动检查沙箱内产生的文件是否符合预期。
 */
extern bool DEBUG;

}  // namespace grader
