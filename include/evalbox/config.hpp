#pragma once

#include <cstddef>
#include <filesystem>

namespace evalbox {

/**
 * @brief 调用方未指定时使用的时钟时间限制，单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 调用方未指定时使用的内存限制，单位为 MB
 */
extern int DEFAULT_MEMORY_LIMIT;

/**
 * @brief 调用方未指定时同时运行的测试点数量
 */
extern int DEFAULT_CONCURRENCY;

/**
 * @brief 选手程序运行的根目录
 * 每次运行都会在这里创建一个独立的子目录存放源代码，运行结束后删除。
 * 若将这个文件夹放进内存盘，可以加速源代码的写入。
 *
 * RUN_DIR
 * ├── run-ABCDEF // 随机生成的目录名
 * │   └── main.py // 选手程序的源代码，文件名由语言配置决定
 * └── ...
 *
 * @defaultValue /tmp/evalbox
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，不会删除产生的运行目录，
 * 以便手动检查选手程序的源代码是否符合预期。
 */
extern bool DEBUG;

}  // namespace evalbox
