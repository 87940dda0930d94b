#pragma once

#include <string>

namespace evalbox {

/**
 * @brief 表示一次沙箱运行（一个测试点）的评测结果
 * 每个 execution_result 恰好有一个 verdict，产生后不再改变。
 */
enum class verdict {
    /**
     * @brief 程序正常结束，且没有超出任何资源限制
     * 只有这个结果会携带程序的标准输出。
     */
    OK = 0,

    /**
     * @brief 程序出现运行时错误
     * 程序以非零返回值退出、因信号崩溃，或者标准错误输出中出现了未捕获异常的特征。
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 程序运行时间超出限制
     * 比较的是时钟时间。该结果的优先级最高，超时后崩溃的程序仍然是 TLE。
     */
    TIME_LIMIT_ERROR = 2,

    /**
     * @brief 程序运行内存超限
     * 峰值内存超过限制，或者程序因为地址空间上限导致分配失败而崩溃
     * （比如 Python 的 MemoryError、Java 的 OutOfMemoryError）。
     */
    MEMORY_LIMIT_ERROR = 3,

    /**
     * @brief 评测系统无法启动或管理子进程
     * 比如 fork 失败、管道创建失败、无法写入源代码文件。
     * 这个为评测系统的错误，但仍然作为普通结果返回。
     */
    EXECUTION_FAILURE = 4
};

const char *get_display_message(verdict);

/**
 * @brief 将显示字符串解析回 verdict
 * @throw invalid_input_error 如果字符串不是任何一个 verdict 的显示字符串
 */
verdict parse_verdict(const std::string &message);

}  // namespace evalbox
