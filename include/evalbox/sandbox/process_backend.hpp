#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace evalbox {

/**
 * @brief 启动一个受限子进程所需的全部参数
 */
struct launch_request {
    /**
     * @brief 子进程的命令行，command[0] 为可执行文件，会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录，为空时继承当前目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 额外的环境变量（比如 "PYTHONIOENCODING=utf-8"）
     * 子进程不会继承评测系统的环境变量，只保留 PATH 和这里的变量。
     */
    std::vector<std::string> env;

    /**
     * @brief 通过标准输入传给子进程的数据，写完后关闭标准输入
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒，到达后杀死整个进程组
     */
    double wall_limit_seconds = 0;

    /**
     * @brief 地址空间上限（RLIMIT_AS），单位为字节，小于 0 时不限制
     * 对于 JVM 这类预留大量虚拟内存的运行时需要关闭。
     */
    int64_t address_space_limit = -1;

    /**
     * @brief 峰值常驻内存上限，单位为字节，小于 0 时不限制
     * 超过后杀死整个进程组。
     */
    int64_t memory_limit = -1;

    /**
     * @brief 标准输出、标准错误各自最多保留的字节数，小于 0 时不限制
     * 超出的部分会被读取并丢弃，避免选手程序的输出撑爆评测系统的内存。
     */
    int64_t stream_size = -1;
};

/**
 * @brief 子进程运行的原始结果，尚未分类为 verdict
 */
struct raw_outcome {
    /**
     * @brief 子进程是否成功启动（exec 成功）
     */
    bool spawned = false;

    /**
     * @brief 无法启动子进程时的诊断信息
     */
    std::string spawn_error;

    /**
     * @brief 是否因为超过时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 是否因为峰值常驻内存超过 memory_limit 而被杀死
     */
    bool memory_exceeded = false;

    /**
     * @brief 子进程的返回值，因信号终止时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 终止子进程的信号，正常退出时为 -1
     */
    int term_signal = -1;

    double elapsed_seconds = 0;

    double peak_memory_mb = 0;

    std::string stdout_data;

    std::string stderr_data;

    /**
     * @brief 是否有输出因为超过 stream_size 而被截断
     */
    bool output_truncated = false;
};

/**
 * @brief 平台相关的进程隔离能力：启动进程、限制时间、测量内存
 * 进程执行器只依赖这个接口，因此分类逻辑与平台无关，并且可以在
 * 单元测试中用假的后端替换。实现必须可以被多个线程并发调用。
 */
struct process_backend {
    virtual ~process_backend() = default;

    /**
     * @brief 启动子进程，写入标准输入，等待其结束或超时
     * @param request 启动参数
     * @return 子进程的原始运行结果
     * @throw internal_error 若管道、fork、poll 等系统调用失败
     */
    virtual raw_outcome run(const launch_request &request) = 0;
};

}  // namespace evalbox
