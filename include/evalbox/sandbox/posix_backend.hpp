#pragma once

#include "evalbox/sandbox/process_backend.hpp"

namespace evalbox {

/**
 * @brief 基于 fork/exec 的进程隔离实现
 * 1. 创建三个管道连接子进程的标准输入、标准输出、标准错误，另建一个
 *    close-on-exec 管道用于回传 exec 失败的 errno
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程
 *       1. 将管道重定向到 stdin/stdout/stderr，恢复 SIGPIPE 等信号的默认处理
 *       2. 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       3. 通过 rlimit 限制地址空间、CPU 时间（作为时钟时间限制的后备），禁止 core dump
 *       4. 清除环境变量，只保留 PATH 和请求中的变量，然后 exec
 *    2. 对于父进程
 *       1. 通过 poll 写入标准输入、读取标准输出和标准错误
 *       2. 每轮检查子进程是否退出，采样 /proc/<pid>/status 中的 VmHWM 作为峰值内存，
 *          超过时钟时间限制或内存限制后杀死整个进程组
 * 3. 通过 wait4 得到子进程的返回值
 * 4. 杀死进程组内残留的进程，确保选手 fork 出来的子进程不会留驻系统
 */
struct posix_backend : public process_backend {
    posix_backend();

    raw_outcome run(const launch_request &request) override;
};

}  // namespace evalbox
