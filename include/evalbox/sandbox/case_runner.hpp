#pragma once

#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "evalbox/sandbox/executor.hpp"

namespace evalbox {

/**
 * @brief 并发地运行一个程序的所有测试点
 * 每次调用 run_cases 都会启动 min(测试点数, max_concurrency) 个 worker，
 * worker 从共享的队列中取出测试点的下标，运行后将结果写入预先分配好的数组中对应的位置。
 * 因此返回结果的顺序与测试点的顺序一致，与完成顺序无关。
 *
 * 一个测试点失败（哪怕评测系统出错）不会影响其他测试点。
 */
struct case_runner {
    /**
     * @brief 启动一个 worker 线程，失败时抛出异常（通常是 std::system_error）
     */
    using thread_factory = std::function<std::thread(std::function<void()>)>;

    /**
     * @param executor 进程执行器，必须比 case_runner 活得更久
     * @param spawn 启动 worker 线程的方式，为空时直接构造 std::thread
     * 线程启动失败时使用已经启动的 worker 继续评测；一个都没有启动时在调用线程上评测。
     */
    explicit case_runner(const process_executor &executor, thread_factory spawn = nullptr);

    /**
     * @brief 依次以 inputs 中的每一项作为标准输入运行程序
     * @return 与 inputs 等长的运行结果，result[i] 对应 inputs[i]
     * @throw invalid_input_error 若资源限制非法，此时不会启动任何进程
     */
    std::vector<execution_result> run_cases(const program &prog, const std::vector<std::string> &inputs, const resource_limits &limits) const;

    std::vector<execution_result> run_cases(const program &prog, const std::vector<test_case> &cases, const resource_limits &limits) const;

private:
    const process_executor &executor;
    thread_factory spawn;
};

}  // namespace evalbox
