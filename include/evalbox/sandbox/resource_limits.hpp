#pragma once

namespace evalbox {

/**
 * @brief 一次批量评测的资源限制
 * 由调用方在每次调用 run_cases 时提供，评测过程中不会被修改。
 */
struct resource_limits {
    /**
     * @brief 每个测试点的时钟时间限制，单位为秒，必须大于 0
     */
    double wall_clock_seconds;

    /**
     * @brief 每个测试点的峰值内存限制，单位为 MB，必须大于 0
     */
    int memory_megabytes;

    /**
     * @brief 同时运行的测试点数量上限，至少为 1
     */
    int max_concurrency;

    /**
     * @brief 使用 config.hpp 中的默认值构造资源限制
     */
    static resource_limits defaults();
};

/**
 * @brief 检查资源限制是否合法
 * @throw invalid_input_error 若时间限制、内存限制或并发数不为正数
 */
void validate(const resource_limits &limits);

}  // namespace evalbox
