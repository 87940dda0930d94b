#pragma once

#include <string>
#include "evalbox/sandbox/execution_result.hpp"
#include "evalbox/sandbox/language.hpp"
#include "evalbox/sandbox/process_backend.hpp"
#include "evalbox/sandbox/program.hpp"
#include "evalbox/sandbox/resource_limits.hpp"

namespace evalbox {

/**
 * @brief 单个测试点中，标准输出、标准错误各自最多保留的字节数
 */
extern const int64_t STREAM_SIZE;

/**
 * @brief TIME_LIMIT_ERROR 的诊断信息
 */
extern const char *TIME_LIMIT_MESSAGE;

/**
 * @brief 在给定的资源限制下运行一个程序，并将运行结果分类为 verdict
 * 分类按照以下顺序，先匹配者优先：
 * 1. 超过时钟时间限制：TIME_LIMIT_ERROR
 * 2. 峰值内存超过限制，或因内存不足而失败：MEMORY_LIMIT_ERROR
 * 3. 返回值非零，或标准错误中出现未捕获异常的特征：RUNTIME_ERROR
 * 4. 无法启动程序：EXECUTION_FAILURE
 * 5. 其他情况：OK
 *
 * 执行器不会重试，也不会抛出异常（除了资源限制非法），
 * 评测系统自身的错误也会作为 EXECUTION_FAILURE 返回。
 */
struct process_executor {
    /**
     * @param backend 负责启动进程的后端，必须比执行器活得更久
     * @param registry 语言注册表，必须比执行器活得更久
     */
    process_executor(process_backend &backend, const language_registry &registry);

    /**
     * @brief 使用 input 作为标准输入运行程序
     * @param prog 待运行的程序
     * @param input 传给标准输入的数据
     * @param limits 资源限制
     * @return 运行结果
     * @throw invalid_input_error 若资源限制非法
     */
    execution_result execute(const program &prog, const std::string &input, const resource_limits &limits) const;

private:
    process_backend &backend;
    const language_registry &registry;

    execution_result run(const program &prog, const std::string &input, const resource_limits &limits) const;
};

/**
 * @brief 根据后端的原始运行结果确定 verdict
 * @param outcome 后端返回的原始结果
 * @param lang 程序的语言，用于匹配标准错误中的特征字符串
 * @param limits 资源限制
 */
execution_result classify_outcome(const raw_outcome &outcome, const language_spec &lang, const resource_limits &limits);

}  // namespace evalbox
