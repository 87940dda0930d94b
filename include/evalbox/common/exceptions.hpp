#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace evalbox {

struct evalbox_exception : std::exception {
    evalbox_exception();
    explicit evalbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const evalbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是创建管道、fork、等待子进程等系统调用失败，
 * 进程执行器会将其转换为 EXECUTION_FAILURE 结果，不会抛给调用方。
 */
struct internal_error : public evalbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示调用方传入了非法参数
 * 比如比较的期望输出和实际输出长度不一致、资源限制非法、未知的语言。
 * 这是调用方的编程错误，会被立刻抛出而不是被吞掉。
 */
struct invalid_input_error : public evalbox_exception {
    invalid_input_error();
    explicit invalid_input_error(const std::string &message);
};

}  // namespace evalbox
