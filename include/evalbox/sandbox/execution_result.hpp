#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "evalbox/common/status.hpp"

namespace evalbox {

/**
 * @brief 表示一次沙箱运行的结果
 * 只有 verdict 为 OK 时 output 才有值；其他结果 output 为空，
 * error 保存可读的诊断信息。
 */
struct execution_result {
    evalbox::verdict verdict = verdict::EXECUTION_FAILURE;

    /**
     * @brief 程序的标准输出，不做任何修剪
     */
    std::optional<std::string> output;

    /**
     * @brief 诊断信息，比如标准错误输出或者评测系统的错误信息
     */
    std::optional<std::string> error;

    /**
     * @brief 时钟时间，单位为秒
     */
    double elapsed_seconds = 0;

    /**
     * @brief 峰值内存，单位为 MB
     */
    double peak_memory_mb = 0;

    static execution_result ok(const std::string &output, double elapsed_seconds, double peak_memory_mb);

    static execution_result failed(evalbox::verdict verdict, const std::string &error, double elapsed_seconds, double peak_memory_mb);
};

void to_json(nlohmann::json &j, const execution_result &result);

void from_json(const nlohmann::json &j, execution_result &result);

}  // namespace evalbox
