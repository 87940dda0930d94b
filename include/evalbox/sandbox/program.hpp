#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {

/**
 * @brief 表示一个待评测的程序
 * 程序每次评测时由调用方提供，评测系统不会保存。
 */
struct program {
    /**
     * @brief 程序的源代码
     */
    std::string source;

    /**
     * @brief 源代码的语言，必须在 language_registry 中注册过
     * 比如 python、bash、sh
     */
    std::string language;
};

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 通过标准输入传给程序的数据
     */
    std::string input;

    /**
     * @brief 标准答案，可以没有
     */
    std::optional<std::string> expected_output;
};

/**
 * @brief 从 JSON 读取测试点
 * 可以是字符串（只有输入），或者是 {"input": "...", "expected_output": "..." | null}
 * @throw invalid_input_error 若格式不正确
 */
void from_json(const nlohmann::json &j, test_case &c);

/**
 * @brief 取出所有测试点的输入，顺序不变
 */
std::vector<std::string> inputs_of(const std::vector<test_case> &cases);

}  // namespace evalbox
