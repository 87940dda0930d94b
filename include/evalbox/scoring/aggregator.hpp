#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "evalbox/scoring/confusion_matrix.hpp"

namespace evalbox {

/**
 * @brief 合并多个程序的混淆矩阵
 * 没有混淆矩阵的项视为全 0，空序列得到全 0 的矩阵（所有指标为 0.0）。
 */
confusion_matrix aggregate(const std::vector<std::optional<confusion_matrix>> &matrices);

/**
 * @brief 合并评测记录中的混淆矩阵
 * @param responses JSON 数组，每一项可以包含一个 confusion_matrix 字段：
 * [{"confusion_matrix": {"true_positives": 5, ...}}, {}]
 * @throw invalid_input_error 若 responses 不是数组，或者某个混淆矩阵格式不正确
 */
confusion_matrix aggregate(const nlohmann::json &responses);

}  // namespace evalbox
