#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {

/**
 * @brief 比较一组标准答案与生成输出后得到的分类
 */
enum class category {
    TRUE_POSITIVE,
    TRUE_NEGATIVE,
    FALSE_POSITIVE,
    FALSE_NEGATIVE
};

const char *get_display_message(category);

/**
 * @brief 混淆矩阵
 * 加法按元素进行，满足交换律和结合律，因此可以按任意顺序合并多个矩阵。
 * 所有比率指标在分母为 0 时返回 0.0，不会产生 NaN。
 */
struct confusion_matrix {
    uint64_t true_positives = 0;
    uint64_t true_negatives = 0;
    uint64_t false_positives = 0;
    uint64_t false_negatives = 0;

    confusion_matrix() = default;
    confusion_matrix(uint64_t tp, uint64_t tn, uint64_t fp, uint64_t fn);

    uint64_t total() const;

    /**
     * @brief (TP + TN) / total
     */
    double accuracy() const;

    /**
     * @brief TP / (TP + FP)
     */
    double precision() const;

    /**
     * @brief TP / (TP + FN)
     */
    double recall() const;

    /**
     * @brief TN / (TN + FP)
     */
    double specificity() const;

    /**
     * @brief precision 和 recall 的调和平均数
     */
    double f1_score() const;

    /**
     * @brief 将一个分类结果计入矩阵
     */
    void add(category c);

    confusion_matrix &operator+=(const confusion_matrix &other);

    bool operator==(const confusion_matrix &other) const;
    bool operator!=(const confusion_matrix &other) const;
};

confusion_matrix operator+(confusion_matrix a, const confusion_matrix &b);

/**
 * @brief 序列化为 JSON，包括四个计数、total_samples 以及所有比率指标
 */
void to_json(nlohmann::json &j, const confusion_matrix &cm);

/**
 * @brief 从 JSON 读取四个计数，缺少的计数视为 0，其他字段被忽略
 * @throw invalid_input_error 若计数不是非负整数
 */
void from_json(const nlohmann::json &j, confusion_matrix &cm);

/**
 * @brief 分类规则中可以配置的部分
 */
struct classification_policy {
    /**
     * @brief 标准答案为空（或哨兵值）而生成输出不为空时的分类
     * 默认为 FALSE_POSITIVE，可以配置为 TRUE_NEGATIVE 或 FALSE_NEGATIVE。
     */
    category expected_empty_generated_nonempty = category::FALSE_POSITIVE;

    /**
     * @brief 从 JSON 配置文件中读取分类规则
     * {"expected_empty_generated_nonempty": "false_positive"}
     * @throw invalid_input_error 若文件无法读取或者格式不正确
     */
    static classification_policy load(const std::filesystem::path &path);
};

void from_json(const nlohmann::json &j, classification_policy &policy);

/**
 * @brief 比较一组标准答案与生成输出
 * 两边都经过 light_trim 后比较：
 * | 标准答案 | 生成输出           | 分类     |
 * | 空       | 空                 | TN       |
 * | 空       | 非空               | 由 policy 决定，默认 FP |
 * | 非空     | 相等               | TP       |
 * | 非空     | 空                 | FN       |
 * | 非空     | 非空且不相等       | FP       |
 */
category classify(const std::optional<std::string> &expected, const std::optional<std::string> &generated,
                  const classification_policy &policy = classification_policy());

/**
 * @brief 逐一比较两个等长序列并统计混淆矩阵
 * @throw invalid_input_error 若两个序列长度不同，此时不会比较任何一项
 */
confusion_matrix calculate_confusion_matrix_stats(const std::vector<std::optional<std::string>> &expected,
                                                  const std::vector<std::optional<std::string>> &generated,
                                                  const classification_policy &policy = classification_policy());

confusion_matrix calculate_confusion_matrix_stats(const std::vector<std::string> &expected,
                                                  const std::vector<std::string> &generated,
                                                  const classification_policy &policy = classification_policy());

}  // namespace evalbox
