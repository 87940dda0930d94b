#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace evalbox {

/**
 * @brief 表示"没有输出"的哨兵值，经过 light_trim 后会变为空字符串
 * 比较时大小写不敏感。
 */
extern const std::set<std::string> SENTINEL_VALUES;

/**
 * @brief 严格归一化：去掉首尾空白，将所有连续空白替换为一个空格，并转为小写
 * "  Hello  World  \n" -> "hello world"
 */
std::string strict_collapse(const std::string &text);

/**
 * @brief 严格归一化多行文本，各行先以 '\n' 连接
 */
std::string strict_collapse(const std::vector<std::string> &lines);

/**
 * @brief 轻量归一化：去掉首尾空白并转为小写，保留内部空白
 * "  Hello  World  \n" -> "hello  world"
 * 结果为哨兵值，或者没有文本时返回空字符串。
 */
std::string light_trim(const std::optional<std::string> &text);

/**
 * @brief 判断文本在轻量归一化后是否为空（包括哨兵值）
 */
bool is_empty_or_error(const std::optional<std::string> &text);

/**
 * @brief 判断 haystack 在严格归一化后是否包含严格归一化后的 needle
 * 用于检测生成的样例是否与已有样例重复。needle 归一化后为空时返回 false。
 */
bool contains_normalized(const std::string &haystack, const std::string &needle);

}  // namespace evalbox
