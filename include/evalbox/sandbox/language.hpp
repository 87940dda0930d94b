#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace evalbox {

/**
 * @brief 表示如何运行某种语言的源代码
 * 评测系统只运行解释型语言：源代码被写入运行目录下的 source_file，
 * 再执行 command 启动解释器。
 */
struct language_spec {
    /**
     * @brief 语言名，比如 python
     */
    std::string name;

    /**
     * @brief 源代码在运行目录中的文件名，比如 main.py
     * 不允许包含 ".." 或者是绝对路径
     */
    std::string source_file;

    /**
     * @brief 启动命令，其中的 {source} 会被替换为源代码文件的绝对路径
     */
    std::vector<std::string> command;

    /**
     * @brief 未捕获异常的特征字符串
     * 标准错误输出中出现任意一个时，即使返回值为 0 也判为运行时错误。
     * 比如 Python 的 "Traceback (most recent call last)"
     */
    std::vector<std::string> error_signatures;

    /**
     * @brief 是否通过 RLIMIT_AS 限制地址空间
     * 对于预留大量虚拟内存的运行时（比如 JVM）需要关闭，此时只依靠峰值内存采样。
     */
    bool limit_address_space = true;

    /**
     * @brief 传给子进程的额外环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 生成启动命令
     * @param source_path 源代码文件的路径
     */
    std::vector<std::string> build_command(const std::filesystem::path &source_path) const;
};

void from_json(const nlohmann::json &j, language_spec &spec);

/**
 * @brief 所有可用语言的全局管理器
 * 默认包含 python（别名 python3）、bash、sh，可以通过 JSON 配置文件增加或覆盖：
 * {"languages": {"ruby": {"source_file": "main.rb", "command": ["ruby", "{source}"]}}}
 */
struct language_registry {
    /**
     * @brief 构造一个只包含内置语言的注册表
     */
    language_registry();

    /**
     * @brief 注册一种语言，已存在同名语言时覆盖
     * @throw invalid_input_error 若语言名为空、命令为空或者源文件名不安全
     */
    void add(const language_spec &spec);

    /**
     * @brief 为已注册的语言增加别名
     */
    void alias(const std::string &alias_name, const std::string &name);

    /**
     * @brief 从 JSON 配置中加载语言
     * @throw invalid_input_error 若 JSON 格式不正确
     */
    void load(const nlohmann::json &config);

    /**
     * @brief 从 JSON 配置文件中加载语言
     * @throw invalid_input_error 若文件无法读取或 JSON 格式不正确
     */
    void load(const std::filesystem::path &path);

    /**
     * @brief 根据语言名查找语言，大小写不敏感
     * @throw invalid_input_error 若语言未注册
     */
    const language_spec &find(const std::string &name) const;

    bool contains(const std::string &name) const;

private:
    std::map<std::string, language_spec> languages;
    std::map<std::string, std::string> aliases;
};

}  // namespace evalbox
