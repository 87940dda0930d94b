#pragma once

#include <filesystem>
#include <string>

namespace evalbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 语言配置中的源文件名会被拼接到运行目录下，如果文件名包含 "../"
 * 或者是绝对路径，源代码可能被写到运行目录之外。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 临时目录，析构时递归删除
 * 每次运行选手程序都会在 RUN_DIR 下创建一个独立的目录存放源代码。
 */
struct temporary_directory {
    /**
     * @brief 在 parent 下创建名称以 prefix 开头的唯一目录
     * @throw std::system_error 若目录无法创建
     */
    temporary_directory(const std::filesystem::path &parent, const std::string &prefix);
    temporary_directory(temporary_directory &&);
    temporary_directory(const temporary_directory &) = delete;
    ~temporary_directory();

    temporary_directory &operator=(temporary_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 保留目录，析构时不再删除
     * DEBUG 模式下用于手动检查运行目录的内容
     */
    void keep();

private:
    std::filesystem::path dir;
    bool valid = false;
};

}  // namespace evalbox
