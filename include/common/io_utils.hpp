#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖已有内容
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，如果拿到的文件名包含 "../"，
 * 那么最后有可能导致评测目录以外的文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 作用域内独占的临时文件夹
 * 构造时创建文件夹，析构时删除整个文件夹。
 * 无论是正常返回还是抛出异常，文件夹都会被删除，删除失败只记录日志，不抛出异常。
 */
struct scoped_directory {
    /**
     * @brief 创建文件夹 path
     * @throw std::filesystem::filesystem_error 若 path 已经存在或者无法创建
     */
    explicit scoped_directory(const std::filesystem::path &path);
    scoped_directory(scoped_directory &&);
    scoped_directory(const scoped_directory &) = delete;
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除文件夹
     */
    void release();

private:
    std::filesystem::path dir;
    bool valid;
};

}  // namespace codejudge
