#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 表示一种编程语言的编译运行方式
 * 编译命令和运行命令是模板，其中 {source} 会被替换为源代码文件名，
 * {executable} 会被替换为可执行文件名，比如：
 * @code
 *     g++ -O2 {source} -o {executable}
 *     ./{executable}
 * @endcode
 * 替换进去的文件名都会经过 shell 转义。
 */
struct language_profile {
    /**
     * @brief 语言 id，比如 cpp
     */
    std::string language;

    /**
     * @brief 选手代码保存的文件名，比如 solution.cpp
     */
    std::string source_file;

    /**
     * @brief 编译生成的可执行文件名
     * 对于解释型语言，和 source_file 相同
     */
    std::string executable_file;

    /**
     * @brief 运行该语言程序的沙箱镜像
     */
    std::string image;

    /**
     * @brief 编译命令模板，不需要编译的语言为空
     */
    std::optional<std::string> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::string run_command;

    bool requires_compilation() const;
};

/**
 * @brief 检查语言配置中的所有标识符是否安全
 * 语言 id 只能包含 [a-z0-9_+-]，文件名只能包含 [A-Za-z0-9_.-] 且不能以 - 或 . 开头，
 * 镜像名只能包含 [A-Za-z0-9_./:@-]，命令模板不能为空（编译命令可以不存在）
 * @throw std::invalid_argument 若存在不安全的标识符
 */
void validate_profile(const language_profile &profile);

void from_json(const nlohmann::json &j, language_profile &profile);

void to_json(nlohmann::json &j, const language_profile &profile);

/**
 * @brief 编程语言 id 到语言配置的映射表
 * 这个类是只读查找表，注册完成后可以被多个线程同时访问
 */
struct language_registry {
    /**
     * @brief 创建包含内置语言 cpp、java、python、ruby 的注册表
     */
    language_registry();

    /**
     * @brief 根据语言 id 查找语言配置
     * @throw unsupported_language 若语言没有注册
     */
    const language_profile &resolve(const std::string &language) const;

    /**
     * @brief 注册或覆盖一种语言
     * @throw std::invalid_argument 若语言配置中存在不安全的标识符
     */
    void register_profile(const language_profile &profile);

    /**
     * @brief 从 JSON 配置文件中加载语言配置，覆盖同名的内置语言
     * 配置文件是一个数组，每一项的格式参见 from_json(json, language_profile)
     */
    void load(const std::filesystem::path &config_path);

    void load(const nlohmann::json &config);

    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace codejudge
