#pragma once

#include <map>
#include <string>
#include <vector>
#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief 工作目录中存放选手代码和编译产物的子目录，是选手程序运行时唯一可写的目录
 */
constexpr const char *PROGRAM_DIRECTORY = "program";

/**
 * @brief 生成 POSIX shell 脚本的辅助类
 * 所有插入到脚本中的变量值都经过单引号转义，变量名只允许 [A-Za-z_][A-Za-z0-9_]*。
 * 选手代码和测试数据不会出现在脚本文本中，它们以文件的形式传入沙箱。
 */
struct shell_script {
    /**
     * @brief 将 value 转义为单引号包围的 shell 字面量
     * 例如 it's 将被转义为 'it'\''s'
     */
    static std::string quote(const std::string &value);

    /**
     * @brief 添加一行可信的脚本文本
     */
    shell_script &line(const std::string &text = "");

    /**
     * @brief 添加一行变量赋值 name='value'
     * @throw std::invalid_argument 若变量名不合法
     */
    shell_script &assign(const std::string &name, const std::string &value);

    /**
     * @brief 添加一行整数变量赋值 name=value
     */
    shell_script &assign(const std::string &name, long long value);

    std::string str() const;

private:
    std::vector<std::string> lines;
};

/**
 * @brief 将命令模板中的 {source} 和 {executable} 替换为转义后的文件名
 * @throw std::invalid_argument 若模板中存在其他占位符或者括号不匹配
 */
std::string render_command(const std::string &command_template, const language_profile &profile);

/**
 * @brief 生成沙箱内的驱动脚本
 * 驱动脚本在自己所在的文件夹中运行，要求文件夹中存在选手代码 program/<profile.source_file>
 * 以及测试输入 tests/1.in, tests/2.in, ...，标准输出不会进入沙箱。
 * 驱动脚本将：
 * 1. 如果需要编译，在 program 目录中编译一次，失败时输出 JUDGE_COMPILATION_ERROR 行并以返回值 0 退出；
 * 2. 输出 JUDGE_RESULTS_START，按顺序对每个测试点：将输入复制到 input.txt，
 *    在 timeout 限制下运行选手程序，输出一行 JUDGE_TEST_CASE_RESULT；
 * 3. 输出 JUDGE_RESULTS_END。
 * SANDBOX_USER 非空时，编译命令和选手程序通过 setpriv 以该用户运行，驱动脚本本身必须以 root 运行。
 * 协议格式参见 protocol.hpp
 * @param profile 语言配置
 * @param language 语言 id
 * @param time_limit 每个测试点的时间限制，单位为秒
 * @throw std::invalid_argument 若语言配置不安全、时间限制不是正数或者 SANDBOX_USER 格式不正确
 */
std::string generate_driver_script(const language_profile &profile, const std::string &language, int time_limit);

}  // namespace codejudge
