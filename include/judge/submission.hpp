#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含评测引擎的数据结构
 * 包含：
 * 1. test_case 类（表示一个测试点的输入和标准输出）
 * 2. submission 类（表示一个选手提交）
 * 3. execution_result 类（表示一个测试点的评测结果）
 */
namespace codejudge {

/**
 * @brief 表示一个测试点
 * 测试点没有 id，测试点的编号就是它在 submission.test_cases 中的位置（从 1 开始）
 */
struct test_case {
    std::string input;

    std::string expected_output;
};

/**
 * @brief 表示一个选手提交
 */
struct submission {
    /**
     * @brief 选手代码
     */
    std::string source_code;

    /**
     * @brief 选手代码的编程语言，比如 cpp, java, python, ruby
     * 参见 language_registry
     */
    std::string language;

    /**
     * @brief 每个测试点的时间限制，单位为秒，必须为正整数
     */
    int time_limit = 2;

    /**
     * @brief 内存限制，单位为 MB，必须为正整数
     */
    int memory_limit = 256;

    /**
     * @brief 所有测试点，评测结果和测试点的顺序一一对应
     */
    std::vector<test_case> test_cases;
};

/**
 * @brief 检查提交是否缺少代码、语言或测试点，以及时间、内存限制是否为正数
 * @throw invalid_submission 若提交不合法
 */
void validate_submission(const submission &submit);

/**
 * @brief 表示一个测试点的评测结果
 */
struct execution_result {
    /**
     * @brief 测试点编号，从 1 开始，等于测试点在提交中的位置
     */
    size_t test_case_number = 0;

    std::string input;

    std::string expected_output;

    /**
     * @brief 选手程序的 stdout
     */
    std::string actual_output;

    /**
     * @brief 选手程序的运行时间（时钟时间），单位为秒
     */
    double time_taken = 0;

    /**
     * @brief 选手程序的内存使用，单位为 MB
     * 沙箱无法准确测量内存时为 0
     */
    double memory_used = 0;

    status stat = status::INTERNAL_ERROR;

    /**
     * @brief 诊断信息，比如选手程序的 stderr、编译错误信息。为空表示没有诊断信息
     */
    std::string error_message;

    /**
     * @brief 当且仅当 stat 为 SUCCESS 且输出和标准输出在去除首尾空白后完全一致时为真
     */
    bool passed = false;
};

void from_json(const nlohmann::json &j, test_case &value);

/**
 * @brief 从 JSON 读取提交
 * 字段为 submission_code, language, time_limit（默认 2）, memory_limit（默认 256）, test_cases
 * @throw invalid_submission 若字段缺失或者类型不正确
 */
void from_json(const nlohmann::json &j, submission &value);

void to_json(nlohmann::json &j, const execution_result &value);

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << ", " << submit.test_cases.size() << " test cases, "
       << submit.time_limit << "s, " << submit.memory_limit << "MB]";
    return os;
}

}  // namespace codejudge
