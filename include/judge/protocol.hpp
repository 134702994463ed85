#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件描述驱动脚本和评测引擎之间的行协议
 * 驱动脚本在 stdout 中每行输出一条指令：
 * JUDGE_COMPILATION_ERROR: {"version":1,"encoding":"base64","message":"..."}
 * JUDGE_RESULTS_START
 * JUDGE_TEST_CASE_RESULT: {"version":1,"encoding":"base64","index":1,"output":"...","stderr":"...",
 *                          "status":"Success","time":0.482,"memory":0,"exit_code":0,"output_limit_exceeded":false}
 * JUDGE_RESULTS_END
 * 所有字符串字段都是 base64 编码的。不以 JUDGE_ 指令前缀开头的行都会被忽略。
 * 测试点的输入和标准输出不会出现在记录中，评测引擎直接使用提交中的数据。
 */
namespace codejudge {

constexpr int PROTOCOL_VERSION = 1;

constexpr const char *COMPILATION_ERROR_MARKER = "JUDGE_COMPILATION_ERROR:";
constexpr const char *RESULTS_START_MARKER = "JUDGE_RESULTS_START";
constexpr const char *TEST_CASE_RESULT_MARKER = "JUDGE_TEST_CASE_RESULT:";
constexpr const char *RESULTS_END_MARKER = "JUDGE_RESULTS_END";

/**
 * @brief 驱动脚本报告的一个测试点的运行信息
 */
struct test_case_record {
    /**
     * @brief 驱动脚本声明的测试点编号，从 1 开始
     */
    size_t index = 0;

    /**
     * @brief 选手程序的 stdout，至多保留 OUTPUT_LIMIT 字节
     */
    std::string output;

    std::string error;

    /**
     * @brief 驱动脚本声明的评测结果
     */
    status declared = status::INTERNAL_ERROR;

    /**
     * @brief 运行时间，单位为秒，非负，精确到毫秒
     */
    double time = 0;

    /**
     * @brief 内存使用，单位为 MB，沙箱无法测量时为 0
     */
    double memory = 0;

    int exit_code = 0;

    /**
     * @brief 选手程序的 stdout 是否超过了 OUTPUT_LIMIT 字节
     * 此时 output 只是输出的前缀，不能用来判断答案是否正确
     */
    bool output_limit_exceeded = false;

    /**
     * @brief 若该行不符合协议格式，这里记录错误原因，其他字段无意义
     */
    std::string schema_error;

    bool valid() const;
};

/**
 * @brief 解析后的沙箱输出
 */
struct protocol_result {
    /**
     * @brief 是否出现了 JUDGE_RESULTS_START
     */
    bool started = false;

    /**
     * @brief 是否出现了 JUDGE_RESULTS_END
     */
    bool ended = false;

    /**
     * @brief 编译错误信息，没有出现 JUDGE_COMPILATION_ERROR 时为空
     */
    std::optional<std::string> compilation_error;

    /**
     * @brief 按出现顺序排列的所有测试点结果，包括格式不正确的行
     */
    std::vector<test_case_record> records;
};

/**
 * @brief 将时间规范化为 "秒.毫秒" 的形式
 * 例如 ".482" 规范化为 "0.482"，"1.5" 规范化为 "1.500"
 * @throw protocol_error 若 text 不是非负数
 */
std::string normalize_time(const std::string &text);

/**
 * @brief 解析 JUDGE_TEST_CASE_RESULT 之后的 JSON 记录，验证每个字段
 * @throw protocol_error 若版本号不匹配、字段缺失、类型不正确或者 base64 解码失败
 */
test_case_record parse_record(const std::string &payload);

/**
 * @brief 生成一行 JUDGE_TEST_CASE_RESULT 指令（不含换行）
 */
std::string encode_record(const test_case_record &record);

/**
 * @brief 生成一行 JUDGE_COMPILATION_ERROR 指令（不含换行）
 */
std::string encode_compilation_error(const std::string &message);

/**
 * @brief 逐行解析沙箱的 stdout
 * 该函数不会抛出协议错误：格式不正确的测试点记录会以 schema_error 的形式保留在结果中
 */
protocol_result parse_protocol(const std::string &output);

}  // namespace codejudge
