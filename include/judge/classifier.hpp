#pragma once

#include <string>
#include <vector>
#include "judge/protocol.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含将沙箱输出转换为评测结果的逻辑
 * 单个测试点的判定优先级：
 * 1. 驱动脚本声明 Success：状态为 Success，输出去除首尾空白后与标准输出一致时通过；
 * 2. 驱动脚本声明 Time Limit Exceeded：状态为 Time Limit Exceeded；
 * 3. 驱动脚本声明 Memory Limit Exceeded（cgroup 报告了 OOM），或者 stderr 中
 *    包含内存分配失败的信息：状态为 Memory Limit Exceeded；
 * 4. 其他情况为 Runtime Error。
 * Compilation Error 和 Internal Error 原样保留（只有远程评测服务会声明这两种状态）。
 */
namespace codejudge {

/**
 * @brief 比较选手输出和标准输出，两者均去除首尾空白字符，其余部分必须完全一致
 */
bool output_matches(const std::string &actual, const std::string &expected);

/**
 * @brief 检查 stderr 中是否包含常见的内存分配失败信息
 * 包括 MemoryError (python), OutOfMemoryError (java), std::bad_alloc (c++),
 * Cannot allocate memory 和 failed to allocate memory。
 * 这只是启发式的判断，进程被直接杀死时 stderr 中不会有任何信息
 */
bool indicates_memory_limit(const std::string &error);

/**
 * @brief 根据驱动脚本报告的记录生成一个测试点的评测结果
 * @param number 测试点编号，从 1 开始
 * @param testcase 提交中对应的测试点，输入和标准输出总是取自这里
 * @param record 驱动脚本报告的记录，必须是合法的记录
 */
execution_result classify(size_t number, const test_case &testcase, const test_case_record &record);

/**
 * @brief 为提交中的每个测试点生成相同的评测结果
 * 选手输出为空，运行时间为 0，passed 为 false
 */
std::vector<execution_result> uniform_results(const submission &submit, status stat, const std::string &message);

/**
 * @brief 根据解析后的沙箱输出组装整个提交的评测结果
 * 返回值的长度总是等于测试点数量，第 i 个结果的编号总是 i。
 * 若沙箱没有输出任何测试点记录，所有测试点的状态都是 Compilation Error（存在编译错误信息时）
 * 或者 Internal Error，错误信息依次取编译错误信息、沙箱的 stderr 或者 "Unknown error"。
 * 否则第 i 条记录对应第 i 个测试点，格式错误、编号不匹配或者缺失的记录均为 Internal Error，
 * 多余的记录会被忽略。
 * @param submit 提交
 * @param protocol 解析后的沙箱 stdout
 * @param sandbox_error 沙箱的 stderr
 */
std::vector<execution_result> assemble_results(const submission &submit, const protocol_result &protocol, const std::string &sandbox_error);

}  // namespace codejudge
