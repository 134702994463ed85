#pragma once

#include <optional>
#include <string>

namespace codejudge {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 评测结果集合是固定的，新增状态需要同步修改协议解析和结果分类逻辑
 */
enum class status {
    /**
     * @brief 用户程序正常结束
     * 注意 SUCCESS 不代表答案正确，答案是否正确由 execution_result.passed 表示。
     * 程序正常退出但输出与标准输出不一致时状态仍然是 SUCCESS。
     */
    SUCCESS = 0,

    /**
     * @brief 用户程序运行时间超出限制
     * 由沙箱内 timeout 命令终止，比较的是时钟时间
     */
    TIME_LIMIT_EXCEEDED = 1,

    /**
     * @brief 用户程序运行内存超限
     * 优先根据 cgroup 的 oom_kill 计数判断，否则检查 stderr 中是否包含内存分配失败的信息。
     * 由于 cgroup 限制内存使用会导致在内存不足时 malloc 返回 NULL，或者是 new 抛出
     * bad_alloc 异常，也可能直接被 SIGKILL 杀死，此时无法识别的内存超限会被认为是 RE。
     */
    MEMORY_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序以非零返回值退出或因信号崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 用户程序编译错误
     * 编译错误时所有测试点都会被标记为该状态
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 内部错误，评测系统出错
     * 比如沙箱无法启动、沙箱输出不符合协议、沙箱被看门狗杀死。
     */
    INTERNAL_ERROR = 5
};

const char *get_display_message(status);

/**
 * @brief 根据显示名称解析评测结果
 * @param message 评测结果的显示名称，比如 "Time Limit Exceeded"
 * @return 若不是合法的显示名称，返回 std::nullopt
 */
std::optional<status> parse_status(const std::string &message);

}  // namespace codejudge
