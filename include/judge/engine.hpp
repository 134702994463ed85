#pragma once

#include <vector>
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 评测引擎
 * 评测流程：查找语言配置 -> 生成驱动脚本 -> 在沙箱中运行 -> 解析评测协议 -> 判定结果
 * 评测引擎本身没有可变状态，多个线程可以同时调用 run_batch，
 * 每次调用使用独立的沙箱工作目录。
 */
struct engine {
    /**
     * @param languages 语言配置表，必须比 engine 活得更久
     * @param runner 沙箱，必须比 engine 活得更久
     */
    engine(const language_registry &languages, sandbox::runner &runner);

    /**
     * @brief 评测一个提交
     * 除了提交本身不合法的情况，该函数总是返回和测试点数量相同的评测结果，
     * 沙箱无法启动或者评测系统内部出错时所有测试点都是 Internal Error。
     * @throw invalid_submission 若提交不合法，此时不会启动沙箱
     * @throw unsupported_language 若提交的语言不受支持，此时不会启动沙箱
     */
    std::vector<execution_result> run_batch(const submission &submit) const;

private:
    const language_registry &languages;
    sandbox::runner &runner;
};

}  // namespace codejudge
