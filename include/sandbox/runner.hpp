#pragma once

#include <filesystem>
#include <string>
#include "judge/language.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含沙箱的抽象接口
 * 我们有两种沙箱：
 * 1. docker_runner: 在本机通过 docker 启动一个隔离的容器，一次运行所有测试点；
 * 2. remote_runner: 将每个测试点发送给远程评测服务运行。
 * 使用哪种沙箱由调用方决定，评测引擎只依赖于 runner 接口。
 */
namespace codejudge::sandbox {

/**
 * @brief 一次沙箱调用的信息
 * 沙箱的工作目录在 execute 返回之前就已经被删除，workdir 只用于记录日志
 */
struct sandbox_invocation {
    std::filesystem::path workdir;

    /**
     * @brief 驱动脚本的内容
     */
    std::string script;

    /**
     * @brief 沙箱的 stdout，包含评测协议数据
     */
    std::string output;

    /**
     * @brief 沙箱的 stderr
     */
    std::string error;

    /**
     * @brief 沙箱的返回值，因信号退出时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 沙箱是否被看门狗杀死
     */
    bool timed_out = false;
};

/**
 * @brief 表示一种沙箱
 */
struct runner {
    virtual ~runner() = default;

    /**
     * @brief 在沙箱中编译并运行提交的所有测试点
     * @param submit 已经验证过的提交
     * @param profile 提交所使用的语言配置
     * @param script 生成的驱动脚本
     * @return 沙箱的输出，stdout 中包含评测协议数据
     * @throw infrastructure_error 若沙箱无法启动
     * @throw network_error 若无法连接远程评测服务
     */
    virtual sandbox_invocation execute(const submission &submit, const language_profile &profile, const std::string &script) = 0;
};

}  // namespace codejudge::sandbox
