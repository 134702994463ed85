#pragma once

#include <string>
#include <vector>
#include "sandbox/runner.hpp"

namespace codejudge::sandbox {

/**
 * @brief 使用 docker 容器作为沙箱
 * 每次调用都会在 RUN_DIR 下创建一个以 uuid 命名的工作目录，写入选手代码 program/<source_file>、
 * 测试输入 tests/<i>.in 以及驱动脚本 run_script.sh，挂载为容器内的 /app，
 * 并以 root 身份运行驱动脚本（由驱动脚本切换到 SANDBOX_USER 运行选手程序）。
 * 容器没有网络，内存、进程数、文件描述符数和 CPU 都受到限制。
 *
 * 看门狗时间为时间限制 * 测试点数量 + COMPILE_TIME_ALLOWANCE，超时后
 * 杀死 docker 客户端所在的进程组，并通过 docker kill 删除容器。
 */
struct docker_runner : public runner {
    sandbox_invocation execute(const submission &submit, const language_profile &profile, const std::string &script) override;

    /**
     * @brief 生成 docker run 的完整命令行
     * @param name 容器名
     * @param workdir 挂载到容器内 /app 的工作目录
     * @param submit 提交，用于确定内存限制
     * @param profile 语言配置，用于确定镜像
     */
    static std::vector<std::string> docker_arguments(const std::string &name, const std::filesystem::path &workdir, const submission &submit, const language_profile &profile);
};

}  // namespace codejudge::sandbox
