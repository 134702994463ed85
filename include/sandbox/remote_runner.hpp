#pragma once

#include <string>
#include "sandbox/runner.hpp"

namespace codejudge::sandbox {

/**
 * @brief 使用远程评测服务作为沙箱
 * 对每个测试点，以 JSON 格式 POST {"code", "language", "stdin"} 到评测服务，
 * 评测服务返回 {"output", "time", "memory", "status", "error_message"}。
 * 远程评测服务的响应会被转换为和驱动脚本相同的评测协议，
 * 因此驱动脚本本身不会被使用。
 * 某个测试点的请求失败时，该测试点及其后的测试点都被标记为 Internal Error，
 * 之前已完成的测试点保留各自的结果。
 */
struct remote_runner : public runner {
    /**
     * @param url 评测服务的地址
     * @param timeout 单次请求的超时时间，单位为秒
     */
    explicit remote_runner(const std::string &url, int timeout);

    sandbox_invocation execute(const submission &submit, const language_profile &profile, const std::string &script) override;

protected:
    /**
     * @brief 发送一次 POST 请求
     * @param body JSON 格式的请求体
     * @return 响应体
     * @throw network_error 若请求失败或者服务返回了 HTTP 错误码
     */
    virtual std::string post(const std::string &body);

private:
    std::string url;
    int timeout;
};

}  // namespace codejudge::sandbox
