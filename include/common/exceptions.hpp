#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codejudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出异常时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是沙箱的输出不符合预期
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱无法启动或者在协议之外崩溃
 * 比如 docker 守护进程不可用、沙箱镜像不存在、系统资源耗尽。
 * 这类错误和选手程序无关，不能归咎于选手提交
 */
struct infrastructure_error : public internal_error {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示沙箱输出的评测协议数据格式不正确
 */
struct protocol_error : public judge_exception {
    protocol_error();
    explicit protocol_error(const std::string &message);
};

/**
 * @brief 表示提交缺少代码、语言或测试数据，或者时间、内存限制不合法
 * 抛出该异常时不会进行任何沙箱操作
 */
struct invalid_submission : public judge_exception {
    invalid_submission();
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 表示不支持的编程语言
 * 该错误是永久性的，调用方不应该重试
 */
struct unsupported_language : public judge_exception {
    std::string language;

    explicit unsupported_language(const std::string &language);
};

}  // namespace codejudge
