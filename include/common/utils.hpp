#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codejudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部命令的运行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值
     * 如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止外部命令的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 外部命令是否因为超出看门狗时间而被杀死
     */
    bool timed_out = false;

    /**
     * @brief stdout 或 stderr 的输出是否因为超出上限而被截断
     */
    bool truncated = false;

    std::string output;
    std::string error;
};

/**
 * @brief 执行外部命令，捕获 stdout 和 stderr
 * 外部命令运行在独立的进程组中，超时后先发送 SIGTERM，再发送 SIGKILL 杀死整个进程组。
 * @param argv 外部命令的路径 (argv[0]) 和参数
 * @param timeout 看门狗时间
 * @param capture_limit stdout、stderr 各自最多保留的字节数，超出的部分会被丢弃
 * @return 外部命令的运行结果
 * @throw std::system_error 若无法创建管道、fork 失败或者外部命令无法执行
 */
process_result capture_program(const std::vector<std::string> &argv, std::chrono::milliseconds timeout, size_t capture_limit);

/**
 * @brief 调用外部程序并捕获输出
 * @note 与 capture_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 popen(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path shell("/bin/sh");
 *     auto result = capture_process(std::chrono::seconds(10), 1 << 20, shell, "-c", "echo hello");
 * @endcode
 */
template <typename... Args>
process_result capture_process(std::chrono::milliseconds timeout, size_t capture_limit, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    LOG(INFO) << ss.str();
#endif

    return capture_program(list, timeout, capture_limit);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codejudge
