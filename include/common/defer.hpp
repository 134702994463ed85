#pragma once

#include <functional>

#define CODEJUDGE_DEFER_1(x, y) x##y
#define CODEJUDGE_DEFER_2(x, y) CODEJUDGE_DEFER_1(x, y)
#define CODEJUDGE_DEFER_0(x) CODEJUDGE_DEFER_2(x, __COUNTER__)
#define defer auto CODEJUDGE_DEFER_0(_defered_option) = ::codejudge::scoped_guard() + [&]

namespace codejudge {

/**
 * @brief 在离开作用域时执行清理函数，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理函数，离开作用域时不再执行
     */
    void dismiss();

private:
    std::function<void()> f;
};

}  // namespace codejudge
