#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开作用域时执行给定的代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     defer { filesystem::remove_all(dir); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = grader::scoped_guard() + [&]

namespace grader {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace grader
