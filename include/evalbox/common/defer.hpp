#pragma once

#include <functional>

#define EVALBOX_DEFER_1(x, y) x##y
#define EVALBOX_DEFER_2(x, y) EVALBOX_DEFER_1(x, y)
#define EVALBOX_DEFER_0(x) EVALBOX_DEFER_2(x, __COUNTER__)
#define defer auto EVALBOX_DEFER_0(_defered_option) = evalbox::scoped_guard() + [&]

namespace evalbox {

/**
 * @brief 在作用域结束时执行回调
 * 配合 defer 宏使用，用于关闭文件描述符、删除临时目录等清理工作。
 * 可以调用 dismiss 取消清理。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    void dismiss();
};

}  // namespace evalbox
