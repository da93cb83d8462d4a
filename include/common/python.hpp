#pragma once

#include <Python.h>

namespace grader {

/**
 * @brief 在作用域内持有 GIL
 * 任何线程调用 CPython API 之前都需要构造一个
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 在作用域内释放主线程持有的 GIL
 * 主线程初始化解释器之后需要释放 GIL，否则工作线程无法获取
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

}  // namespace grader
