#pragma once

#include <Python.h>
#include <string>

/**
 * @brief 在作用域内持有 Python 的 GIL
 * 所有 Python 对象的创建、调用和释放都必须在持有 GIL 时进行
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 取出当前 Python 异常的描述并清除异常状态
 * 必须在持有 GIL 时调用
 */
std::string fetch_python_error();
