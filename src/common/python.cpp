#include "common/python.hpp"

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

std::string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);

    std::string message = "unknown python error";
    if (value) {
        PyObject *str = PyObject_Str(value);
        if (str) {
            const char *text = PyUnicode_AsUTF8(str);
            if (text) message = text;
            Py_DECREF(str);
        }
    }
    if (type) {
        PyObject *name = PyObject_GetAttrString(type, "__name__");
        if (name) {
            const char *text = PyUnicode_AsUTF8(name);
            if (text) message = std::string(text) + ": " + message;
            Py_DECREF(name);
        }
    }
    PyErr_Clear();
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(traceback);
    return message;
}
