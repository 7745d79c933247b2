#include "judge/python_hooks.hpp"
#include <boost/python.hpp>
#include <glog/logging.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;
namespace bp = boost::python;

static string test_get_name(const test &t) {
    return t.name;
}

static bp::list test_get_args(const test &t) {
    bp::list args;
    for (auto &arg : t.args) args.append(arg);
    return args;
}

static void test_set_args(test &t, bp::object args) {
    vector<string> result;
    for (bp::ssize_t i = 0; i < bp::len(args); ++i) {
        string arg = bp::extract<string>(bp::str(args[i]));
        result.push_back(arg);
    }
    t.args = result;
}

/**
 * @brief 检查题目脚本给出的宿主机文件，不存在时在题目脚本中抛出异常
 */
static fixture_uptr source_file(const string &path) {
    if (!fs::is_regular_file(path))
        throw config_error("fixture file " + path + " not found");
    return make_unique<file_fixture>(path);
}

/**
 * @brief 检查选手程序需要生成的文件路径，不允许跳出沙箱目录
 */
static string box_file(const string &path) {
    try {
        return assert_safe_path(path);
    } catch (runtime_error &e) {
        throw config_error(e.what());
    }
}

static void test_set_stdin(test &t, const string &text) {
    t.input = make_unique<text_fixture>(t.name + ".in", text);
}

static void test_set_stdin_file(test &t, const string &path) {
    t.input = source_file(path);
}

static void test_set_stdout(test &t, const string &text) {
    t.expected_stdout = make_unique<text_fixture>(t.name + ".out", text);
}

static void test_set_stdout_file(test &t, const string &path) {
    t.expected_stdout = source_file(path);
}

static void test_set_stderr(test &t, const string &text) {
    t.expected_stderr = make_unique<text_fixture>(t.name + ".err", text);
}

static void test_set_stderr_file(test &t, const string &path) {
    t.expected_stderr = source_file(path);
}

static void test_add_file(test &t, const string &path, const string &text) {
    t.files.push_back({box_file(path), make_unique<text_fixture>(path, text)});
}

static void test_add_file_from(test &t, const string &path, const string &expected) {
    string file = box_file(path);
    t.files.push_back({file, source_file(expected)});
}

static void test_add_filter(test &t, const string &name) {
    t.filters.push_back(find_filter(name));
}

static void test_set_env(test &t, const string &key, const string &value) {
    t.env[key] = value;
}

static string evaluation_task_file(const evaluation &eval, const string &path) {
    return eval.task_file(path).string();
}

static string evaluation_task_path(const evaluation &eval) {
    return eval.task_path.string();
}

static bp::list evaluation_tests(const evaluation &eval) {
    bp::list tests;
    for (test *t : eval.tests()) tests.append(bp::ptr(t));
    return tests;
}

static bp::dict evaluation_meta(const evaluation &eval) {
    bp::dict meta;
    for (auto &[key, value] : eval.meta) meta[key] = value;
    return meta;
}

BOOST_PYTHON_MODULE(grader) {
    bp::class_<test, boost::noncopyable>("Test", bp::no_init)
        .add_property("name", &test_get_name)
        .add_property("title", &test::title, &test::set_title)
        .add_property("args", &test_get_args, &test_set_args)
        .def_readwrite("exit_code", &test::exit_code)
        .def_readwrite("stdio_max_bytes", &test::stdio_max_bytes)
        .def("set_stdin", &test_set_stdin)
        .def("set_stdin_file", &test_set_stdin_file)
        .def("set_stdout", &test_set_stdout)
        .def("set_stdout_file", &test_set_stdout_file)
        .def("set_stderr", &test_set_stderr)
        .def("set_stderr_file", &test_set_stderr_file)
        .def("add_file", &test_add_file)
        .def("add_file_from", &test_add_file_from)
        .def("add_filter", &test_add_filter)
        .def("set_env", &test_set_env);

    bp::class_<evaluation, boost::noncopyable>("Evaluation", bp::no_init)
        .def("create_test", &evaluation::create_test, bp::return_internal_reference<>())
        .def("task_file", &evaluation_task_file)
        .add_property("task_path", &evaluation_task_path)
        .add_property("tests", &evaluation_tests)
        .add_property("meta", &evaluation_meta);
}

/**
 * @brief 初始化内嵌的 Python 解释器并注册 grader 模块
 * 初始化后释放 GIL，之后所有调用都通过 GIL_guard 获取 GIL
 */
static void ensure_interpreter() {
    static once_flag flag;
    call_once(flag, [] {
        if (Py_IsInitialized())
            throw internal_error("python interpreter is initialized before grader module is registered");

        PyImport_AppendInittab("grader", &PyInit_grader);
        Py_Initialize();
        try {
            bp::import("grader");
        } catch (bp::error_already_set &) {
            string message = fetch_python_error();
            PyEval_SaveThread();
            throw internal_error("unable to import grader module: " + message);
        }
        PyEval_SaveThread();
    });
}

static bp::object load_script(const fs::path &script) {
    bp::object util = bp::import("importlib.util");
    string module_name = "grader_script_" + script.stem().stem().string();
    bp::object spec = util.attr("spec_from_file_location")(module_name, script.string());
    bp::object module = util.attr("module_from_spec")(spec);
    spec.attr("loader").attr("exec_module")(module);
    return module;
}

/**
 * @brief 持有 Python 对象的引用，释放时获取 GIL
 */
static shared_ptr<PyObject> hold(const bp::object &obj) {
    PyObject *ptr = obj.ptr();
    Py_INCREF(ptr);
    return shared_ptr<PyObject>(ptr, [](PyObject *p) {
        GIL_guard guard;
        Py_DECREF(p);
    });
}

static bool call_checker(PyObject *function, const test_result &result, json &extra, evaluation &eval) {
    GIL_guard guard;
    try {
        json before = result;
        bp::object json_module = bp::import("json");
        bp::object dict = json_module.attr("loads")(before.dump(-1, ' ', false, json::error_handler_t::replace));

        bp::object check{bp::handle<>(bp::borrowed(function))};
        bp::object ret = check(dict, bp::ptr(&eval));
        int truth = PyObject_IsTrue(ret.ptr());
        if (truth < 0) bp::throw_error_already_set();

        // NaN 和 Infinity 不是合法的 JSON，由 json.dumps 报错
        bp::dict options;
        options["allow_nan"] = false;
        string dumped = bp::extract<string>(json_module.attr("dumps")(*bp::make_tuple(dict), **options));
        json after = json::parse(dumped);
        for (auto &[key, value] : after.items())
            if (!before.count(key)) extra[key] = value;
        return truth != 0;
    } catch (bp::error_already_set &) {
        string message = fetch_python_error();
        LOG(WARNING) << "check script of test " << result.name << " raised: " << message;
        throw check_error("check script raised: " + message);
    } catch (json::exception &e) {
        LOG(WARNING) << "check script of test " << result.name << " returned malformed result: " << e.what();
        throw check_error(string("check script raised: ") + e.what());
    }
}

void bind_python_checker(test &t, const fs::path &script) {
    ensure_interpreter();

    GIL_guard guard;
    try {
        bp::object module = load_script(script);
        if (!PyObject_HasAttrString(module.ptr(), "check"))
            return;

        shared_ptr<PyObject> function = hold(module.attr("check"));
        t.check = [function](const test_result &result, json &extra, evaluation &eval) {
            return call_checker(function.get(), result, extra, eval);
        };
    } catch (bp::error_already_set &) {
        throw config_error("unable to load " + script.string() + ": " + fetch_python_error());
    }
}

void run_python_generator(evaluation &eval, const fs::path &script) {
    ensure_interpreter();

    GIL_guard guard;
    try {
        bp::object module = load_script(script);
        if (!PyObject_HasAttrString(module.ptr(), "gen_tests"))
            return;

        module.attr("gen_tests")(bp::ptr(&eval));
    } catch (bp::error_already_set &) {
        throw config_error("error in " + script.string() + ": " + fetch_python_error());
    }
}

}  // namespace grader
