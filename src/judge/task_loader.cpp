#include "judge/task_loader.hpp"
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/python_hooks.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static void check_keys(const YAML::Node &node, const set<string> &known, const string &where) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        string key = it->first.as<string>();
        if (!known.count(key))
            throw config_error("unknown key " + key + " in " + where);
    }
}

static void check_type(const YAML::Node &node, YAML::NodeType::value type, const string &where) {
    if (node.Type() != type)
        throw config_error("malformed " + where);
}

static vector<string> read_string_list(const YAML::Node &node, const string &where) {
    check_type(node, YAML::NodeType::Sequence, where);
    vector<string> result;
    for (auto &item : node) {
        check_type(item, YAML::NodeType::Scalar, where);
        result.push_back(item.as<string>());
    }
    return result;
}

static file_config read_file_config(const YAML::Node &node) {
    check_type(node, YAML::NodeType::Map, "file entry");
    check_keys(node, {"path", "expected"}, "file entry");
    if (!node["path"] || !node["expected"])
        throw config_error("file entry requires path and expected");

    file_config file;
    file.path = node["path"].as<string>();
    file.expected = node["expected"].as<string>();
    return file;
}

static test_config read_test_config(const YAML::Node &node) {
    check_type(node, YAML::NodeType::Map, "test entry");
    check_keys(node, {"name", "title", "exit_code", "args", "files", "filters", "env", "stdio_max_bytes"}, "test entry");

    test_config test;
    if (node["name"]) test.name = node["name"].as<string>();
    if (node["title"]) test.title = node["title"].as<string>();
    if (node["exit_code"]) test.exit_code = node["exit_code"].as<int>();
    if (node["args"]) test.args = read_string_list(node["args"], "args");
    if (node["filters"]) test.filters = read_string_list(node["filters"], "filters");
    if (node["stdio_max_bytes"]) test.stdio_max_bytes = node["stdio_max_bytes"].as<size_t>();

    if (auto files = node["files"]) {
        check_type(files, YAML::NodeType::Sequence, "files");
        for (auto &file : files)
            test.files.push_back(read_file_config(file));
    }

    if (auto env = node["env"]) {
        check_type(env, YAML::NodeType::Map, "env");
        for (auto it = env.begin(); it != env.end(); ++it)
            test.env[it->first.as<string>()] = it->second.as<string>();
    }
    return test;
}

task_config read_task_config(const fs::path &file) {
    task_config config;
    if (!fs::exists(file)) return config;

    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (root.IsNull()) return config;
        check_type(root, YAML::NodeType::Map, "config.yml");
        check_keys(root, {"filters", "limits", "tests"}, "config.yml");

        if (root["filters"])
            config.filters = read_string_list(root["filters"], "filters");

        if (auto limits = root["limits"]) {
            check_type(limits, YAML::NodeType::Map, "limits");
            for (auto it = limits.begin(); it != limits.end(); ++it)
                config.limits.emplace_back(it->first.as<string>(), it->second.as<double>());
        }

        if (auto tests = root["tests"]) {
            check_type(tests, YAML::NodeType::Sequence, "tests");
            for (auto &test : tests)
                config.tests.push_back(read_test_config(test));
        }
    } catch (YAML::Exception &e) {
        throw config_error(file.string() + ": " + e.what());
    }
    return config;
}

static fs::path safe_task_file(const evaluation &eval, const string &path) {
    try {
        return eval.task_file(path);
    } catch (std::runtime_error &e) {
        throw config_error(e.what());
    }
}

void apply_task_config(evaluation &eval, const task_config &config) {
    for (auto &name : config.filters)
        eval.filters.push_back(find_filter(name));

    // 未知或不合法的限制由 set 记录日志后忽略
    for (auto &[name, value] : config.limits)
        eval.limits.set(name, value);

    set<string> configured;
    for (auto &conf : config.tests) {
        string name = conf.name ? *conf.name : "test " + to_string(eval.tests().size());
        if (configured.count(name)) {
            LOG(WARNING) << "Test " << name << " is configured more than once, ignoring the latter";
            continue;
        }
        configured.insert(name);

        test &t = eval.create_test(name);
        if (conf.title) t.set_title(*conf.title);
        t.exit_code = conf.exit_code;
        t.args = conf.args;
        for (auto &[key, value] : conf.env)
            t.env[key] = value;
        if (conf.stdio_max_bytes) t.stdio_max_bytes = *conf.stdio_max_bytes;

        for (auto &filter : conf.filters)
            t.filters.push_back(find_filter(filter));

        for (auto &file : conf.files) {
            try {
                assert_safe_path(file.path);
            } catch (std::runtime_error &e) {
                throw config_error(e.what());
            }
            fs::path expected = safe_task_file(eval, file.expected);
            if (!fs::is_regular_file(expected))
                throw config_error("expected file " + file.expected + " of test " + name + " not found");
            t.files.push_back({file.path, make_unique<file_fixture>(expected)});
        }
    }
}

/**
 * @brief 按文件名顺序列出题目目录下以 ext 结尾的文件对应的测试点名称
 */
static vector<string> list_tests(const fs::path &task_path, const string &ext) {
    vector<string> names;
    for (auto &entry : fs::directory_iterator(task_path)) {
        if (!entry.is_regular_file()) continue;
        string filename = entry.path().filename().string();
        if (filename.size() > ext.size() && filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0)
            names.push_back(filename.substr(0, filename.size() - ext.size()));
    }
    sort(names.begin(), names.end());
    return names;
}

void load_task(evaluation &eval) {
    if (!fs::is_directory(eval.task_path))
        throw config_error("task directory " + eval.task_path.string() + " not found");

    eval.on_test_created([&eval](test &t) {
        fs::path script = eval.task_path / (t.name + ".test.py");
        if (fs::is_regular_file(script))
            bind_python_checker(t, script);
    });

    for (const string ext : {".out", ".err", ".test.py"})
        for (auto &name : list_tests(eval.task_path, ext))
            eval.create_test(name);

    apply_task_config(eval, read_task_config(eval.task_path / "config.yml"));

    fs::path script = eval.task_path / "script.py";
    if (fs::is_regular_file(script))
        run_python_generator(eval, script);

    LOG(INFO) << "Loaded " << eval.tests().size() << " tests from " << eval.task_path;
}

}  // namespace grader
