#include "judge/evaluation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <optional>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

evaluation::evaluation(const fs::path &task_path, sandbox &box, const map<string, string> &meta)
    : task_path(task_path), box(box), meta(meta) {}

test &evaluation::create_test(const string &name) {
    if (auto it = test_index.find(name); it != test_index.end())
        return *it->second;

    auto t = make_unique<test>(name);

    fs::path path = task_path / (name + ".out");
    if (fs::is_regular_file(path))
        t->expected_stdout = make_unique<file_fixture>(path);

    path = task_path / (name + ".err");
    if (fs::is_regular_file(path))
        t->expected_stderr = make_unique<file_fixture>(path);

    path = task_path / (name + ".in");
    if (fs::is_regular_file(path))
        t->input = make_unique<file_fixture>(path);

    test &ref = *t;
    test_list.push_back(move(t));
    test_index[name] = &ref;

    for (auto &callback : test_created)
        callback(ref);
    return ref;
}

test *evaluation::find_test(const string &name) {
    auto it = test_index.find(name);
    return it == test_index.end() ? nullptr : it->second;
}

vector<test *> evaluation::tests() const {
    vector<test *> result;
    for (auto &t : test_list)
        result.push_back(t.get());
    return result;
}

fs::path evaluation::task_file(const string &path) const {
    return task_path / assert_safe_path(path);
}

void evaluation::on_test_created(function<void(test &)> callback) {
    test_created.push_back(move(callback));
}

/**
 * @brief 根据 isolate 报告的 status 字段判断程序是否被沙箱终止
 * RE 由返回值比较负责，这里只处理超时、被信号杀死和沙箱内部错误
 */
static void check_run_status(test_result &result) {
    auto it = result.usage.find("status");
    if (it == result.usage.end()) return;

    run_status status = parse_run_status(it->second);
    if (status == run_status::OK || status == run_status::RUNTIME_ERROR) return;

    string reason = get_display_message(status);
    if (status == run_status::SIGNALED) {
        if (auto sig = result.usage.find("exitsig"); sig != result.usage.end())
            reason += " " + sig->second;
    } else if (auto message = result.usage.find("message"); message != result.usage.end() && !message->second.empty()) {
        reason += " (" + message->second + ")";
    }
    result.fail(reason);
}

/**
 * @brief 读取测试数据，读取失败时记录失败原因并返回 nullopt
 */
static optional<string> read_fixture(const fixture &data, const string &role, test_result &result) {
    try {
        return data.read();
    } catch (fs::filesystem_error &e) {
        LOG(ERROR) << "Unable to read " << role << " " << data.name << ": " << e.what();
        result.fail(fmt::format("{} {} not found", role, data.name));
        return nullopt;
    }
}

test_result evaluation::evaluate(const test &t, const map<string, string> &env, const string &title) {
    test_result result;
    result.name = t.name;
    result.title = title.empty() ? t.title() : title;

    vector<string> cmd = {"./main"};
    cmd.insert(cmd.end(), t.args.begin(), t.args.end());

    result.command = shell_join(cmd);
    if (t.input)
        result.command += " < " + shell_quote(t.input->name);

    run_request request;
    request.command = cmd;
    request.env = t.env;
    for (auto &[key, value] : env)
        request.env[key] = value;
    request.limits = limits.to_flags();
    request.max_output = t.stdio_max_bytes;

    // 内存中的 stdin 需要先写入沙箱内的临时文件，评测结束后删除
    optional<temporary_file> stdin_file;
    if (t.input) {
        result.input = read_fixture(*t.input, "stdin", result);
        if (!result.input) return result;
        fs::path file = t.input->path();
        if (file.empty()) {
            stdin_file.emplace(box.open_temporary(t.name + ".in"));
            stdin_file->stream() << *result.input;
            stdin_file->flush();
            file = stdin_file->path();
        }
        request.stdin_file = file;
    }

    run_result run = box.execute(request);

    result.actual_stdout = run.out.substr(0, t.stdio_max_bytes);
    result.actual_stderr = run.err.substr(0, t.stdio_max_bytes);
    result.exit_code = run.exit_code;

    // isolate 报告的返回值比 isolate 自身的返回值更准确
    for (auto &[key, value] : run.metadata) {
        if (key == "exitcode") {
            try {
                result.exit_code = boost::lexical_cast<int>(value);
                continue;
            } catch (boost::bad_lexical_cast &) {
                LOG(ERROR) << "Malformed exitcode in metadata: " << value;
            }
        }
        result.usage[key] = value;
    }

    check_run_status(result);

    if (result.exit_code != t.exit_code)
        result.fail(fmt::format("exit code {}, expected {}", result.exit_code, t.exit_code));

    vector<filter_ptr> used_filters = filters;
    used_filters.insert(used_filters.end(), t.filters.begin(), t.filters.end());

    if (t.expected_stdout) {
        result.expected_stdout = read_fixture(*t.expected_stdout, "expected stdout", result);
        if (result.expected_stdout && !compare(result.actual_stdout, *result.expected_stdout, used_filters))
            result.fail("stdout not matches");
    }

    if (t.expected_stderr) {
        result.expected_stderr = read_fixture(*t.expected_stderr, "expected stderr", result);
        if (result.expected_stderr && !compare(result.actual_stderr, *result.expected_stderr, used_filters))
            result.fail("stderr not matches");
    }

    for (auto &f : t.files) {
        file_result file;
        file.path = f.path;
        file.success = false;
        auto expected = read_fixture(*f.expected, "expected file", result);
        if (!expected) {
            file.error = "expected content not found";
            result.files.push_back(move(file));
            continue;
        }
        file.expected = *expected;
        try {
            file.content = box.read(f.path);
            file.success = compare(*file.content, file.expected, used_filters);
            if (!file.success)
                result.fail(fmt::format("file {} not matches", f.path));
        } catch (fs::filesystem_error &) {
            file.error = "file not found";
            result.fail(fmt::format("file {} not found", f.path));
        } catch (runtime_error &) {
            // 路径跳出了沙箱目录
            file.error = "path not allowed";
            result.fail(fmt::format("file {} not allowed", f.path));
        }
        result.files.push_back(move(file));
    }

    if (t.check) {
        try {
            if (!t.check(result, result.extra, *this))
                result.fail("custom check failed");
        } catch (check_error &e) {
            result.fail(e.what());
        }
    }

    LOG(INFO) << "Test " << t.name << (result.success ? " passed" : " failed");
    return result;
}

}  // namespace grader
