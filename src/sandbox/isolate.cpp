#include "sandbox/isolate.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/metadata.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

isolate_sandbox::isolate_sandbox(int box_id)
    : box_id(box_id) {}

isolate_sandbox::~isolate_sandbox() {
    if (!initialized || DEBUG) return;
    try {
        cleanup();
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to clean up isolate box " << box_id << ": " << ex.what();
    }
}

string isolate_sandbox::box_flag() const {
    return fmt::format("--box-id={}", box_id);
}

fs::path isolate_sandbox::metadata_file() const {
    return STATE_DIR / fmt::format("grader-meta-{}", box_id);
}

process_result isolate_sandbox::control(const string &action) {
    string box = box_flag();
    process_result result;
    try {
        result = capture_process(ISOLATE_PATH, box, "--cg", action);
    } catch (system_error &ex) {
        throw sandbox_error("unable to start isolate", shell_join({ISOLATE_PATH.string(), box, "--cg", action}), ex.what());
    }
    if (result.exit_code != 0)
        throw sandbox_error("isolate " + action + " failed", shell_join({ISOLATE_PATH.string(), box, "--cg", action}), result.err);
    return result;
}

void isolate_sandbox::init() {
    // 在 isolate --init 之前加锁，避免另一个评测进程清理掉我们正在使用的沙箱
    lock = lock_file(STATE_DIR / fmt::format("grader-box-{}.lock", box_id), false);

    cleanup();

    process_result result = control("--init");
    box_dir = boost::algorithm::trim_copy(result.out);
    initialized = true;
    LOG(INFO) << "Initialized isolate box " << box_id << " at " << box_dir;
}

void isolate_sandbox::cleanup() {
    control("--cleanup");
    initialized = false;
}

fs::path isolate_sandbox::root() const {
    return box_dir / "box";
}

vector<string> isolate_sandbox::build_command(const run_request &request) const {
    vector<string> command = {ISOLATE_PATH.string(), box_flag(), "-M", metadata_file().string(), "--cg"};
    for (auto &[name, value] : request.limits)
        command.push_back(fmt::format("--{}={}", name, value));
    command.push_back("-s");
    if (request.full_env)
        command.push_back("-e");
    for (auto &[key, value] : request.env)
        command.push_back(fmt::format("--env={}={}", key, value));
    command.push_back("--run");
    command.push_back("--");
    command.insert(command.end(), request.command.begin(), request.command.end());
    return command;
}

run_result isolate_sandbox::execute(const run_request &request) {
    vector<string> command = build_command(request);
    string command_line = shell_join(command);
    LOG(INFO) << "executing in isolation: " << command_line;

    // 清除上一次运行留下的 metadata，避免 isolate 启动失败时读到旧数据
    error_code ec;
    fs::remove(metadata_file(), ec);

    process_options options;
    options.stdin_file = request.stdin_file;
    options.max_output = request.max_output;

    run_result result;
    try {
        static_cast<process_result &>(result) = exec_program(command, options);
    } catch (system_error &ex) {
        throw sandbox_error("unable to start isolate", command_line, ex.what());
    }
    result.metadata = read_metadata(metadata_file());
    result.command = command_line;
    LOG(INFO) << "exit_code: " << result.exit_code;
    return result;
}

}  // namespace grader
