#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <iterator>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

temporary_file::temporary_file(const fs::path &path)
    : file_path(path), file(path, ios::in | ios::out | ios::trunc | ios::binary) {
    if (!file)
        throw fs::filesystem_error("unable to create temporary file", path, make_error_code(errc::io_error));
}

temporary_file::temporary_file(temporary_file &&other)
    : file_path(move(other.file_path)), file(move(other.file)) {
    other.file_path.clear();
}

temporary_file::~temporary_file() {
    if (file_path.empty()) return;
    file.close();
    error_code ec;
    fs::remove(file_path, ec);
    if (ec) LOG(ERROR) << "Unable to remove temporary file " << file_path << ": " << ec.message();
}

const fs::path &temporary_file::path() const {
    return file_path;
}

fstream &temporary_file::stream() {
    return file;
}

void temporary_file::flush() {
    file.flush();
}

sandbox::~sandbox() {}

run_result sandbox::run(const vector<string> &command, const map<string, string> &env) {
    run_request request;
    request.command = command;
    request.env = env;
    request.limits = {{"processes", "100"}};
    request.full_env = true;
    return execute(request);
}

run_result sandbox::run_checked(const vector<string> &command, const map<string, string> &env) {
    auto result = run(command, env);
    if (result.exit_code != 0)
        throw sandbox_error("failed to execute: " + shell_join(command), result.command, result.err);
    return result;
}

run_result sandbox::compile(const vector<string> &flags, vector<string> sources) {
    if (sources.empty()) {
        for (auto &entry : fs::directory_iterator(root()))
            if (entry.is_regular_file() && entry.path().extension() == ".c")
                sources.push_back(entry.path().filename().string());
        sort(sources.begin(), sources.end());
    }

    vector<string> command = {COMPILER_PATH.string()};
    command.insert(command.end(), sources.begin(), sources.end());
    command.insert(command.end(), {"-o", "main", "-g", "-lm", "-Wall", "-pedantic"});
    command.insert(command.end(), flags.begin(), flags.end());

    auto result = run(command);
    result.command = shell_join(command);
    LOG(INFO) << "Compilation finished with exitcode " << result.exit_code << ": " << result.command;
    return result;
}

fs::path sandbox::system_path(const string &path) const {
    if (path.empty()) return root();
    return root() / assert_safe_path(path);
}

bool sandbox::exists(const string &path) const {
    return fs::exists(system_path(path));
}

ifstream sandbox::open(const string &path) const {
    fs::path file = system_path(path);
    if (!fs::is_regular_file(file))
        throw fs::filesystem_error("file not found", file, make_error_code(errc::no_such_file_or_directory));
    return ifstream(file, ios::binary);
}

string sandbox::read(const string &path) const {
    ifstream fin = open(path);
    return string((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
}

temporary_file sandbox::open_temporary(const string &suffix) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    return temporary_file(system_path(uuid.substr(0, 8) + "_" + suffix));
}

void sandbox::copy(const fs::path &local, const string &box_path) {
    fs::copy_file(local, system_path(box_path), fs::copy_options::overwrite_existing);
}

}  // namespace grader
