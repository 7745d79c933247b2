#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fstream>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw fs::filesystem_error("unable to read file", path, make_error_code(errc::no_such_file_or_directory));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw fs::filesystem_error("unable to write file", path, make_error_code(errc::permission_denied));
    fout << content;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || fs::path(subpath).is_absolute())
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_file_lock::scoped_file_lock() : fd(-1), valid(false) {}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) : fd(-1), valid(false), lock_file(path) {
    fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    if (flock(fd, shared ? LOCK_SH : LOCK_EX) != 0) {
        int err = errno;
        close(fd);
        throw system_error(err, system_category(), "unable to lock " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) : fd(-1), valid(false) {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    swap(lock_file, lock.lock_file);
    return *this;
}

fs::path scoped_file_lock::file() const {
    return lock_file;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_file(const fs::path &path, bool shared) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    return scoped_file_lock(path, shared);
}

}  // namespace grader
