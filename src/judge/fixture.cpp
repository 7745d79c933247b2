#include "judge/fixture.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

fixture::fixture(const string &name)
    : name(name) {}

fixture::~fixture() {}

filesystem::path fixture::path() const {
    return {};
}

file_fixture::file_fixture(const filesystem::path &file)
    : fixture(file.filename().string()), file(file) {}

string file_fixture::read() const {
    return read_file_content(file);
}

filesystem::path file_fixture::path() const {
    return file;
}

text_fixture::text_fixture(const string &name, const string &text)
    : fixture(name), text(text) {}

string text_fixture::read() const {
    return text;
}

}  // namespace grader
