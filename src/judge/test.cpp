#include "judge/test.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

test::test(const string &name)
    : name(name), stdio_max_bytes(DEFAULT_STDIO_MAX_BYTES) {}

string test::title() const {
    return custom_title.empty() ? name : custom_title;
}

void test::set_title(const string &title) {
    custom_title = title;
}

}  // namespace grader
