#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<string, run_status> status_code = boost::assign::map_list_of
    ("", run_status::OK)
    ("RE", run_status::RUNTIME_ERROR)
    ("SG", run_status::SIGNALED)
    ("TO", run_status::TIME_LIMIT_EXCEEDED)
    ("XX", run_status::INTERNAL_ERROR);

static const unordered_map<run_status, const char *> status_string = boost::assign::map_list_of
    (run_status::OK, "ok")
    (run_status::RUNTIME_ERROR, "runtime error")
    (run_status::SIGNALED, "killed by signal")
    (run_status::TIME_LIMIT_EXCEEDED, "time limit exceeded")
    (run_status::INTERNAL_ERROR, "sandbox internal error");
// clang-format on

run_status parse_run_status(const string &code) {
    auto it = status_code.find(code);
    return it == status_code.end() ? run_status::INTERNAL_ERROR : it->second;
}

const char *get_display_message(run_status stat) {
    return status_string.at(stat);
}

}  // namespace grader
