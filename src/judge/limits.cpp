#include "judge/limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cmath>

namespace grader {
using namespace std;

// 整数限制的上限，保证转换为 long 不溢出
static constexpr double MAX_INTEGRAL_LIMIT = 1e15;

static bool integral_limit(const string &name) {
    return name != "wall-time" && name != "time";
}

bool resource_limits::set(const string &name, double value) {
    if (!std::isfinite(value) || value < 0 || (integral_limit(name) && value > MAX_INTEGRAL_LIMIT)) {
        LOG(ERROR) << "invalid value " << value << " for limit " << name;
        return false;
    }

    if (name == "wall-time")
        wall_time = value;
    else if (name == "time")
        time = value;
    else if (name == "processes")
        processes = (long)value;
    else if (name == "stack")
        stack = (long)value;
    else if (name == "cg-mem")
        cg_mem = (long)value;
    else if (name == "fsize")
        fsize = (long)value;
    else {
        LOG(ERROR) << "unknown limit " << name;
        return false;
    }
    return true;
}

vector<pair<string, string>> resource_limits::to_flags() const {
    return {
        {"wall-time", fmt::format("{}", wall_time)},
        {"time", fmt::format("{}", time)},
        {"processes", to_string(processes)},
        {"stack", to_string(stack)},
        {"cg-mem", to_string(cg_mem)},
        {"fsize", to_string(fsize)},
    };
}

}  // namespace grader
