#include "judge/filter.hpp"
#include <boost/algorithm/string.hpp>
#include <map>
#include <mutex>
#include <sstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

filter::~filter() {}

function_filter::function_filter(const string &name, function<string(const string &)> fn)
    : filter_name(name), fn(move(fn)) {}

string function_filter::name() const {
    return filter_name;
}

string function_filter::apply(const string &text) const {
    return fn(text);
}

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    return lines;
}

static string rstrip(const string &text) {
    auto lines = split_lines(text);
    for (auto &line : lines)
        boost::trim_right_if(line, is_blank);
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return boost::join(lines, "\n");
}

static string squeeze(const string &text) {
    string result;
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            if (result.empty() || result.back() != ' ') result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

static string nonempty(const string &text) {
    auto lines = split_lines(text);
    bool trailing_newline = !text.empty() && text.back() == '\n';
    vector<string> kept;
    for (auto &line : lines)
        if (!boost::all(line, is_blank))
            kept.push_back(line);
    string result = boost::join(kept, "\n");
    if (trailing_newline && !result.empty()) result += '\n';
    return result;
}

static string unix_newlines(const string &text) {
    auto lines = split_lines(text);
    for (auto &line : lines)
        boost::trim_right_if(line, boost::is_any_of("\r"));
    return boost::join(lines, "\n");
}

static map<string, filter_ptr> &filter_registry() {
    static map<string, filter_ptr> registry = [] {
        map<string, filter_ptr> builtin;
        auto add = [&](const string &name, function<string(const string &)> fn) {
            builtin[name] = make_shared<function_filter>(name, move(fn));
        };
        add("rstrip", rstrip);
        add("trim", [](const string &text) { return boost::trim_copy(text); });
        add("lower", [](const string &text) { return boost::to_lower_copy(text); });
        add("squeeze", squeeze);
        add("nonempty", nonempty);
        add("unix", unix_newlines);
        return builtin;
    }();
    return registry;
}

static mutex registry_mutex;

void register_filter(filter_ptr f) {
    lock_guard<mutex> guard(registry_mutex);
    filter_registry()[boost::to_lower_copy(f->name())] = move(f);
}

filter_ptr find_filter(const string &name) {
    lock_guard<mutex> guard(registry_mutex);
    auto &registry = filter_registry();
    auto it = registry.find(boost::to_lower_copy(name));
    if (it == registry.end())
        throw config_error("unknown filter " + name);
    return it->second;
}

string apply_filters(const string &text, const vector<filter_ptr> &filters) {
    string result = text;
    for (auto &f : filters)
        result = f->apply(result);
    return result;
}

bool compare(const string &actual, const string &expected, const vector<filter_ptr> &filters) {
    return apply_filters(actual, filters) == apply_filters(expected, filters);
}

}  // namespace grader
