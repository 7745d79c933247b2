#include "common/metadata.hpp"
#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>

namespace grader {
using namespace std;

map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t colon = line.find(':');
        if (colon == string::npos) continue;
        string key = boost::algorithm::trim_copy(line.substr(0, colon));
        string value = boost::algorithm::trim_copy(line.substr(colon + 1));
        boost::algorithm::erase_all(key, "-");
        if (key.empty()) continue;
        mp[key] = value;
    }
    return mp;
}

}  // namespace grader
