#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

stage::~stage() {}

bool is_archive(const string &header) {
    if (header.size() >= 2 && (unsigned char)header[0] == 0x1f && (unsigned char)header[1] == 0x8b)
        return true;
    return header.size() >= 262 && header.compare(257, 5, "ustar") == 0;
}

static string read_header(sandbox &box, const string &path) {
    ifstream fin = box.open(path);
    string header(512, '\0');
    fin.read(header.data(), header.size());
    header.resize(fin.gcount());
    return header;
}

download_stage::download_stage(const fs::path &submission) : submission(submission) {}

optional<stage_result> download_stage::run(evaluation &eval) {
    sandbox &box = eval.box;
    try {
        if (!submission.empty())
            box.copy(submission, "submit");
        if (is_archive(read_header(box, "submit"))) {
            LOG(INFO) << "Extracting submission archive";
            box.run_checked({"tar", "-xf", "submit"});
        } else {
            fs::rename(box.system_path("submit"), box.system_path("submit.c"));
        }
    } catch (sandbox_error &e) {
        LOG(ERROR) << "Unable to extract submission: " << e.what() << endl << e.output;
        stage_result result;
        result.success = false;
        result.fatal = true;
        result.error = "unable to extract submission: " + e.output;
        return result;
    } catch (fs::filesystem_error &e) {
        LOG(ERROR) << "Unable to install submission: " << e.what();
        stage_result result;
        result.success = false;
        result.fatal = true;
        result.error = string("unable to install submission: ") + e.what();
        return result;
    }
    return nullopt;
}

build_stage::build_stage(const vector<string> &flags) : flags(flags) {}

optional<stage_result> build_stage::run(evaluation &eval) {
    stage_result result;
    result.compilation = eval.box.compile(flags);
    if (result.compilation->exit_code != 0) {
        LOG(INFO) << "Compilation failed: " << result.compilation->command;
        result.success = false;
        return result;
    }

    result.tests.emplace();
    for (test *t : eval.tests()) {
        test_result r = eval.evaluate(*t);
        result.success = result.success && r.success;
        result.tests->push_back(move(r));
    }
    return result;
}

}  // namespace grader
