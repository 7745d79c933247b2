#include "grader.hpp"
#include <glog/logging.h>
#include <memory>
#include <utility>
#include <vector>
#include "config.hpp"
#include "judge/evaluation.hpp"
#include "judge/pipeline.hpp"
#include "judge/task_loader.hpp"
#include "sandbox/isolate.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

json evaluate(const fs::path &task_path, const fs::path &submission_path, const fs::path &result_path, const map<string, string> &meta) {
    if (!result_path.empty())
        fs::create_directories(result_path);

    isolate_sandbox box(BOX_ID);
    box.init();

    evaluation eval(task_path, box, meta);
    load_task(eval);

    LOG(INFO) << "Evaluating " << submission_path;

    vector<pair<string, unique_ptr<stage>>> pipeline;
    pipeline.emplace_back("download", make_unique<download_stage>(submission_path));
    pipeline.emplace_back("normal run", make_unique<build_stage>());
    pipeline.emplace_back("run with sanitizer", make_unique<build_stage>(vector<string>{"-fsanitize=address", "-fsanitize=bounds", "-fsanitize=undefined"}));

    json result = json::array();
    for (auto &[name, s] : pipeline) {
        LOG(INFO) << "Executing " << name;
        optional<stage_result> r = s->run(eval);
        if (!r) continue;

        json j = *r;
        j["name"] = name;
        result.push_back(j);

        if (r->fatal) {
            LOG(ERROR) << "Stage " << name << " failed: " << r->error;
            break;
        }
    }
    return result;
}

}  // namespace grader
