#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grader.hpp"
using namespace std;

/**
 * @brief 输出每个阶段的通过情况
 */
static void print_summary(const nlohmann::json &result) {
    for (auto &stage : result) {
        cout << stage.at("name").get<string>() << ": ";
        if (stage.value("fatal", false)) {
            cout << "error: " << stage.value("error", "") << endl;
        } else if (!stage.count("tests")) {
            cout << "compilation failed" << endl
                 << stage.at("compile").value("stderr", "") << endl;
        } else {
            size_t passed = 0, total = stage.at("tests").size();
            for (auto &test : stage.at("tests")) {
                if (test.at("success").get<bool>()) {
                    ++passed;
                } else {
                    cout << endl
                         << "  " << test.at("title").get<string>() << ": "
                         << boost::algorithm::join(test.at("fail_reason").get<vector<string>>(), ", ");
                }
            }
            if (passed != total) cout << endl << "  ";
            cout << passed << "/" << total << " tests passed" << endl;
        }
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task_dir", po::value<string>(), "path to directory with the task")
        ("solution", po::value<string>(), "path to source code in .c or tar")
        ("print-json", "print the full result in JSON instead of a summary")
        ("box-id", po::value<int>(), "set the isolate box id, evaluations running at the same time must use different ids. You can either pass it from environ BOXID")
        ("isolate", po::value<string>(), "set the path of isolate executable. You can either pass it from environ ISOLATE")
        ("compiler", po::value<string>(), "set the compiler used in the sandbox, default to /usr/bin/gcc. You can either pass it from environ COMPILER")
        ("result-dir", po::value<string>(), "set the directory to store result.json")
        ("meta", po::value<vector<string>>(), "pass key=value to task scripts, can be specified multiple times")
        ("debug", "turn on the debug mode to keep the sandbox after evaluation for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("task_dir", 1).add("solution", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: evaluate a C submission against a task in isolate sandbox" << endl
             << "Usage: " << argv[0] << " <task_dir> <solution> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("task_dir") || !vm.count("solution")) {
        cerr << "task_dir and solution are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    if (vm.count("isolate")) {
        grader::ISOLATE_PATH = vm["isolate"].as<string>();
    } else {
        grader::ISOLATE_PATH = grader::get_env("ISOLATE", grader::ISOLATE_PATH.string());
    }

    if (vm.count("compiler")) {
        grader::COMPILER_PATH = vm["compiler"].as<string>();
    } else {
        grader::COMPILER_PATH = grader::get_env("COMPILER", grader::COMPILER_PATH.string());
    }

    try {
        if (vm.count("box-id")) {
            grader::BOX_ID = vm["box-id"].as<int>();
        } else if (getenv("BOXID")) {
            grader::BOX_ID = boost::lexical_cast<int>(getenv("BOXID"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "BOXID should be an integer" << endl;
        return EXIT_FAILURE;
    }

    map<string, string> meta;
    if (vm.count("meta")) {
        for (auto& item : vm["meta"].as<vector<string>>()) {
            size_t pos = item.find('=');
            if (pos == string::npos) {
                cerr << "Malformed --meta " << item << ", expected key=value" << endl;
                return EXIT_FAILURE;
            }
            meta[item.substr(0, pos)] = item.substr(pos + 1);
        }
    }

    filesystem::path result_dir;
    if (vm.count("result-dir")) result_dir = vm["result-dir"].as<string>();

    try {
        nlohmann::json result = grader::evaluate(vm["task_dir"].as<string>(), vm["solution"].as<string>(), result_dir, meta);
        string dumped = result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

        if (!result_dir.empty())
            grader::write_file_content(result_dir / "result.json", dumped);

        if (vm.count("print-json")) {
            cout << dumped << endl;
        } else {
            print_summary(result);
        }
    } catch (grader::grader_exception& e) {
        LOG(ERROR) << "Evaluation failed: " << e;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Evaluation failed: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
