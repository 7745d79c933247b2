#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/pipeline.hpp"
#include "test/mock_sandbox.hpp"
#include "test/temp_task.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class PipelineTest : public ::testing::Test {
protected:
    temp_task task;
    mock_sandbox box;
};

static string tar_header() {
    string header(512, '\0');
    header.replace(0, 6, "main.c");
    header.replace(257, 6, string("ustar\0", 6));
    return header;
}

TEST_F(PipelineTest, IsArchiveTest) {
    EXPECT_TRUE(is_archive(tar_header()));
    EXPECT_TRUE(is_archive("\x1f\x8b\x08\x00"));
    EXPECT_FALSE(is_archive("#include <stdio.h>\nint main() {}\n"));
    EXPECT_FALSE(is_archive(""));
}

TEST_F(PipelineTest, DownloadSourceTest) {
    task.add("main.c", "int main() { return 0; }\n");
    evaluation eval(task.path, box);

    EXPECT_CALL(box, execute(_)).Times(0);
    download_stage download(task.path / "main.c");
    EXPECT_FALSE(download.run(eval));
    EXPECT_EQ(box.read("submit.c"), "int main() { return 0; }\n");
    EXPECT_FALSE(box.exists("submit"));
}

TEST_F(PipelineTest, DownloadMissingSubmissionTest) {
    evaluation eval(task.path, box);

    EXPECT_CALL(box, execute(_)).Times(0);
    download_stage download(task.path / "no-such-submission.c");
    optional<stage_result> result;
    ASSERT_NO_THROW(result = download.run(eval));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->fatal);
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error.rfind("unable to install submission: ", 0), 0u);
    EXPECT_FALSE(box.exists("submit.c"));
}

TEST_F(PipelineTest, DownloadArchiveTest) {
    box.write("submit", tar_header());
    evaluation eval(task.path, box);

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(0);
        }));

    download_stage download;
    EXPECT_FALSE(download.run(eval));
    EXPECT_EQ(request.command, vector<string>({"tar", "-xf", "submit"}));
    EXPECT_TRUE(request.full_env);
}

TEST_F(PipelineTest, DownloadBrokenArchiveTest) {
    box.write("submit", tar_header());
    evaluation eval(task.path, box);

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(2, "", "tar: Unexpected EOF in archive")));

    download_stage download;
    auto result = download.run(eval);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->fatal);
    EXPECT_FALSE(result->success);
    EXPECT_NE(result->error.find("Unexpected EOF"), string::npos);
}

TEST_F(PipelineTest, CompileFailureTest) {
    task.add("sum.out", "3\n");
    box.write("submit.c", "int main( {\n");
    evaluation eval(task.path, box);
    eval.create_test("sum");

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(1, "", "submit.c:1:11: error: expected declaration");
        }));

    build_stage build;
    auto result = build.run(eval);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->success);
    EXPECT_FALSE(result->tests);
    ASSERT_TRUE(result->compilation);
    EXPECT_EQ(result->compilation->exit_code, 1);
    EXPECT_EQ(result->compilation->command,
              COMPILER_PATH.string() + " submit.c -o main -g -lm -Wall -pedantic");
    EXPECT_EQ(request.command[0], COMPILER_PATH.string());
}

TEST_F(PipelineTest, BuildAndRunTest) {
    task.add("a.out", "1\n").add("b.out", "2\n");
    box.write("submit.c", "");
    box.write("util.c", "");
    evaluation eval(task.path, box);
    eval.create_test("b");
    eval.create_test("a");

    vector<vector<string>> commands;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            commands.push_back(r.command);
            return make_run_result(0);
        }))
        .WillOnce(Invoke([&](const run_request &r) {
            commands.push_back(r.command);
            return make_run_result(0, "2\n");
        }))
        .WillOnce(Invoke([&](const run_request &r) {
            commands.push_back(r.command);
            return make_run_result(0, "wrong\n");
        }));

    build_stage build({"-fsanitize=address"});
    auto result = build.run(eval);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->success);
    ASSERT_TRUE(result->tests);
    ASSERT_EQ(result->tests->size(), 2u);
    EXPECT_EQ(result->tests->at(0).name, "b");
    EXPECT_TRUE(result->tests->at(0).success);
    EXPECT_EQ(result->tests->at(1).name, "a");
    EXPECT_FALSE(result->tests->at(1).success);

    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], vector<string>({COMPILER_PATH.string(), "submit.c", "util.c", "-o", "main", "-g", "-lm",
                                           "-Wall", "-pedantic", "-fsanitize=address"}));
    EXPECT_EQ(commands[1], vector<string>({"./main"}));
}
