#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/evaluation.hpp"
#include "test/mock_sandbox.hpp"
#include "test/temp_task.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class EvaluationTest : public ::testing::Test {
protected:
    temp_task task;
    mock_sandbox box;
};

TEST_F(EvaluationTest, CreateTestFromFixturesTest) {
    task.add("sum.in", "1 2\n").add("sum.out", "3\n");
    evaluation eval(task.path, box);

    test &t = eval.create_test("sum");
    ASSERT_TRUE(t.input);
    ASSERT_TRUE(t.expected_stdout);
    EXPECT_FALSE(t.expected_stderr);
    EXPECT_EQ(t.input->read(), "1 2\n");
    EXPECT_EQ(t.expected_stdout->name, "sum.out");
    EXPECT_EQ(t.title(), "sum");
}

TEST_F(EvaluationTest, DuplicateCreateTestTest) {
    evaluation eval(task.path, box);
    int created = 0;
    eval.on_test_created([&](test &) { ++created; });

    test &first = eval.create_test("a");
    first.exit_code = 2;
    test &second = eval.create_test("a");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.exit_code, 2);
    EXPECT_EQ(created, 1);
    EXPECT_EQ(eval.tests().size(), 1u);
}

TEST_F(EvaluationTest, RegistrationOrderTest) {
    evaluation eval(task.path, box);
    eval.create_test("b");
    eval.create_test("a");
    eval.create_test("c");

    vector<string> names;
    for (test *t : eval.tests()) names.push_back(t->name);
    EXPECT_EQ(names, vector<string>({"b", "a", "c"}));
    EXPECT_EQ(eval.find_test("a")->name, "a");
    EXPECT_EQ(eval.find_test("d"), nullptr);
}

TEST_F(EvaluationTest, AcceptedTest) {
    task.add("sum.in", "1 2\n").add("sum.out", "3\n");
    evaluation eval(task.path, box);
    test &t = eval.create_test("sum");

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(0, "3\n", "", {{"exitcode", "0"}, {"timewall", "0.010"}});
        }));

    test_result result = eval.evaluate(t);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.fail_reason.empty());
    EXPECT_EQ(result.actual_stdout, "3\n");
    EXPECT_EQ(*result.input, "1 2\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.usage["timewall"], "0.010");
    EXPECT_EQ(result.usage.count("exitcode"), 0u);
    EXPECT_EQ(result.command, "./main < sum.in");

    EXPECT_EQ(request.command, vector<string>({"./main"}));
    EXPECT_EQ(request.stdin_file, task.path / "sum.in");
    EXPECT_FALSE(request.full_env);
    EXPECT_EQ(request.limits, resource_limits().to_flags());
}

TEST_F(EvaluationTest, WrongAnswerTest) {
    task.add("sum.out", "3\n");
    evaluation eval(task.path, box);
    test &t = eval.create_test("sum");

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0, "3 \n")));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fail_reason, vector<string>({"stdout not matches"}));
    EXPECT_EQ(result.command, "./main");
}

TEST_F(EvaluationTest, TaskAndTestFiltersComposeTest) {
    task.add("sum.out", "Hello World\n");
    evaluation eval(task.path, box);
    eval.filters.push_back(find_filter("rstrip"));
    test &t = eval.create_test("sum");
    t.filters.push_back(find_filter("lower"));

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0, "hello world  \n\n")));

    EXPECT_TRUE(eval.evaluate(t).success);
}

TEST_F(EvaluationTest, NoExpectedStdoutTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("anything");

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0, "whatever\n", "noise\n")));

    test_result result = eval.evaluate(t);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.expected_stdout);
    EXPECT_FALSE(result.input);
}

TEST_F(EvaluationTest, ExitCodeTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("ret");
    t.exit_code = 3;

    // isolate 自身的返回值和 metadata 中的返回值不同时以 metadata 为准
    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(1, "", "", {{"exitcode", "1"}, {"status", "RE"}})));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.fail_reason, vector<string>({"exit code 1, expected 3"}));
}

TEST_F(EvaluationTest, ExitCodeFromMetadataTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("ret");
    t.exit_code = 3;

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(1, "", "", {{"exitcode", "3"}, {"status", "RE"}})));

    test_result result = eval.evaluate(t);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(EvaluationTest, TimeLimitTest) {
    evaluation eval(task.path, box);
    eval.limits.set("wall-time", 0.1);
    test &t = eval.create_test("sleep");

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(1, "", "", {{"status", "TO"}, {"message", "Time limit exceeded (wall clock)"}, {"killed", "1"}});
        }));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    ASSERT_FALSE(result.fail_reason.empty());
    EXPECT_EQ(result.fail_reason[0], "time limit exceeded (Time limit exceeded (wall clock))");
    EXPECT_EQ(request.limits[0], make_pair(string("wall-time"), string("0.1")));
}

TEST_F(EvaluationTest, SignaledTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("crash");

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(1, "", "", {{"status", "SG"}, {"exitsig", "11"}})));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fail_reason[0], "killed by signal 11");
}

TEST_F(EvaluationTest, TruncateOutputTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("flood");
    t.stdio_max_bytes = 4;

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(0, "aaaaaaaa", "bbbbbbbb");
        }));

    test_result result = eval.evaluate(t);
    EXPECT_EQ(request.max_output, 4u);
    EXPECT_EQ(result.actual_stdout, "aaaa");
    EXPECT_EQ(result.actual_stderr, "bbbb");
}

TEST_F(EvaluationTest, TextStdinTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("echo");
    t.input = make_unique<text_fixture>("echo.in", "hello\n");
    t.args = {"a b"};

    filesystem::path stdin_file;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            stdin_file = r.stdin_file;
            EXPECT_EQ(read_file_content(r.stdin_file), "hello\n");
            return make_run_result(0, "hello\n");
        }));

    test_result result = eval.evaluate(t);
    EXPECT_EQ(result.command, "./main 'a b' < echo.in");
    EXPECT_FALSE(stdin_file.empty());
    EXPECT_FALSE(filesystem::exists(stdin_file));
}

TEST_F(EvaluationTest, EnvOverrideTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("env");
    t.env = {{"A", "1"}, {"B", "2"}};

    run_request request;
    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &r) {
            request = r;
            return make_run_result(0);
        }));

    test_result result = eval.evaluate(t, {{"B", "3"}}, "with env");
    EXPECT_EQ(request.env, (map<string, string>{{"A", "1"}, {"B", "3"}}));
    EXPECT_EQ(result.title, "with env");
}

TEST_F(EvaluationTest, ExpectedFileTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("files");
    t.files.push_back({"out.txt", make_unique<text_fixture>("out.txt", "result\n")});
    t.files.push_back({"missing.txt", make_unique<text_fixture>("missing.txt", "x")});

    EXPECT_CALL(box, execute(_))
        .WillOnce(Invoke([&](const run_request &) {
            box.write("out.txt", "result\n");
            return make_run_result(0);
        }));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_TRUE(result.files[0].success);
    EXPECT_EQ(*result.files[0].content, "result\n");
    EXPECT_FALSE(result.files[1].success);
    EXPECT_EQ(result.files[1].error, "file not found");
    EXPECT_FALSE(result.files[1].content);
    EXPECT_EQ(result.fail_reason, vector<string>({"file missing.txt not found"}));
}

TEST_F(EvaluationTest, CheckerTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("custom");
    t.check = [](const test_result &result, nlohmann::json &extra, evaluation &) {
        extra["points"] = 5;
        return result.actual_stdout.find("42") != string::npos;
    };

    EXPECT_CALL(box, execute(_))
        .WillOnce(Return(make_run_result(0, "the answer is 42\n")))
        .WillOnce(Return(make_run_result(0, "no answer\n")));

    test_result passed = eval.evaluate(t);
    EXPECT_TRUE(passed.success);
    EXPECT_EQ(passed.extra["points"], 5);

    test_result failed = eval.evaluate(t);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.fail_reason, vector<string>({"custom check failed"}));
}

TEST_F(EvaluationTest, CheckerErrorTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("custom");
    t.check = [](const test_result &, nlohmann::json &, evaluation &) -> bool {
        throw check_error("checker exploded");
    };

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0)));

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fail_reason, vector<string>({"checker exploded"}));
}

TEST_F(EvaluationTest, ExpectedFileOutsideBoxTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("escape");
    t.files.push_back({"../../etc/passwd", make_unique<text_fixture>("passwd", "x")});

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0)));

    test_result result;
    ASSERT_NO_THROW(result = eval.evaluate(t));
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_FALSE(result.files[0].success);
    EXPECT_EQ(result.files[0].error, "path not allowed");
    EXPECT_EQ(result.fail_reason, vector<string>({"file ../../etc/passwd not allowed"}));
}

TEST_F(EvaluationTest, MissingExpectedFixtureTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("gone");
    t.expected_stdout = make_unique<file_fixture>(task.path / "gone.out");
    t.files.push_back({"out.txt", make_unique<file_fixture>(task.path / "out.expected")});

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0, "x\n")));

    test_result result;
    ASSERT_NO_THROW(result = eval.evaluate(t));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.expected_stdout);
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files[0].error, "expected content not found");
    EXPECT_EQ(result.fail_reason,
              vector<string>({"expected stdout gone.out not found", "expected file out.expected not found"}));
}

TEST_F(EvaluationTest, MissingStdinFixtureTest) {
    evaluation eval(task.path, box);
    test &t = eval.create_test("nostdin");
    t.input = make_unique<file_fixture>(task.path / "nostdin.in");

    EXPECT_CALL(box, execute(_)).Times(0);

    test_result result = eval.evaluate(t);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fail_reason, vector<string>({"stdin nostdin.in not found"}));
    EXPECT_EQ(result.command, "./main < nostdin.in");
}

TEST_F(EvaluationTest, UnsafeTaskFileTest) {
    evaluation eval(task.path, box);
    EXPECT_EQ(eval.task_file("data/1.in"), task.path / "data/1.in");
    EXPECT_THROW(eval.task_file("../other/1.in"), runtime_error);
}
