#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/python_hooks.hpp"
#include "judge/task_loader.hpp"
#include "test/mock_sandbox.hpp"
#include "test/temp_task.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Return;

class PythonHooksTest : public ::testing::Test {
protected:
    temp_task task;
    mock_sandbox box;
};

TEST_F(PythonHooksTest, CheckScriptTest) {
    task.add("sum.out", "3\n").add("sum.test.py", R"(
def check(result, evaluation):
    result['points'] = 10 if result['success'] else 0
    result['stdout'] = 'tampered'
    return result['stdout_expected'] == '3\n'
)");

    evaluation eval(task.path, box);
    load_task(eval);
    test *t = eval.find_test("sum");
    ASSERT_NE(t, nullptr);
    ASSERT_TRUE(t->check);

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0, "3\n")));

    test_result result = eval.evaluate(*t);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.extra["points"], 10);
    EXPECT_EQ(result.actual_stdout, "3\n");
    EXPECT_FALSE(result.extra.contains("stdout"));
}

TEST_F(PythonHooksTest, CheckScriptWithoutExpectedOutputTest) {
    task.add("only.test.py", R"(
def check(result, evaluation):
    return result['stdout'].strip() == evaluation.meta['answer']
)");

    evaluation eval(task.path, box, {{"answer", "42"}});
    load_task(eval);
    ASSERT_EQ(eval.tests().size(), 1u);

    EXPECT_CALL(box, execute(_))
        .WillOnce(Return(make_run_result(0, "42\n")))
        .WillOnce(Return(make_run_result(0, "41\n")));

    test &t = *eval.find_test("only");
    EXPECT_TRUE(eval.evaluate(t).success);
    EXPECT_FALSE(eval.evaluate(t).success);
}

TEST_F(PythonHooksTest, CheckScriptRaisesTest) {
    task.add("boom.test.py", R"(
def check(result, evaluation):
    raise ValueError('broken checker')
)");

    evaluation eval(task.path, box);
    load_task(eval);

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0)));

    test_result result = eval.evaluate(*eval.find_test("boom"));
    EXPECT_FALSE(result.success);
    ASSERT_FALSE(result.fail_reason.empty());
    EXPECT_EQ(result.fail_reason[0], "check script raised: ValueError: broken checker");
}

TEST_F(PythonHooksTest, CheckScriptNanTest) {
    task.add("nan.test.py", R"(
def check(result, evaluation):
    result['score'] = float('nan')
    return True
)");

    evaluation eval(task.path, box);
    load_task(eval);

    EXPECT_CALL(box, execute(_)).WillOnce(Return(make_run_result(0)));

    test_result result = eval.evaluate(*eval.find_test("nan"));
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.fail_reason.size(), 1u);
    EXPECT_EQ(result.fail_reason[0].rfind("check script raised: ValueError", 0), 0u);
    EXPECT_FALSE(result.extra.contains("score"));
}

TEST_F(PythonHooksTest, BrokenCheckScriptTest) {
    task.add("bad.test.py", "def check(result, evaluation)\n    return True\n");

    evaluation eval(task.path, box);
    EXPECT_THROW(load_task(eval), config_error);
}

TEST_F(PythonHooksTest, GenerateTestsTest) {
    task.add("expected.txt", "generated\n").add("script.py", R"(
def gen_tests(evaluation):
    for i in range(3):
        t = evaluation.create_test('gen%d' % i)
        t.title = 'generated #%d' % i
        t.args = [i, 'x']
        t.set_stdin('%d\n' % i)
        t.set_stdout('%d\n' % (i * 2))
        t.add_filter('rstrip')
        t.set_env('SEED', str(i))
        t.exit_code = 0
    t = evaluation.create_test('file')
    t.add_file_from('out.txt', evaluation.task_file('expected.txt'))
    t.add_file('log.txt', 'ok\n')
    t.stdio_max_bytes = 16
)");

    evaluation eval(task.path, box);
    load_task(eval);

    ASSERT_EQ(eval.tests().size(), 4u);
    test *t = eval.find_test("gen2");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->title(), "generated #2");
    EXPECT_EQ(t->args, vector<string>({"2", "x"}));
    EXPECT_EQ(t->input->read(), "2\n");
    EXPECT_EQ(t->expected_stdout->read(), "4\n");
    EXPECT_EQ(t->filters.size(), 1u);
    EXPECT_EQ(t->env["SEED"], "2");

    test *file = eval.find_test("file");
    ASSERT_EQ(file->files.size(), 2u);
    EXPECT_EQ(file->files[0].expected->read(), "generated\n");
    EXPECT_EQ(file->files[1].expected->read(), "ok\n");
    EXPECT_EQ(file->stdio_max_bytes, 16u);
}

TEST_F(PythonHooksTest, GenerateAfterConfigTest) {
    task.add("config.yml", "tests:\n  - name: configured\n    exit_code: 4\n")
        .add("script.py", R"(
def gen_tests(evaluation):
    names = [t.name for t in evaluation.tests]
    assert names == ['configured'], names
    t = evaluation.create_test('configured')
    assert t.exit_code == 4
)");

    evaluation eval(task.path, box);
    EXPECT_NO_THROW(load_task(eval));
    EXPECT_EQ(eval.tests().size(), 1u);
}

TEST_F(PythonHooksTest, GenerateScriptRaisesTest) {
    task.add("script.py", R"(
def gen_tests(evaluation):
    evaluation.create_test('x').add_filter('no-such-filter')
)");

    evaluation eval(task.path, box);
    EXPECT_THROW(load_task(eval), config_error);
}

TEST_F(PythonHooksTest, GenerateFileOutsideBoxTest) {
    task.add("script.py", R"(
def gen_tests(evaluation):
    evaluation.create_test('escape').add_file('../outside.txt', 'x')
)");

    evaluation eval(task.path, box);
    EXPECT_THROW(load_task(eval), config_error);
}

TEST_F(PythonHooksTest, GenerateMissingFixtureFileTest) {
    task.add("script.py", R"(
def gen_tests(evaluation):
    evaluation.create_test('missing').set_stdout_file(evaluation.task_file('missing.out'))
)");

    evaluation eval(task.path, box);
    EXPECT_THROW(load_task(eval), config_error);
}
