#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/engine.hpp"
#include "judge/protocol.hpp"
#include "test/assertions.hpp"
#include "test/mock_runner.hpp"

using namespace std;
using namespace codejudge;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class EngineTest : public ::testing::Test {
protected:
    language_registry languages;
    sandbox::mock::runner runner;

    submission prepare(const string &language = "python") {
        submission submit;
        submit.source_code = "print(input())";
        submit.language = language;
        submit.test_cases.push_back({"5", "5"});
        submit.test_cases.push_back({"6", "7"});
        return submit;
    }

    static string record_line(size_t index, status declared, const string &output, const string &error = "") {
        test_case_record record;
        record.index = index;
        record.output = output;
        record.error = error;
        record.declared = declared;
        record.time = 0.05;
        return encode_record(record);
    }

    static sandbox::sandbox_invocation invocation(const string &output, const string &error = "", int exit_code = 0) {
        sandbox::sandbox_invocation result;
        result.output = output;
        result.error = error;
        result.exit_code = exit_code;
        return result;
    }
};

TEST_F(EngineTest, JudgeTest) {
    string output = string(RESULTS_START_MARKER) + "\n" +
                    record_line(1, status::SUCCESS, "5\n") + "\n" +
                    record_line(2, status::SUCCESS, "6\n") + "\n" +
                    RESULTS_END_MARKER + "\n";
    EXPECT_CALL(runner, execute(_, _, HasSubstr(string(TEST_CASE_RESULT_MARKER))))
        .WillOnce(Return(invocation(output)));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].test_case_number, 1u);
    EXPECT_STATUS_EQ(results[0].stat, status::SUCCESS);
    EXPECT_TRUE(results[0].passed);
    EXPECT_EQ(results[0].actual_output, "5\n");
    EXPECT_DOUBLE_EQ(results[0].time_taken, 0.05);
    EXPECT_EQ(results[1].test_case_number, 2u);
    EXPECT_STATUS_EQ(results[1].stat, status::SUCCESS);
    EXPECT_FALSE(results[1].passed);
    EXPECT_EQ(results[1].expected_output, "7");
}

TEST_F(EngineTest, InvalidSubmissionTest) {
    EXPECT_CALL(runner, execute(_, _, _)).Times(0);

    engine judge(languages, runner);
    auto submit = prepare();
    submit.test_cases.clear();
    EXPECT_THROW(judge.run_batch(submit), invalid_submission);

    submit = prepare();
    submit.source_code = "";
    EXPECT_THROW(judge.run_batch(submit), invalid_submission);

    submit = prepare();
    submit.time_limit = -1;
    EXPECT_THROW(judge.run_batch(submit), invalid_submission);
}

TEST_F(EngineTest, UnsupportedLanguageTest) {
    EXPECT_CALL(runner, execute(_, _, _)).Times(0);

    engine judge(languages, runner);
    EXPECT_THROW(judge.run_batch(prepare("cobol")), unsupported_language);
}

TEST_F(EngineTest, CompilationErrorTest) {
    EXPECT_CALL(runner, execute(_, _, _))
        .WillOnce(Return(invocation(encode_compilation_error("solution.cpp:1:1: error: expected ';'") + "\n")));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare("cpp"));
    ASSERT_EQ(results.size(), 2u);
    for (auto &result : results) {
        EXPECT_STATUS_EQ(result.stat, status::COMPILATION_ERROR);
        EXPECT_FALSE(result.passed);
        EXPECT_EQ(result.actual_output, "");
        EXPECT_THAT(result.error_message, HasSubstr("expected ';'"));
    }
}

TEST_F(EngineTest, InfrastructureErrorTest) {
    EXPECT_CALL(runner, execute(_, _, _))
        .WillOnce(Throw(infrastructure_error("sandbox exited with code 125: Unable to find image")));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare());
    ASSERT_EQ(results.size(), 2u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].test_case_number, i + 1);
        EXPECT_STATUS_EQ(results[i].stat, status::INTERNAL_ERROR);
        EXPECT_FALSE(results[i].passed);
        EXPECT_THAT(results[i].error_message, HasSubstr("Unable to find image"));
    }
    EXPECT_EQ(results[1].input, "6");
}

TEST_F(EngineTest, NetworkErrorTest) {
    EXPECT_CALL(runner, execute(_, _, _))
        .WillOnce(Throw(network_error("unable to reach runner service")));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_STATUS_EQ(results[0].stat, status::INTERNAL_ERROR);
    EXPECT_STATUS_EQ(results[1].stat, status::INTERNAL_ERROR);
}

TEST_F(EngineTest, SandboxCrashTest) {
    EXPECT_CALL(runner, execute(_, _, _))
        .WillOnce(Return(invocation("", "runtime/cgo: pthread_create failed: Resource temporarily unavailable\n", 2)));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare());
    ASSERT_EQ(results.size(), 2u);
    for (auto &result : results) {
        EXPECT_STATUS_EQ(result.stat, status::INTERNAL_ERROR);
        EXPECT_THAT(result.error_message, HasSubstr("pthread_create failed"));
    }
}

TEST_F(EngineTest, WatchdogTest) {
    auto killed = invocation(string(RESULTS_START_MARKER) + "\n" + record_line(1, status::SUCCESS, "5\n") + "\n", "", -1);
    killed.timed_out = true;
    EXPECT_CALL(runner, execute(_, _, _)).WillOnce(Return(killed));

    engine judge(languages, runner);
    auto results = judge.run_batch(prepare());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].passed);
    EXPECT_STATUS_EQ(results[1].stat, status::INTERNAL_ERROR);
    EXPECT_FALSE(results[1].passed);
}
