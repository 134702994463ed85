#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/driver_script.hpp"
#include "judge/protocol.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace codejudge;
namespace fs = std::filesystem;

class DriverScriptTest : public ::testing::Test {
protected:
    language_profile shell{"shell", "solution.sh", "solution.sh", "alpine:3", nullopt, "sh {source}"};

    language_profile checked_shell{"checked-shell", "solution.sh", "program.sh", "alpine:3",
                                   string("sh -n {source} && cp {source} {executable}"), "sh {executable}"};

    string saved_user;
    size_t saved_output_limit;

    void SetUp() override {
        saved_user = SANDBOX_USER;
        saved_output_limit = OUTPUT_LIMIT;
        // 直接在宿主机上运行时不切换用户
        SANDBOX_USER = "";
    }

    void TearDown() override {
        SANDBOX_USER = saved_user;
        OUTPUT_LIMIT = saved_output_limit;
    }

    /**
     * @brief 直接在宿主机上运行驱动脚本，返回解析后的输出
     */
    protocol_result run_script(const language_profile &profile, const string &code, const vector<test_case> &test_cases, int time_limit = 2) {
        scoped_directory workdir(fs::temp_directory_path() / ("codejudge-driver-" + boost::uuids::to_string(boost::uuids::random_generator()())));
        fs::create_directories(workdir.path() / PROGRAM_DIRECTORY);
        write_file_content(workdir.path() / PROGRAM_DIRECTORY / profile.source_file, code);
        fs::create_directories(workdir.path() / "tests");
        for (size_t i = 0; i < test_cases.size(); ++i)
            write_file_content(workdir.path() / "tests" / (to_string(i + 1) + ".in"), test_cases[i].input);
        fs::path script = workdir.path() / "run_script.sh";
        write_file_content(script, generate_driver_script(profile, profile.language, time_limit));

        auto result = capture_process(chrono::seconds(30), 1 << 20, "/bin/sh", script);
        EXPECT_EQ(result.exit_code, 0) << result.error;
        return parse_protocol(result.output);
    }
};

TEST_F(DriverScriptTest, QuoteTest) {
    EXPECT_EQ(shell_script::quote("solution.cpp"), "'solution.cpp'");
    EXPECT_EQ(shell_script::quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_script::quote("$(reboot)"), "'$(reboot)'");
    EXPECT_EQ(shell_script::quote(""), "''");
}

TEST_F(DriverScriptTest, AssignTest) {
    shell_script script;
    script.assign("LANGUAGE", "c++; reboot").assign("TIME_LIMIT", 2);
    EXPECT_EQ(script.str(), "LANGUAGE='c++; reboot'\nTIME_LIMIT=2\n");

    EXPECT_THROW(script.assign("1ABC", "x"), invalid_argument);
    EXPECT_THROW(script.assign("A-B", "x"), invalid_argument);
    EXPECT_THROW(script.assign("A=$(reboot)", 1), invalid_argument);
}

TEST_F(DriverScriptTest, RenderCommandTest) {
    language_profile cpp{"cpp", "solution.cpp", "a.out", "gcc:10", nullopt, "./{executable}"};
    EXPECT_EQ(render_command("g++ {source} -o {executable}", cpp), "g++ 'solution.cpp' -o 'a.out'");
    EXPECT_EQ(render_command("./{executable}", cpp), "./'a.out'");
    EXPECT_THROW(render_command("g++ {output}", cpp), invalid_argument);
    EXPECT_THROW(render_command("g++ {source", cpp), invalid_argument);
}

TEST_F(DriverScriptTest, GenerateScriptTest) {
    string script = generate_driver_script(checked_shell, "checked-shell", 3);
    EXPECT_EQ(script.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_NE(script.find("TIME_LIMIT=3\n"), string::npos);
    EXPECT_NE(script.find(COMPILATION_ERROR_MARKER), string::npos);
    EXPECT_NE(script.find(RESULTS_START_MARKER), string::npos);
    EXPECT_NE(script.find(TEST_CASE_RESULT_MARKER), string::npos);
    EXPECT_NE(script.find(RESULTS_END_MARKER), string::npos);
    EXPECT_NE(script.find("timeout -k 1"), string::npos);
    EXPECT_NE(script.find("RUN_AS=''\n"), string::npos);
    EXPECT_EQ(script.find("expected_output"), string::npos);

    SANDBOX_USER = "65534:65534";
    string dropping = generate_driver_script(checked_shell, "checked-shell", 3);
    EXPECT_NE(dropping.find("RUN_AS='65534:65534'\n"), string::npos);
    EXPECT_NE(dropping.find("setpriv"), string::npos);

    string interpreted = generate_driver_script(shell, "shell", 3);
    EXPECT_EQ(interpreted.find(COMPILATION_ERROR_MARKER), string::npos);
}

TEST_F(DriverScriptTest, RejectInvalidArgumentsTest) {
    EXPECT_THROW(generate_driver_script(shell, "shell", 0), invalid_argument);
    EXPECT_THROW(generate_driver_script(shell, "python", 2), invalid_argument);

    auto unsafe = shell;
    unsafe.source_file = "a b.sh";
    EXPECT_THROW(generate_driver_script(unsafe, "shell", 2), invalid_argument);

    SANDBOX_USER = "nobody; reboot";
    EXPECT_THROW(generate_driver_script(shell, "shell", 2), invalid_argument);
}

TEST_F(DriverScriptTest, RunTestCasesTest) {
    auto result = run_script(shell, "read x\necho \"$x\"\n", {{"5", "5"}, {"it's $HOME", "it's $HOME"}, {"7", "8"}});
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.ended);
    EXPECT_FALSE(result.compilation_error);
    ASSERT_EQ(result.records.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(result.records[i].valid()) << result.records[i].schema_error;
        EXPECT_EQ(result.records[i].index, i + 1);
        EXPECT_STATUS_EQ(result.records[i].declared, status::SUCCESS);
        EXPECT_GE(result.records[i].time, 0);
    }
    EXPECT_EQ(result.records[0].output, "5\n");
    EXPECT_EQ(result.records[1].output, "it's $HOME\n");
    EXPECT_EQ(result.records[2].output, "7\n");
    for (auto &record : result.records)
        EXPECT_FALSE(record.output_limit_exceeded);
}

TEST_F(DriverScriptTest, OutputLimitTest) {
    OUTPUT_LIMIT = 16;
    auto result = run_script(shell, "echo abc\nprintf '%040d' 0\necho WRONG\n", {{"", "abc"}, {"", "abc"}});
    ASSERT_EQ(result.records.size(), 2u);
    for (auto &record : result.records) {
        ASSERT_TRUE(record.valid()) << record.schema_error;
        EXPECT_STATUS_EQ(record.declared, status::SUCCESS);
        EXPECT_TRUE(record.output_limit_exceeded);
        EXPECT_EQ(record.output.size(), 16u);
    }
}

TEST_F(DriverScriptTest, OutputAtLimitTest) {
    OUTPUT_LIMIT = 4;
    auto result = run_script(shell, "echo abc\n", {{"", "abc"}});
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_FALSE(result.records[0].output_limit_exceeded);
    EXPECT_EQ(result.records[0].output, "abc\n");
}

TEST_F(DriverScriptTest, RuntimeErrorTest) {
    auto result = run_script(shell, "echo partial\necho 'Segmentation fault' >&2\nexit 139\n", {{"", ""}});
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_STATUS_EQ(result.records[0].declared, status::RUNTIME_ERROR);
    EXPECT_EQ(result.records[0].exit_code, 139);
    EXPECT_EQ(result.records[0].output, "partial\n");
    EXPECT_EQ(result.records[0].error, "Segmentation fault\n");
}

TEST_F(DriverScriptTest, TimeLimitTest) {
    auto result = run_script(shell, "sleep 5\n", {{"", ""}}, 1);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_STATUS_EQ(result.records[0].declared, status::TIME_LIMIT_EXCEEDED);
    EXPECT_GE(result.records[0].time, 1.0);
    EXPECT_LT(result.records[0].time, 4.0);
}

TEST_F(DriverScriptTest, CompilationErrorTest) {
    auto result = run_script(checked_shell, "if then fi (\n", {{"1", "1"}, {"2", "2"}});
    EXPECT_FALSE(result.started);
    EXPECT_TRUE(result.records.empty());
    ASSERT_TRUE(result.compilation_error);
    EXPECT_FALSE(result.compilation_error->empty());
}

TEST_F(DriverScriptTest, CompiledProgramTest) {
    auto result = run_script(checked_shell, "echo compiled\n", {{"", "compiled"}});
    EXPECT_FALSE(result.compilation_error);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_STATUS_EQ(result.records[0].declared, status::SUCCESS);
    EXPECT_EQ(result.records[0].output, "compiled\n");
}
