#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/protocol.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace codejudge;

TEST(ProtocolTest, NormalizeTimeTest) {
    EXPECT_EQ(normalize_time(".482"), "0.482");
    EXPECT_EQ(normalize_time("0.482"), "0.482");
    EXPECT_EQ(normalize_time("1.5"), "1.500");
    EXPECT_EQ(normalize_time("2"), "2.000");
    EXPECT_EQ(normalize_time(" 0.125\n"), "0.125");
}

TEST(ProtocolTest, MalformedTimeTest) {
    EXPECT_THROW(normalize_time(""), protocol_error);
    EXPECT_THROW(normalize_time("."), protocol_error);
    EXPECT_THROW(normalize_time("abc"), protocol_error);
    EXPECT_THROW(normalize_time("-1"), protocol_error);
    EXPECT_THROW(normalize_time("1.2.3"), protocol_error);
}

TEST(ProtocolTest, ParseRecordTest) {
    auto record = parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"NQo=","stderr":"","status":"Success","time":0.482,"memory":0,"exit_code":0})");
    EXPECT_TRUE(record.valid());
    EXPECT_EQ(record.index, 1u);
    EXPECT_EQ(record.output, "5\n");
    EXPECT_EQ(record.error, "");
    EXPECT_STATUS_EQ(record.declared, status::SUCCESS);
    EXPECT_DOUBLE_EQ(record.time, 0.482);
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_FALSE(record.output_limit_exceeded);
}

TEST(ProtocolTest, ParseOutputLimitExceededTest) {
    auto record = parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"YWJj","stderr":"","status":"Success","time":0.5,"output_limit_exceeded":true})");
    EXPECT_TRUE(record.output_limit_exceeded);
    EXPECT_EQ(record.output, "abc");

    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":0,"output_limit_exceeded":"yes"})"), protocol_error);
}

TEST(ProtocolTest, ParseRecordWithTimeStringTest) {
    auto record = parse_record(R"({"version":1,"encoding":"base64","index":3,"output":"","stderr":"S2lsbGVk","status":"Time Limit Exceeded","time":".482","exit_code":124})");
    EXPECT_EQ(record.index, 3u);
    EXPECT_EQ(record.error, "Killed");
    EXPECT_STATUS_EQ(record.declared, status::TIME_LIMIT_EXCEEDED);
    EXPECT_DOUBLE_EQ(record.time, 0.482);
    EXPECT_DOUBLE_EQ(record.memory, 0);
    EXPECT_EQ(record.exit_code, 124);
}

TEST(ProtocolTest, ParsePlainRecordTest) {
    auto record = parse_record(R"({"version":1,"index":2,"output":"","stderr":"Segmentation fault","status":"Runtime Error","time":"1.25","memory":12.5})");
    EXPECT_EQ(record.error, "Segmentation fault");
    EXPECT_STATUS_EQ(record.declared, status::RUNTIME_ERROR);
    EXPECT_DOUBLE_EQ(record.time, 1.25);
    EXPECT_DOUBLE_EQ(record.memory, 12.5);
}

TEST(ProtocolTest, RejectMalformedRecordTest) {
    // 版本号不匹配
    EXPECT_THROW(parse_record(R"({"version":2,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":0})"), protocol_error);
    // 缺少 output
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":1,"stderr":"","status":"Success","time":0})"), protocol_error);
    // 未知状态
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Accepted","time":0})"), protocol_error);
    // 非法 base64
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"@@@@","stderr":"","status":"Success","time":0})"), protocol_error);
    // 负数时间
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":-1})"), protocol_error);
    // 编号从 1 开始
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":0,"output":"","stderr":"","status":"Success","time":0})"), protocol_error);
    // 字段类型不正确
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"base64","index":"1","output":"","stderr":"","status":"Success","time":0})"), protocol_error);
    EXPECT_THROW(parse_record(R"({"version":1,"encoding":"gzip","index":1,"output":"","stderr":"","status":"Success","time":0})"), protocol_error);
    EXPECT_THROW(parse_record("[1, 2, 3]"), protocol_error);
    EXPECT_THROW(parse_record("input=5 output=5"), protocol_error);
}

TEST(ProtocolTest, EncodeRecordTest) {
    test_case_record record;
    record.index = 2;
    record.output = "3\n";
    record.error = "warning: unused variable";
    record.declared = status::SUCCESS;
    record.time = 0.25;
    record.output_limit_exceeded = true;

    string line = encode_record(record);
    ASSERT_EQ(line.rfind(string(TEST_CASE_RESULT_MARKER) + " ", 0), 0u);

    auto decoded = parse_record(line.substr(string(TEST_CASE_RESULT_MARKER).size()));
    EXPECT_EQ(decoded.index, 2u);
    EXPECT_TRUE(decoded.output_limit_exceeded);
    EXPECT_EQ(decoded.output, record.output);
    EXPECT_EQ(decoded.error, record.error);
    EXPECT_STATUS_EQ(decoded.declared, status::SUCCESS);
    EXPECT_DOUBLE_EQ(decoded.time, 0.25);
}

TEST(ProtocolTest, ParseResultStreamTest) {
    string output =
        "Unable to find image 'my-cpp-executor:12' locally\n"
        "JUDGE_RESULTS_START\n"
        R"(JUDGE_TEST_CASE_RESULT: {"version":1,"encoding":"base64","index":1,"output":"NQo=","stderr":"","status":"Success","time":0.1,"memory":0,"exit_code":0})" "\n"
        "echo JUDGE_TEST_CASE_RESULT: this line is program output\n"
        "JUDGE_TEST_CASE_RESULT: {not json}\n"
        "JUDGE_RESULTS_END\n";

    auto result = parse_protocol(output);
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.ended);
    EXPECT_FALSE(result.compilation_error);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_TRUE(result.records[0].valid());
    EXPECT_EQ(result.records[0].output, "5\n");
    EXPECT_FALSE(result.records[1].valid());
    EXPECT_FALSE(result.records[1].schema_error.empty());
}

TEST(ProtocolTest, ParseTruncatedStreamTest) {
    string output =
        "JUDGE_RESULTS_START\r\n"
        R"(JUDGE_TEST_CASE_RESULT: {"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":0,"memory":0,"exit_code":0})" "\r\n"
        "JUDGE_TEST_CASE_RES";

    auto result = parse_protocol(output);
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.ended);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.records[0].valid());
}

TEST(ProtocolTest, IgnoreRecordOutsideResultsTest) {
    string output =
        R"(JUDGE_TEST_CASE_RESULT: {"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":0})" "\n"
        "JUDGE_RESULTS_START\n"
        "JUDGE_RESULTS_END\n"
        R"(JUDGE_TEST_CASE_RESULT: {"version":1,"encoding":"base64","index":1,"output":"","stderr":"","status":"Success","time":0})" "\n";

    auto result = parse_protocol(output);
    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.ended);
    EXPECT_TRUE(result.records.empty());
}

TEST(ProtocolTest, ParseCompilationErrorTest) {
    string message = "solution.cpp: In function 'int main()':\nsolution.cpp:3:5: error: expected ';' before '}' token";
    auto result = parse_protocol(encode_compilation_error(message) + "\n");
    EXPECT_FALSE(result.started);
    ASSERT_TRUE(result.compilation_error);
    EXPECT_EQ(*result.compilation_error, message);
    EXPECT_TRUE(result.records.empty());
}

TEST(ProtocolTest, ParseVerbatimCompilationErrorTest) {
    auto result = parse_protocol("JUDGE_COMPILATION_ERROR: solution.cpp:3:5: error: expected ';'\n");
    ASSERT_TRUE(result.compilation_error);
    EXPECT_EQ(*result.compilation_error, "solution.cpp:3:5: error: expected ';'");
}

TEST(ProtocolTest, IgnoreOrdinaryLinesTest) {
    auto result = parse_protocol("hello\nRESULTS_START\nCOMPILATION_ERROR: nope\n");
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.ended);
    EXPECT_FALSE(result.compilation_error);
    EXPECT_TRUE(result.records.empty());
}
