#include "judge/protocol.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <cstring>
#include <nlohmann/json.hpp>
#include <sstream>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

bool test_case_record::valid() const {
    return schema_error.empty();
}

string normalize_time(const string &text) {
    string value = boost::algorithm::trim_copy(text);
    if (value.find_first_of("0123456789") == string::npos)
        throw protocol_error("malformed time value '" + text + "'");
    // 驱动脚本中的 bc 等工具可能输出 ".482" 这种没有前导零的小数
    if (!value.empty() && value[0] == '.') value = "0" + value;
    double seconds;
    try {
        seconds = boost::lexical_cast<double>(value);
    } catch (boost::bad_lexical_cast &) {
        throw protocol_error("malformed time value '" + text + "'");
    }
    if (!std::isfinite(seconds) || seconds < 0)
        throw protocol_error("time value must be a non-negative number, got '" + text + "'");
    return fmt::format("{:.3f}", seconds);
}

static const json &require_field(const json &j, const char *key) {
    if (!j.count(key))
        throw protocol_error(string("missing field ") + key);
    return j.at(key);
}

static string require_text(const json &j, const char *key, bool base64) {
    const json &value = require_field(j, key);
    if (!value.is_string())
        throw protocol_error(string("field ") + key + " must be a string");
    if (!base64) return value.get<string>();
    try {
        return decode_base64(value.get<string>());
    } catch (invalid_argument &e) {
        throw protocol_error(string("field ") + key + ": " + e.what());
    }
}

test_case_record parse_record(const string &payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (json::parse_error &e) {
        throw protocol_error(string("record is not valid JSON: ") + e.what());
    }
    if (!j.is_object())
        throw protocol_error("record must be a JSON object");

    const json &version = require_field(j, "version");
    if (!version.is_number_integer() || version.get<int>() != PROTOCOL_VERSION)
        throw protocol_error("unsupported protocol version " + version.dump());

    string encoding = "plain";
    if (j.count("encoding")) {
        if (!j.at("encoding").is_string())
            throw protocol_error("field encoding must be a string");
        encoding = j.at("encoding").get<string>();
    }
    if (encoding != "base64" && encoding != "plain")
        throw protocol_error("unsupported encoding " + encoding);
    bool base64 = encoding == "base64";

    test_case_record record;

    const json &index = require_field(j, "index");
    if (!index.is_number_unsigned() || index.get<size_t>() == 0)
        throw protocol_error("field index must be a positive integer");
    record.index = index.get<size_t>();

    record.output = require_text(j, "output", base64);
    record.error = require_text(j, "stderr", base64);

    const json &stat = require_field(j, "status");
    if (!stat.is_string())
        throw protocol_error("field status must be a string");
    auto declared = parse_status(stat.get<string>());
    if (!declared)
        throw protocol_error("unknown status " + stat.get<string>());
    record.declared = *declared;

    const json &time = require_field(j, "time");
    if (time.is_number())
        record.time = boost::lexical_cast<double>(normalize_time(fmt::format("{}", time.get<double>())));
    else if (time.is_string())
        record.time = boost::lexical_cast<double>(normalize_time(time.get<string>()));
    else
        throw protocol_error("field time must be a number");

    if (j.count("memory")) {
        const json &memory = j.at("memory");
        if (!memory.is_number() || memory.get<double>() < 0)
            throw protocol_error("field memory must be a non-negative number");
        record.memory = memory.get<double>();
    }

    if (j.count("exit_code")) {
        const json &exit_code = j.at("exit_code");
        if (!exit_code.is_number_integer())
            throw protocol_error("field exit_code must be an integer");
        record.exit_code = exit_code.get<int>();
    }

    if (j.count("output_limit_exceeded")) {
        const json &exceeded = j.at("output_limit_exceeded");
        if (!exceeded.is_boolean())
            throw protocol_error("field output_limit_exceeded must be a boolean");
        record.output_limit_exceeded = exceeded.get<bool>();
    }

    return record;
}

string encode_record(const test_case_record &record) {
    json j = {
        {"version", PROTOCOL_VERSION},
        {"encoding", "base64"},
        {"index", record.index},
        {"output", encode_base64(record.output)},
        {"stderr", encode_base64(record.error)},
        {"status", get_display_message(record.declared)},
        {"time", record.time},
        {"memory", record.memory},
        {"exit_code", record.exit_code},
        {"output_limit_exceeded", record.output_limit_exceeded}};
    return string(TEST_CASE_RESULT_MARKER) + " " + j.dump();
}

string encode_compilation_error(const string &message) {
    json j = {
        {"version", PROTOCOL_VERSION},
        {"encoding", "base64"},
        {"message", encode_base64(message)}};
    return string(COMPILATION_ERROR_MARKER) + " " + j.dump();
}

/**
 * @brief 解析编译错误信息
 * 若不是合法的 JSON 记录，则原样返回，以兼容直接输出编译器信息的驱动脚本
 */
static string parse_compilation_error(const string &payload) {
    try {
        json j = json::parse(payload);
        if (j.is_object() && j.count("message")) {
            bool base64 = get_value_def<string>(j, "plain", "encoding") == "base64";
            return require_text(j, "message", base64);
        }
    } catch (json::exception &) {
    } catch (invalid_argument &) {
    } catch (protocol_error &) {
    }
    return payload;
}

protocol_result parse_protocol(const string &output) {
    protocol_result result;
    istringstream stream(output);
    string line;
    while (getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (boost::algorithm::starts_with(line, COMPILATION_ERROR_MARKER)) {
            string message = parse_compilation_error(boost::algorithm::trim_copy(line.substr(strlen(COMPILATION_ERROR_MARKER))));
            if (result.compilation_error)
                result.compilation_error->append("\n").append(message);
            else
                result.compilation_error = message;
        } else if (boost::algorithm::trim_right_copy(line) == RESULTS_START_MARKER) {
            result.started = true;
        } else if (boost::algorithm::trim_right_copy(line) == RESULTS_END_MARKER) {
            result.ended = true;
        } else if (boost::algorithm::starts_with(line, TEST_CASE_RESULT_MARKER)) {
            if (!result.started || result.ended) {
                LOG(WARNING) << "Ignoring test case result outside of " << RESULTS_START_MARKER << " and " << RESULTS_END_MARKER;
                continue;
            }
            string payload = boost::algorithm::trim_copy(line.substr(strlen(TEST_CASE_RESULT_MARKER)));
            try {
                result.records.push_back(parse_record(payload));
            } catch (protocol_error &e) {
                LOG(WARNING) << "Malformed test case result #" << result.records.size() + 1 << ": " << e.what();
                test_case_record record;
                record.schema_error = e.what();
                result.records.push_back(record);
            }
        }
    }
    return result;
}

}  // namespace codejudge
