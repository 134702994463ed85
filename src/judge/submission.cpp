#include "judge/submission.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cstdint>
#include <limits>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

void validate_submission(const submission &submit) {
    if (boost::algorithm::trim_copy(submit.source_code).empty())
        throw invalid_submission("Missing required parameters: submission_code");
    if (submit.language.empty())
        throw invalid_submission("Missing required parameters: language");
    if (submit.test_cases.empty())
        throw invalid_submission("Missing required parameters: test_cases");
    if (submit.time_limit <= 0)
        throw invalid_submission("time_limit must be a positive integer");
    if (submit.memory_limit <= 0)
        throw invalid_submission("memory_limit must be a positive integer");
}

/**
 * @brief 读取以整数表示的限制，缺省时返回 def
 * @throw std::invalid_argument 若不是整数或者超出 int 的范围
 */
static int limit_of(const json &j, const char *key, int def) {
    if (!exists(j, key)) return def;
    const json &value = access(j, key);
    if (!value.is_number_integer())
        throw invalid_argument(string(key) + " must be a positive integer");
    if (value.is_number_unsigned()) {
        auto number = value.get<uint64_t>();
        if (number > (uint64_t)numeric_limits<int>::max())
            throw invalid_argument(string(key) + " is too large");
        return (int)number;
    }
    auto number = value.get<int64_t>();
    if (number < numeric_limits<int>::min() || number > numeric_limits<int>::max())
        throw invalid_argument(string(key) + " must be a positive integer");
    return (int)number;
}

void from_json(const json &j, test_case &value) {
    value.input = get_value_def<string>(j, "", "input");
    value.expected_output = get_value_def<string>(j, "", "expected_output");
}

void from_json(const json &j, submission &value) {
    try {
        if (!j.is_object())
            throw invalid_argument("submission must be a JSON object");
        value.source_code = get_value_def<string>(j, "", "submission_code");
        value.language = get_value_def<string>(j, "", "language");
        value.time_limit = limit_of(j, "time_limit", 2);
        value.memory_limit = limit_of(j, "memory_limit", 256);
        value.test_cases.clear();
        if (exists(j, "test_cases")) {
            const json &cases = access(j, "test_cases");
            if (!cases.is_array())
                throw invalid_argument("test_cases must be an array");
            for (auto &item : cases) {
                if (!item.is_object())
                    throw invalid_argument("each test case must be an object");
                value.test_cases.push_back(item.get<test_case>());
            }
        }
    } catch (invalid_argument &e) {
        throw invalid_submission(e.what());
    }
}

void to_json(json &j, const execution_result &value) {
    j = {
        {"test_case_number", value.test_case_number},
        {"input", value.input},
        {"expected_output", value.expected_output},
        {"actual_output", value.actual_output},
        {"time_taken", value.time_taken},
        {"memory_used", value.memory_used},
        {"status", get_display_message(value.stat)},
        {"error_message", value.error_message.empty() ? json() : json(value.error_message)},
        {"passed", value.passed}};
}

}  // namespace codejudge
