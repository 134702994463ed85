#include "judge/classifier.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "config.hpp"

namespace codejudge {
using namespace std;

static const vector<string> memory_error_patterns = {
    "MemoryError",
    "OutOfMemoryError",
    "std::bad_alloc",
    "Cannot allocate memory",
    "failed to allocate memory"};

bool output_matches(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

bool indicates_memory_limit(const string &error) {
    for (auto &pattern : memory_error_patterns)
        if (error.find(pattern) != string::npos)
            return true;
    return false;
}

static string error_message_of(status stat, const string &error) {
    if (!error.empty()) return error;
    if (stat != status::SUCCESS) return get_display_message(stat);
    return "";
}

execution_result classify(size_t number, const test_case &testcase, const test_case_record &record) {
    execution_result result;
    result.test_case_number = number;
    result.input = testcase.input;
    result.expected_output = testcase.expected_output;
    result.actual_output = record.output;
    result.time_taken = record.time;
    result.memory_used = record.memory;

    switch (record.declared) {
        case status::SUCCESS:
            if (record.output_limit_exceeded) {
                // output 只是前缀，正确的前缀后面可能跟着任意内容
                result.stat = status::RUNTIME_ERROR;
                result.error_message = fmt::format("Output limit of {} bytes exceeded", OUTPUT_LIMIT);
                if (!record.error.empty())
                    result.error_message += "\n" + record.error;
                return result;
            }
            result.stat = status::SUCCESS;
            result.passed = output_matches(record.output, testcase.expected_output);
            break;
        case status::TIME_LIMIT_EXCEEDED:
            result.stat = status::TIME_LIMIT_EXCEEDED;
            break;
        case status::MEMORY_LIMIT_EXCEEDED:
            result.stat = status::MEMORY_LIMIT_EXCEEDED;
            break;
        case status::RUNTIME_ERROR:
            result.stat = indicates_memory_limit(record.error) ? status::MEMORY_LIMIT_EXCEEDED : status::RUNTIME_ERROR;
            break;
        case status::COMPILATION_ERROR:
        case status::INTERNAL_ERROR:
            result.stat = record.declared;
            break;
    }

    result.error_message = error_message_of(result.stat, record.error);
    return result;
}

static execution_result internal_error_result(size_t number, const test_case &testcase, const string &message) {
    execution_result result;
    result.test_case_number = number;
    result.input = testcase.input;
    result.expected_output = testcase.expected_output;
    result.stat = status::INTERNAL_ERROR;
    result.error_message = message;
    return result;
}

vector<execution_result> uniform_results(const submission &submit, status stat, const string &message) {
    vector<execution_result> results;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        execution_result result;
        result.test_case_number = i + 1;
        result.input = submit.test_cases[i].input;
        result.expected_output = submit.test_cases[i].expected_output;
        result.stat = stat;
        result.error_message = message;
        results.push_back(result);
    }
    return results;
}

vector<execution_result> assemble_results(const submission &submit, const protocol_result &protocol, const string &sandbox_error) {
    if (protocol.records.empty()) {
        string message;
        if (protocol.compilation_error && !protocol.compilation_error->empty())
            message = *protocol.compilation_error;
        else if (!boost::algorithm::trim_copy(sandbox_error).empty())
            message = sandbox_error;
        else
            message = "Unknown error";

        if (protocol.compilation_error) {
            LOG(INFO) << "Compilation error of " << submit;
            return uniform_results(submit, status::COMPILATION_ERROR, message);
        } else {
            LOG(WARNING) << "Sandbox reported no test case result for " << submit << ": " << message;
            return uniform_results(submit, status::INTERNAL_ERROR, message);
        }
    }

    if (!protocol.ended)
        LOG(WARNING) << "Result stream of " << submit << " was truncated after " << protocol.records.size() << " records";
    if (protocol.records.size() > submit.test_cases.size())
        LOG(WARNING) << "Ignoring " << protocol.records.size() - submit.test_cases.size() << " surplus records of " << submit;

    vector<execution_result> results;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        size_t number = i + 1;
        const test_case &testcase = submit.test_cases[i];
        if (i >= protocol.records.size()) {
            results.push_back(internal_error_result(number, testcase, "No result was reported for this test case"));
            continue;
        }

        const test_case_record &record = protocol.records[i];
        if (!record.valid()) {
            results.push_back(internal_error_result(number, testcase, "Malformed test case result: " + record.schema_error));
        } else if (record.index != number) {
            LOG(WARNING) << "Record at position " << number << " claims to be test case " << record.index;
            results.push_back(internal_error_result(number, testcase, fmt::format("Test case result #{} was reported at position {}", record.index, number)));
        } else {
            results.push_back(classify(number, testcase, record));
        }
    }
    return results;
}

}  // namespace codejudge
