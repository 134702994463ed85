#include "sandbox/remote_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "judge/protocol.hpp"

namespace codejudge::sandbox {
using namespace std;
using namespace nlohmann;

remote_runner::remote_runner(const string &url, int timeout)
    : url(url), timeout(timeout) {}

static size_t write_to_string(char *data, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

string remote_runner::post(const string &body) {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw network_error("unable to initialize curl");

    string response;
    struct curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to reach runner service {}: {}", url, curl_easy_strerror(res)));
    if (http_code >= 400)
        throw network_error(fmt::format("runner service {} responded with HTTP {}", url, http_code));
    return response;
}

/**
 * @brief 将评测服务的响应转换为测试点记录
 * 评测服务返回的未知状态（比如 "Service Error"）被视为 Internal Error
 */
static test_case_record parse_response(size_t index, const string &body) {
    json j;
    try {
        j = json::parse(body);
    } catch (json::parse_error &e) {
        throw protocol_error(string("runner service returned malformed JSON: ") + e.what());
    }

    test_case_record record;
    record.index = index;
    try {
        record.output = get_value_def<string>(j, "", "output");
        record.error = get_value_def<string>(j, "", "error_message");

        string stat = get_value_def<string>(j, "Success", "status");
        if (auto declared = parse_status(stat)) {
            record.declared = *declared;
        } else {
            LOG(WARNING) << "Runner service reported unknown status " << stat;
            record.declared = status::INTERNAL_ERROR;
            if (record.error.empty()) record.error = stat;
        }

        if (exists(j, "time")) {
            const json &time = access(j, "time");
            record.time = stod(normalize_time(time.is_string() ? time.get<string>() : time.dump()));
        }
        if (exists(j, "memory"))
            record.memory = get_value<double>(j, "memory");
    } catch (invalid_argument &e) {
        throw protocol_error(string("runner service returned unexpected response: ") + e.what());
    }
    return record;
}

static test_case_record internal_error_record(size_t index, const string &message) {
    test_case_record record;
    record.index = index;
    record.declared = status::INTERNAL_ERROR;
    record.error = message;
    return record;
}

sandbox_invocation remote_runner::execute(const submission &submit, const language_profile &profile, const string &script) {
    sandbox_invocation invocation;
    invocation.script = script;

    stringstream output;
    output << RESULTS_START_MARKER << '\n';
    // 评测服务不可达后，剩余的测试点不再发送请求，已经完成的测试点保留结果
    string unreachable;
    for (size_t i = 0; i < submit.test_cases.size(); ++i) {
        if (!unreachable.empty()) {
            output << encode_record(internal_error_record(i + 1, unreachable)) << '\n';
            continue;
        }

        json request = {
            {"code", submit.source_code},
            {"language", profile.language},
            {"stdin", submit.test_cases[i].input}};
        LOG(INFO) << "Running test case " << i + 1 << " of " << submit << " on " << url;

        try {
            string body = post(request.dump(-1, ' ', false, json::error_handler_t::replace));
            output << encode_record(parse_response(i + 1, body)) << '\n';
        } catch (network_error &e) {
            LOG(ERROR) << "Test case " << i + 1 << " of " << submit << ": " << e;
            unreachable = e.what();
            invocation.error = e.what();
            output << encode_record(internal_error_record(i + 1, unreachable)) << '\n';
        } catch (protocol_error &e) {
            LOG(WARNING) << "Test case " << i + 1 << ": " << e.what();
            output << encode_record(internal_error_record(i + 1, e.what())) << '\n';
        }
    }
    output << RESULTS_END_MARKER << '\n';

    invocation.output = output.str();
    invocation.exit_code = 0;
    return invocation;
}

}  // namespace codejudge::sandbox
