#include "judge/engine.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "judge/classifier.hpp"
#include "judge/driver_script.hpp"
#include "judge/protocol.hpp"

namespace codejudge {
using namespace std;

engine::engine(const language_registry &languages, sandbox::runner &runner)
    : languages(languages), runner(runner) {}

vector<execution_result> engine::run_batch(const submission &submit) const {
    validate_submission(submit);
    const language_profile &profile = languages.resolve(submit.language);

    LOG(INFO) << "Judging " << submit;
    try {
        string script = generate_driver_script(profile, submit.language, submit.time_limit);
        sandbox::sandbox_invocation invocation = runner.execute(submit, profile, script);

        protocol_result protocol = parse_protocol(invocation.output);
        if (invocation.timed_out && protocol.records.size() < submit.test_cases.size())
            LOG(WARNING) << "Sandbox of " << submit << " was killed by watchdog after " << protocol.records.size() << " test cases";

        auto results = assemble_results(submit, protocol, invocation.error);
        size_t passed = count_if(results.begin(), results.end(), [](const execution_result &result) { return result.passed; });
        LOG(INFO) << "Judged " << submit << ": " << passed << "/" << results.size() << " passed";
        return results;
    } catch (judge_exception &e) {
        LOG(ERROR) << "Unable to judge " << submit << ": " << e;
        return uniform_results(submit, status::INTERNAL_ERROR, e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to judge " << submit << ": " << boost::diagnostic_information(e);
        return uniform_results(submit, status::INTERNAL_ERROR, e.what());
    }
}

}  // namespace codejudge
