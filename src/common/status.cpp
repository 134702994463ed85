#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::INTERNAL_ERROR, "Internal Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

optional<status> parse_status(const string &message) {
    for (auto &[stat, text] : status_string)
        if (message == text)
            return stat;
    return nullopt;
}

}  // namespace codejudge
