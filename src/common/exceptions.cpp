#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

infrastructure_error::infrastructure_error()
    : internal_error() {}

infrastructure_error::infrastructure_error(const string &message)
    : internal_error(message) {}

network_error::network_error()
    : judge_exception() {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

protocol_error::protocol_error()
    : judge_exception() {}

protocol_error::protocol_error(const string &message)
    : judge_exception(message) {}

invalid_submission::invalid_submission()
    : judge_exception() {}

invalid_submission::invalid_submission(const string &message)
    : judge_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : judge_exception("Unsupported language " + language), language(language) {}

}  // namespace codejudge
