#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace executor {
using namespace std;

executor_exception::executor_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *executor_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const executor_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : executor_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : executor_exception("unsupported language: " + language) {}

network_error::network_error(const string &message)
    : executor_exception(message) {}

decode_error::decode_error(const string &message)
    : executor_exception(message) {}

}  // namespace executor
