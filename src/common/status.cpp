#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace executor {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::RUNNING, "RUNNING")
    (status::ACCEPTED, "ACCEPTED")
    (status::PASSED, "PASSED")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::COMPILATION_ERROR, "COMPILATION_ERROR");

static const unordered_map<status, int> status_priority = boost::assign::map_list_of
    (status::RUNNING, -1)
    (status::ACCEPTED, 0)
    (status::PASSED, 0)
    (status::WRONG_ANSWER, 1)
    (status::MEMORY_LIMIT_EXCEEDED, 2)
    (status::TIME_LIMIT_EXCEEDED, 3)
    (status::RUNTIME_ERROR, 4)
    (status::COMPILATION_ERROR, 5);
// clang-format on

int get_priority(status stat) {
    return status_priority.at(stat);
}

const char *to_string(status stat) {
    return status_string.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, str] : status_string)
        if (name == str) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

}  // namespace executor
