#include "judge/verdict.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include "common/base64.hpp"

namespace executor::judge {
using namespace std;

status judge_test_case(const sandbox::execution_outcome &outcome, const string &expected_output) {
    if (outcome.stat != status::ACCEPTED) return outcome.stat;

    if (boost::algorithm::trim_copy(outcome.output) == boost::algorithm::trim_copy(expected_output))
        return status::PASSED;
    else
        return status::WRONG_ANSWER;
}

message::test_case_verdict make_test_case_verdict(const string &id, const sandbox::execution_outcome &outcome,
                                                  const string &expected_output) {
    message::test_case_verdict verdict;
    verdict.id = id;
    verdict.stat = judge_test_case(outcome, expected_output);
    verdict.output = base64_encode(outcome.output);
    verdict.time_taken = outcome.time_ms / 1000.0;
    verdict.memory_used = outcome.memory_kb / 1024;
    return verdict;
}

message::submission_verdict summarize(int64_t submission_id, vector<message::test_case_verdict> results) {
    message::submission_verdict verdict;
    verdict.submission_id = submission_id;
    if (results.empty()) {
        verdict.stat = status::COMPILATION_ERROR;
        return verdict;
    }

    verdict.stat = status::PASSED;
    for (auto &result : results) {
        verdict.time_taken = max(verdict.time_taken, result.time_taken);
        verdict.memory_used = max(verdict.memory_used, result.memory_used);
        if (get_priority(result.stat) > get_priority(verdict.stat))
            verdict.stat = result.stat;
    }
    verdict.results = move(results);
    return verdict;
}

}  // namespace executor::judge
