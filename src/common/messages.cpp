#include "common/messages.hpp"
#include <limits>
#include <stdexcept>

namespace executor::message {
using namespace std;
using namespace nlohmann;

// 时间限制会换算为毫秒，内存限制会换算为字节，二者都不能溢出 int64_t
static constexpr double MAX_TIME_LIMIT = 3600;
static constexpr int64_t MAX_MEMORY_LIMIT = numeric_limits<int64_t>::max() >> 20;

void from_json(const json &j, test_case_spec &test_case) {
    j.at("testCaseId").get_to(test_case.id);
    j.at("input").get_to(test_case.input);
    j.at("output").get_to(test_case.expected_output);
}

void to_json(json &j, const test_case_spec &test_case) {
    j = {{"testCaseId", test_case.id},
         {"input", test_case.input},
         {"output", test_case.expected_output}};
}

void from_json(const json &j, submission_job &job) {
    j.at("submissionId").get_to(job.submission_id);
    j.at("language").get_to(job.language);
    j.at("code").get_to(job.code);
    j.at("timeLimit").get_to(job.time_limit);
    j.at("memoryLimit").get_to(job.memory_limit);
    j.at("testCases").get_to(job.test_cases);

    if (!(job.time_limit > 0) || job.time_limit > MAX_TIME_LIMIT)
        throw invalid_argument("timeLimit should be in (0, 3600], got " + std::to_string(job.time_limit));
    if (job.memory_limit <= 0 || job.memory_limit > MAX_MEMORY_LIMIT)
        throw invalid_argument("memoryLimit should be in (0, " + std::to_string(MAX_MEMORY_LIMIT) + "], got " + std::to_string(job.memory_limit));
}

void to_json(json &j, const submission_job &job) {
    j = {{"submissionId", job.submission_id},
         {"language", job.language},
         {"code", job.code},
         {"timeLimit", job.time_limit},
         {"memoryLimit", job.memory_limit},
         {"testCases", job.test_cases}};
}

void from_json(const json &j, status_update &update) {
    j.at("submissionId").get_to(update.submission_id);
    update.stat = parse_status(j.at("status").get<string>());
}

void to_json(json &j, const status_update &update) {
    j = {{"submissionId", update.submission_id},
         {"status", to_string(update.stat)}};
}

void from_json(const json &j, test_case_verdict &verdict) {
    j.at("testCaseId").get_to(verdict.id);
    verdict.stat = parse_status(j.at("status").get<string>());
    j.at("output").get_to(verdict.output);
    j.at("timeTaken").get_to(verdict.time_taken);
    j.at("memoryUsed").get_to(verdict.memory_used);
}

void to_json(json &j, const test_case_verdict &verdict) {
    j = {{"testCaseId", verdict.id},
         {"status", to_string(verdict.stat)},
         {"output", verdict.output},
         {"timeTaken", verdict.time_taken},
         {"memoryUsed", verdict.memory_used}};
}

void from_json(const json &j, submission_verdict &verdict) {
    j.at("submissionId").get_to(verdict.submission_id);
    verdict.stat = parse_status(j.at("status").get<string>());
    j.at("timeTaken").get_to(verdict.time_taken);
    j.at("memoryUsed").get_to(verdict.memory_used);
    j.at("testCaseResults").get_to(verdict.results);
}

void to_json(json &j, const submission_verdict &verdict) {
    j = {{"submissionId", verdict.submission_id},
         {"status", to_string(verdict.stat)},
         {"timeTaken", verdict.time_taken},
         {"memoryUsed", verdict.memory_used},
         {"testCaseResults", verdict.results}};
}

}  // namespace executor::message
