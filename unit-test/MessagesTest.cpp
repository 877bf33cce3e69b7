#include "common/messages.hpp"
#include "gtest/gtest.h"
#include <limits>

using namespace std;
using namespace nlohmann;
using namespace executor;
using namespace executor::message;

class MessagesTest : public ::testing::Test {
protected:
    static json submission() {
        return R"({
            "submissionId": 42,
            "language": "PYTHON",
            "code": "cHJpbnQoMSk=",
            "timeLimit": 2.5,
            "memoryLimit": 128,
            "testCases": [
                {"testCaseId": "1", "input": "", "output": "MQ=="},
                {"testCaseId": "2", "input": "Mgo=", "output": "MQ=="}
            ]
        })"_json;
    }
};

TEST_F(MessagesTest, ParseSubmission) {
    auto job = submission().get<submission_job>();
    EXPECT_EQ(job.submission_id, 42);
    EXPECT_EQ(job.language, "PYTHON");
    EXPECT_EQ(job.code, "cHJpbnQoMSk=");
    EXPECT_DOUBLE_EQ(job.time_limit, 2.5);
    EXPECT_EQ(job.memory_limit, 128);
    ASSERT_EQ(job.test_cases.size(), 2u);
    EXPECT_EQ(job.test_cases[0].id, "1");
    EXPECT_EQ(job.test_cases[1].input, "Mgo=");
    EXPECT_EQ(job.test_cases[1].expected_output, "MQ==");
}

TEST_F(MessagesTest, SubmissionRoundTrip) {
    auto job = submission().get<submission_job>();
    json j = job;
    EXPECT_EQ(j, submission());
}

TEST_F(MessagesTest, IntegerTimeLimit) {
    json j = submission();
    j["timeLimit"] = 1;
    EXPECT_DOUBLE_EQ(j.get<submission_job>().time_limit, 1.0);
}

TEST_F(MessagesTest, MissingFieldIsRejected) {
    json j = submission();
    j.erase("testCases");
    EXPECT_THROW(j.get<submission_job>(), json::exception);

    j = submission();
    j["testCases"][0].erase("testCaseId");
    EXPECT_THROW(j.get<submission_job>(), json::exception);
}

TEST_F(MessagesTest, MistypedFieldIsRejected) {
    json j = submission();
    j["submissionId"] = "42";
    EXPECT_THROW(j.get<submission_job>(), json::exception);

    EXPECT_THROW(json::parse("[1, 2, 3]").get<submission_job>(), json::exception);
    EXPECT_THROW(json::parse("{\"submissionId\": "), json::exception);
}

TEST_F(MessagesTest, OutOfRangeLimitsAreRejected) {
    json j = submission();
    j["timeLimit"] = 0;
    EXPECT_THROW(j.get<submission_job>(), invalid_argument);

    j = submission();
    j["memoryLimit"] = -1;
    EXPECT_THROW(j.get<submission_job>(), invalid_argument);

    // 换算为毫秒后超出 int64_t
    j = submission();
    j["timeLimit"] = 1e17;
    EXPECT_THROW(j.get<submission_job>(), invalid_argument);

    j = submission();
    j["timeLimit"] = 3600.5;
    EXPECT_THROW(j.get<submission_job>(), invalid_argument);

    // 换算为字节后超出 int64_t
    j = submission();
    j["memoryLimit"] = 9000000000000LL;
    EXPECT_THROW(j.get<submission_job>(), invalid_argument);

    j = submission();
    j["timeLimit"] = 3600;
    j["memoryLimit"] = numeric_limits<int64_t>::max() >> 20;
    auto job = j.get<submission_job>();
    EXPECT_EQ(job.time_limit, 3600);
}

TEST_F(MessagesTest, StatusUpdate) {
    json j = status_update{42, status::RUNNING};
    EXPECT_EQ(j, R"({"submissionId": 42, "status": "RUNNING"})"_json);
}

TEST_F(MessagesTest, SubmissionVerdict) {
    submission_verdict verdict;
    verdict.submission_id = 7;
    verdict.stat = status::WRONG_ANSWER;
    verdict.time_taken = 1.25;
    verdict.memory_used = 12;
    verdict.results.push_back({"1", status::PASSED, "MQ==", 0.5, 12});
    verdict.results.push_back({"2", status::WRONG_ANSWER, "Mg==", 1.25, 10});

    json j = verdict;
    EXPECT_EQ(j["submissionId"], 7);
    EXPECT_EQ(j["status"], "WRONG_ANSWER");
    EXPECT_EQ(j["timeTaken"], 1.25);
    EXPECT_EQ(j["memoryUsed"], 12);
    ASSERT_EQ(j["testCaseResults"].size(), 2u);
    EXPECT_EQ(j["testCaseResults"][1]["testCaseId"], "2");
    EXPECT_EQ(j["testCaseResults"][1]["status"], "WRONG_ANSWER");
    EXPECT_EQ(j["testCaseResults"][1]["output"], "Mg==");

    auto parsed = j.get<submission_verdict>();
    EXPECT_EQ(parsed.stat, status::WRONG_ANSWER);
    ASSERT_EQ(parsed.results.size(), 2u);
    EXPECT_EQ(parsed.results[0].stat, status::PASSED);
    EXPECT_EQ(parsed.results[0].memory_used, 12);
}
