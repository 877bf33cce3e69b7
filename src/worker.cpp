#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "judge/verdict.hpp"

namespace executor {
using namespace std;
using namespace executor::message;

/**
 * @brief 不经过沙箱直接生成的评测结果，时间和内存都为 0
 */
static test_case_verdict synthesize_verdict(const string &id, const string &diagnostic) {
    test_case_verdict verdict;
    verdict.id = id;
    verdict.stat = status::COMPILATION_ERROR;
    verdict.output = base64_encode(diagnostic);
    return verdict;
}

job_processor::job_processor(server::message_client &client, const sandbox::sandbox_runner &runner, server::topology topo)
    : client(client), runner(runner), topo(move(topo)) {}

void job_processor::publish_status(size_t worker_id, const status_update &update) {
    try {
        client.publish(topo.status_exchange, topo.status_routing_key, nlohmann::json(update).dump());
    } catch (exception &e) {
        // 状态通知丢失不影响评测
        LOG(WARNING) << "[Worker " << worker_id << "] Failed to publish status of submission " << update.submission_id << ": " << e.what();
    }
}

test_case_verdict job_processor::judge_test_case(size_t worker_id, const submission_job &submission,
                                                  const string &code, const test_case_spec &test_case) {
    string input;
    try {
        input = base64_decode(test_case.input);
    } catch (decode_error &e) {
        LOG(WARNING) << "[Submission " << submission.submission_id << "] Test case " << test_case.id << ": " << e.what();
        return synthesize_verdict(test_case.id, "Invalid Base64 for test case input.");
    }

    sandbox::execution_outcome outcome;
    try {
        outcome = runner.run(submission.submission_id, submission.language, code, input,
                             submission.time_limit, submission.memory_limit * 1024 * 1024);
    } catch (executor_exception &e) {
        LOG(ERROR) << "[Worker " << worker_id << "] Submission " << submission.submission_id << " test case " << test_case.id
                   << " failed in sandbox: " << e;
        return synthesize_verdict(test_case.id, e.what());
    } catch (exception &e) {
        LOG(ERROR) << "[Worker " << worker_id << "] Submission " << submission.submission_id << " test case " << test_case.id
                   << " failed in sandbox: " << e.what() << endl
                   << boost::diagnostic_information(e);
        return synthesize_verdict(test_case.id, e.what());
    }

    string expected_output;
    try {
        expected_output = base64_decode(test_case.expected_output);
    } catch (decode_error &e) {
        LOG(WARNING) << "[Submission " << submission.submission_id << "] Test case " << test_case.id << ": " << e.what();
        return synthesize_verdict(test_case.id, "Invalid Base64 for expected output.");
    }

    return judge::make_test_case_verdict(test_case.id, outcome, expected_output);
}

void job_processor::process(size_t worker_id, const job &task) {
    const submission_job &submission = task.submission;
    LOG(INFO) << "[Worker " << worker_id << "] Processing submission " << submission.submission_id
              << " (" << submission.language << ", " << submission.test_cases.size() << " test cases)";

    publish_status(worker_id, {submission.submission_id, status::RUNNING});

    string code;
    try {
        code = base64_decode(submission.code);
    } catch (decode_error &e) {
        // 提交会停留在 RUNNING 状态
        LOG(ERROR) << "[Worker " << worker_id << "] Dropping submission " << submission.submission_id << ", invalid code: " << e.what();
        client.ack(task.source);
        return;
    }

    vector<test_case_verdict> results;
    for (auto &test_case : submission.test_cases) {
        results.push_back(judge_test_case(worker_id, submission, code, test_case));
        DLOG(INFO) << "[Submission " << submission.submission_id << "] Test case " << test_case.id << ": " << to_string(results.back().stat);
    }

    submission_verdict verdict = judge::summarize(submission.submission_id, move(results));
    try {
        client.publish(topo.result_exchange, topo.result_routing_key, nlohmann::json(verdict).dump());
    } catch (exception &e) {
        LOG(ERROR) << "[Worker " << worker_id << "] Failed to publish result of submission " << submission.submission_id
                   << ", requeueing: " << e.what();
        client.nack(task.source, /* requeue */ true);
        return;
    }

    client.ack(task.source);
    LOG(INFO) << "[Worker " << worker_id << "] Finished submission " << submission.submission_id << ": " << to_string(verdict.stat)
              << ", " << verdict.time_taken << "s, " << verdict.memory_used << "MB";
}

void job_processor::reject(const job &task) {
    client.nack(task.source, /* requeue */ true);
}

static void worker_loop(size_t worker_id, concurrent_queue<job> &job_queue, job_processor &processor) {
    LOG(INFO) << "[Worker " << worker_id << "] Started";

    job task;
    while (job_queue.pop(task)) {
        try {
            processor.process(worker_id, task);
        } catch (exception &e) {
            if (auto ex = dynamic_cast<executor_exception *>(&e))
                LOG(ERROR) << "[Worker " << worker_id << "] Submission " << task.submission.submission_id << " crashed: " << *ex;
            else
                LOG(ERROR) << "[Worker " << worker_id << "] Submission " << task.submission.submission_id << " crashed: " << e.what() << endl
                           << boost::diagnostic_information(e);
            try {
                processor.reject(task);
            } catch (exception &e) {
                LOG(ERROR) << "[Worker " << worker_id << "] Failed to requeue submission " << task.submission.submission_id << ": " << e.what();
            }
        }
    }

    LOG(INFO) << "[Worker " << worker_id << "] Stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<job> &job_queue, job_processor &processor) {
    return thread([worker_id, &job_queue, &processor] {
        worker_loop(worker_id, job_queue, processor);
    });
}

}  // namespace executor
