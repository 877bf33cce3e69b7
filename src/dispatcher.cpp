#include "dispatcher.hpp"
#include <glog/logging.h>
#include <chrono>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace executor {
using namespace std;

dispatcher::dispatcher(server::message_client &client, job_processor &processor, size_t pool_size)
    : client(client), processor(processor), pool_size(pool_size), job_queue(pool_size) {
    if (pool_size == 0) throw invalid_argument("dispatcher requires at least one worker");
}

dispatcher::~dispatcher() {
    stop();
}

void dispatcher::start() {
    LOG(INFO) << "Starting " << pool_size << " workers";
    for (size_t i = 0; i < pool_size; ++i)
        workers.push_back(start_worker(i, job_queue, processor));
}

void dispatcher::run() {
    while (!stopping) {
        server::delivery delivery;
        if (!client.consume(delivery, POLL_TIMEOUT_MS)) continue;

        job task;
        try {
            task.submission = nlohmann::json::parse(delivery.body).get<message::submission_job>();
        } catch (nlohmann::json::exception &e) {
            LOG(ERROR) << "Dropping malformed submission message " << delivery.tag << ": " << e.what();
            client.ack(delivery);
            continue;
        } catch (invalid_argument &e) {
            LOG(ERROR) << "Dropping invalid submission message " << delivery.tag << ": " << e.what();
            client.ack(delivery);
            continue;
        }
        task.source = delivery;

        int64_t submission_id = task.submission.submission_id;
        DLOG(INFO) << "Dispatching submission " << submission_id;
        // 队列满时分段等待，使得 request_stop 能够打断阻塞的入队
        bool pushed = false;
        while (!stopping && !job_queue.is_closed()) {
            if (job_queue.push_for(task, chrono::milliseconds(POLL_TIMEOUT_MS))) {
                pushed = true;
                break;
            }
        }
        if (!pushed) {
            // 消息交还给 broker
            LOG(WARNING) << "Dispatcher stopping, requeueing submission " << submission_id;
            client.nack(delivery, /* requeue */ true);
            break;
        }
    }
}

void dispatcher::request_stop() noexcept {
    stopping = true;
}

void dispatcher::stop() {
    stopping = true;
    job_queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    if (!workers.empty()) LOG(INFO) << "All workers stopped";
    workers.clear();
}

}  // namespace executor
