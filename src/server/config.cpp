#include "server/config.hpp"

namespace executor::server {
using namespace std;
using namespace nlohmann;

template <typename T>
static void assign_optional(const json &j, const char *key, T &value) {
    if (j.count(key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

void from_json(const json &j, amqp &mq) {
    assign_optional(j, "hostname", mq.hostname);
    assign_optional(j, "port", mq.port);
    assign_optional(j, "user", mq.user);
    assign_optional(j, "password", mq.password);
    assign_optional(j, "vhost", mq.vhost);
}

void from_json(const json &j, topology &topo) {
    assign_optional(j, "submission_exchange", topo.submission_exchange);
    assign_optional(j, "submission_queue", topo.submission_queue);
    assign_optional(j, "submission_routing_key", topo.submission_routing_key);
    assign_optional(j, "dead_letter_exchange", topo.dead_letter_exchange);
    assign_optional(j, "retry_queue", topo.retry_queue);
    assign_optional(j, "failed_queue", topo.failed_queue);
    assign_optional(j, "status_exchange", topo.status_exchange);
    assign_optional(j, "status_routing_key", topo.status_routing_key);
    assign_optional(j, "result_exchange", topo.result_exchange);
    assign_optional(j, "result_routing_key", topo.result_routing_key);
    assign_optional(j, "retry_ttl", topo.retry_ttl);
    assign_optional(j, "declare", topo.declare);
}

}  // namespace executor::server
