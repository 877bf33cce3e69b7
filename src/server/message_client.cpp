#include "server/message_client.hpp"

namespace executor::server {

message_client::~message_client() = default;

}  // namespace executor::server
