#include "sandbox/container_runtime.hpp"

namespace executor::sandbox {

exec_session::~exec_session() {}

container_runtime::~container_runtime() {}

}  // namespace executor::sandbox
