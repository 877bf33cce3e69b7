#include "common/defer.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <exception>
#include "common/exceptions.hpp"

namespace executor {

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(std::function<void()> f) : f(std::move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (executor_exception &ex) {
        LOG(ERROR) << "Cleanup failed: " << ex;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Cleanup failed: " << ex.what() << std::endl
                   << boost::diagnostic_information(ex);
    }
}

scoped_guard scoped_guard::operator+(std::function<void()> f) const {
    return scoped_guard(std::move(f));
}

}  // namespace executor
