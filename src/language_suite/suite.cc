#include "sandtool/language_suite/suite.hh"
#include "sandtool/macros/throw.hh"

namespace sandtool::language_suite {

sandbox::Result Suite::await_result() {
    if (not running_) {
        THROW("Suite: no run in progress");
    }
    auto fut = std::move(*running_);
    running_.reset();
    return fut.get();
}

} // namespace sandtool::language_suite
