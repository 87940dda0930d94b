#include "evalbox/sandbox/resource_limits.hpp"
#include "evalbox/common/exceptions.hpp"
#include "evalbox/config.hpp"

namespace evalbox {
using namespace std;

resource_limits resource_limits::defaults() {
    return {DEFAULT_TIME_LIMIT, DEFAULT_MEMORY_LIMIT, DEFAULT_CONCURRENCY};
}

void validate(const resource_limits &limits) {
    if (!(limits.wall_clock_seconds > 0))
        throw invalid_input_error("wall clock limit must be positive, got " + to_string(limits.wall_clock_seconds));
    if (limits.memory_megabytes <= 0)
        throw invalid_input_error("memory limit must be positive, got " + to_string(limits.memory_megabytes));
    if (limits.max_concurrency < 1)
        throw invalid_input_error("max concurrency must be at least 1");
}

}  // namespace evalbox
