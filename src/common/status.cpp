#include "evalbox/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "evalbox/common/exceptions.hpp"

namespace evalbox {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::OK, "OK")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::TIME_LIMIT_ERROR, "Time Limit Error")
    (verdict::MEMORY_LIMIT_ERROR, "Memory Limit Error")
    (verdict::EXECUTION_FAILURE, "Execution Failure");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

verdict parse_verdict(const string &message) {
    for (auto &[v, str] : verdict_string)
        if (message == str) return v;
    throw invalid_input_error("unrecognized verdict " + message);
}

}  // namespace evalbox
