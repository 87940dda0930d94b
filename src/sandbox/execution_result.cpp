#include "evalbox/sandbox/execution_result.hpp"
#include "evalbox/common/json_utils.hpp"

namespace evalbox {
using namespace std;
using namespace nlohmann;

execution_result execution_result::ok(const string &output, double elapsed_seconds, double peak_memory_mb) {
    execution_result result;
    result.verdict = verdict::OK;
    result.output = output;
    result.elapsed_seconds = elapsed_seconds;
    result.peak_memory_mb = peak_memory_mb;
    return result;
}

execution_result execution_result::failed(evalbox::verdict verdict, const string &error, double elapsed_seconds, double peak_memory_mb) {
    execution_result result;
    result.verdict = verdict;
    result.error = error;
    result.elapsed_seconds = elapsed_seconds;
    result.peak_memory_mb = peak_memory_mb;
    return result;
}

void to_json(json &j, const execution_result &result) {
    j = {{"verdict", get_display_message(result.verdict)},
         {"output", result.output ? json(*result.output) : json()},
         {"error", result.error ? json(*result.error) : json()},
         {"time", result.elapsed_seconds},
         {"memory", result.peak_memory_mb}};
}

void from_json(const json &j, execution_result &result) {
    result.verdict = parse_verdict(get_value<string>(j, "verdict"));
    result.output = exists(j, "output") ? optional<string>(get_value<string>(j, "output")) : nullopt;
    result.error = exists(j, "error") ? optional<string>(get_value<string>(j, "error")) : nullopt;
    result.elapsed_seconds = get_value_def<double>(j, 0, "time");
    result.peak_memory_mb = get_value_def<double>(j, 0, "memory");
}

}  // namespace evalbox
