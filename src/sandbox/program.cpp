#include "evalbox/sandbox/program.hpp"
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/json_utils.hpp"

namespace evalbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &c) {
    if (j.is_string()) {
        c.input = j.get<string>();
        c.expected_output = nullopt;
    } else if (j.is_object()) {
        c.input = get_value<string>(j, "input");
        c.expected_output = exists(j, "expected_output") ? optional<string>(get_value<string>(j, "expected_output")) : nullopt;
    } else {
        throw invalid_input_error("test case must be a string or an object, got " + j.dump());
    }
}

vector<string> inputs_of(const vector<test_case> &cases) {
    vector<string> inputs;
    inputs.reserve(cases.size());
    for (auto &c : cases) inputs.push_back(c.input);
    return inputs;
}

}  // namespace evalbox
