#include "evalbox/scoring/aggregator.hpp"
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/json_utils.hpp"

namespace evalbox {
using namespace std;
using namespace nlohmann;

confusion_matrix aggregate(const vector<optional<confusion_matrix>> &matrices) {
    confusion_matrix sum;
    for (auto &cm : matrices)
        if (cm) sum += *cm;
    return sum;
}

confusion_matrix aggregate(const json &responses) {
    if (!responses.is_array())
        throw invalid_input_error("responses must be an array, got " + responses.dump());

    vector<optional<confusion_matrix>> matrices;
    for (auto &response : responses) {
        if (exists(response, "confusion_matrix"))
            matrices.push_back(access(response, "confusion_matrix").get<confusion_matrix>());
        else
            matrices.push_back(nullopt);
    }
    return aggregate(matrices);
}

}  // namespace evalbox
