#include "evalbox/scoring/confusion_matrix.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign.hpp>
#include <map>
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/common/json_utils.hpp"
#include "evalbox/scoring/normalizer.hpp"

namespace evalbox {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const map<category, const char *> category_names = boost::assign::map_list_of
    (category::TRUE_POSITIVE, "true_positive")
    (category::TRUE_NEGATIVE, "true_negative")
    (category::FALSE_POSITIVE, "false_positive")
    (category::FALSE_NEGATIVE, "false_negative");
// clang-format on

const char *get_display_message(category c) {
    return category_names.at(c);
}

static double safe_divide(double numerator, double denominator) {
    return denominator == 0 ? 0.0 : numerator / denominator;
}

confusion_matrix::confusion_matrix(uint64_t tp, uint64_t tn, uint64_t fp, uint64_t fn)
    : true_positives(tp), true_negatives(tn), false_positives(fp), false_negatives(fn) {}

uint64_t confusion_matrix::total() const {
    return true_positives + true_negatives + false_positives + false_negatives;
}

double confusion_matrix::accuracy() const {
    return safe_divide(true_positives + true_negatives, total());
}

double confusion_matrix::precision() const {
    return safe_divide(true_positives, true_positives + false_positives);
}

double confusion_matrix::recall() const {
    return safe_divide(true_positives, true_positives + false_negatives);
}

double confusion_matrix::specificity() const {
    return safe_divide(true_negatives, true_negatives + false_positives);
}

double confusion_matrix::f1_score() const {
    double p = precision(), r = recall();
    return safe_divide(2 * p * r, p + r);
}

void confusion_matrix::add(category c) {
    switch (c) {
        case category::TRUE_POSITIVE: ++true_positives; break;
        case category::TRUE_NEGATIVE: ++true_negatives; break;
        case category::FALSE_POSITIVE: ++false_positives; break;
        case category::FALSE_NEGATIVE: ++false_negatives; break;
    }
}

confusion_matrix &confusion_matrix::operator+=(const confusion_matrix &other) {
    true_positives += other.true_positives;
    true_negatives += other.true_negatives;
    false_positives += other.false_positives;
    false_negatives += other.false_negatives;
    return *this;
}

bool confusion_matrix::operator==(const confusion_matrix &other) const {
    return true_positives == other.true_positives &&
           true_negatives == other.true_negatives &&
           false_positives == other.false_positives &&
           false_negatives == other.false_negatives;
}

bool confusion_matrix::operator!=(const confusion_matrix &other) const {
    return !(*this == other);
}

confusion_matrix operator+(confusion_matrix a, const confusion_matrix &b) {
    a += b;
    return a;
}

void to_json(json &j, const confusion_matrix &cm) {
    j = {{"true_positives", cm.true_positives},
         {"true_negatives", cm.true_negatives},
         {"false_positives", cm.false_positives},
         {"false_negatives", cm.false_negatives},
         {"total_samples", cm.total()},
         {"accuracy", cm.accuracy()},
         {"precision", cm.precision()},
         {"recall", cm.recall()},
         {"specificity", cm.specificity()},
         {"f1_score", cm.f1_score()}};
}

static uint64_t get_count(const json &j, const char *key) {
    int64_t count = get_value_def<int64_t>(j, 0, key);
    if (count < 0)
        throw invalid_input_error(string(key) + " must not be negative in " + j.dump());
    return (uint64_t)count;
}

void from_json(const json &j, confusion_matrix &cm) {
    if (!j.is_object())
        throw invalid_input_error("confusion matrix must be an object, got " + j.dump());
    cm.true_positives = get_count(j, "true_positives");
    cm.true_negatives = get_count(j, "true_negatives");
    cm.false_positives = get_count(j, "false_positives");
    cm.false_negatives = get_count(j, "false_negatives");
}

void from_json(const json &j, classification_policy &policy) {
    string name = boost::algorithm::to_lower_copy(
        get_value_def<string>(j, "false_positive", "expected_empty_generated_nonempty"));
    for (auto &[c, display] : category_names) {
        if (name == display || name == string(display) + "s") {
            if (c == category::TRUE_POSITIVE)
                throw invalid_input_error("expected empty output can never be a true positive");
            policy.expected_empty_generated_nonempty = c;
            return;
        }
    }
    throw invalid_input_error("unknown classification category " + name);
}

classification_policy classification_policy::load(const fs::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        throw invalid_input_error(ex.what());
    }
    json config = json::parse(content, nullptr, false);
    if (config.is_discarded())
        throw invalid_input_error("classification policy " + path.string() + " is not a valid json document");

    classification_policy policy;
    from_json(config, policy);
    return policy;
}

category classify(const optional<string> &expected, const optional<string> &generated, const classification_policy &policy) {
    string expected_norm = light_trim(expected);
    string generated_norm = light_trim(generated);

    if (expected_norm.empty()) {
        if (generated_norm.empty()) return category::TRUE_NEGATIVE;
        return policy.expected_empty_generated_nonempty;
    }
    if (generated_norm.empty()) return category::FALSE_NEGATIVE;
    if (expected_norm == generated_norm) return category::TRUE_POSITIVE;
    return category::FALSE_POSITIVE;
}

confusion_matrix calculate_confusion_matrix_stats(const vector<optional<string>> &expected,
                                                  const vector<optional<string>> &generated,
                                                  const classification_policy &policy) {
    if (expected.size() != generated.size())
        throw invalid_input_error("expected and generated outputs must have the same length, got " +
                                  to_string(expected.size()) + " and " + to_string(generated.size()));

    confusion_matrix cm;
    for (size_t i = 0; i < expected.size(); ++i)
        cm.add(classify(expected[i], generated[i], policy));
    return cm;
}

confusion_matrix calculate_confusion_matrix_stats(const vector<string> &expected,
                                                  const vector<string> &generated,
                                                  const classification_policy &policy) {
    return calculate_confusion_matrix_stats(vector<optional<string>>(expected.begin(), expected.end()),
                                            vector<optional<string>>(generated.begin(), generated.end()),
                                            policy);
}

}  // namespace evalbox
