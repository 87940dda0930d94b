#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/config.hpp"
#include "evalbox/scoring/confusion_matrix.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace evalbox;
using namespace nlohmann;

class ConfusionMatrixTest : public ::testing::Test {
protected:
    confusion_matrix sample{10, 5, 2, 3};
};

TEST_F(ConfusionMatrixTest, MetricsTest) {
    EXPECT_EQ(sample.total(), 20u);
    EXPECT_DOUBLE_EQ(sample.accuracy(), 0.75);
    EXPECT_NEAR(sample.precision(), 0.833333, 1e-3);
    EXPECT_NEAR(sample.recall(), 0.769231, 1e-3);
    EXPECT_NEAR(sample.specificity(), 0.714286, 1e-3);

    double precision = 10.0 / 12, recall = 10.0 / 13;
    EXPECT_NEAR(sample.f1_score(), 2 * precision * recall / (precision + recall), 1e-9);
}

TEST_F(ConfusionMatrixTest, ZeroDivisionTest) {
    confusion_matrix zero;
    EXPECT_EQ(zero.total(), 0u);
    EXPECT_EQ(zero.accuracy(), 0.0);
    EXPECT_EQ(zero.precision(), 0.0);
    EXPECT_EQ(zero.recall(), 0.0);
    EXPECT_EQ(zero.specificity(), 0.0);
    EXPECT_EQ(zero.f1_score(), 0.0);

    // 只有 TN 时 precision 和 recall 的分母为 0
    confusion_matrix negatives(0, 4, 0, 0);
    EXPECT_EQ(negatives.accuracy(), 1.0);
    EXPECT_EQ(negatives.precision(), 0.0);
    EXPECT_EQ(negatives.f1_score(), 0.0);
    EXPECT_EQ(negatives.specificity(), 1.0);
}

TEST_F(ConfusionMatrixTest, AdditionTest) {
    confusion_matrix other(5, 3, 1, 2);
    EXPECT_EQ(sample + other, confusion_matrix(15, 8, 3, 5));
    EXPECT_EQ(sample + other, other + sample);

    confusion_matrix third(1, 1, 1, 1);
    EXPECT_EQ((sample + other) + third, sample + (other + third));

    confusion_matrix acc;
    acc += sample;
    acc += other;
    EXPECT_EQ(acc, sample + other);
}

TEST_F(ConfusionMatrixTest, ClassifyTest) {
    EXPECT_EQ(classify(string(""), string("")), category::TRUE_NEGATIVE);
    EXPECT_EQ(classify(string("N/A"), string(" error ")), category::TRUE_NEGATIVE);
    EXPECT_EQ(classify(nullopt, nullopt), category::TRUE_NEGATIVE);
    EXPECT_EQ(classify(string(""), string("42")), category::FALSE_POSITIVE);
    EXPECT_EQ(classify(string("42"), string("42\n")), category::TRUE_POSITIVE);
    EXPECT_EQ(classify(string("Hello"), string("hello")), category::TRUE_POSITIVE);
    EXPECT_EQ(classify(string("42"), string("")), category::FALSE_NEGATIVE);
    EXPECT_EQ(classify(string("42"), nullopt), category::FALSE_NEGATIVE);
    EXPECT_EQ(classify(string("42"), string("43")), category::FALSE_POSITIVE);

    // light_trim 保留内部空白
    EXPECT_EQ(classify(string("1 2"), string("1  2")), category::FALSE_POSITIVE);
}

TEST_F(ConfusionMatrixTest, PolicyTest) {
    classification_policy policy;
    EXPECT_EQ(policy.expected_empty_generated_nonempty, category::FALSE_POSITIVE);

    policy.expected_empty_generated_nonempty = category::TRUE_NEGATIVE;
    EXPECT_EQ(classify(string(""), string("42"), policy), category::TRUE_NEGATIVE);
    EXPECT_EQ(classify(string("1"), string("2"), policy), category::FALSE_POSITIVE);

    json j = {{"expected_empty_generated_nonempty", "false_negative"}};
    EXPECT_EQ(j.get<classification_policy>().expected_empty_generated_nonempty, category::FALSE_NEGATIVE);

    EXPECT_THROW(json({{"expected_empty_generated_nonempty", "true_positive"}}).get<classification_policy>(), invalid_input_error);
    EXPECT_THROW(json({{"expected_empty_generated_nonempty", "maybe"}}).get<classification_policy>(), invalid_input_error);
    EXPECT_EQ(json::object().get<classification_policy>().expected_empty_generated_nonempty, category::FALSE_POSITIVE);
}

TEST_F(ConfusionMatrixTest, PolicyFileTest) {
    temporary_directory dir(RUN_DIR, "policy-");
    write_file_content(dir.path() / "policy.json", R"({"expected_empty_generated_nonempty": "true_negative"})");
    EXPECT_EQ(classification_policy::load(dir.path() / "policy.json").expected_empty_generated_nonempty, category::TRUE_NEGATIVE);

    write_file_content(dir.path() / "broken.json", "{");
    EXPECT_THROW(classification_policy::load(dir.path() / "broken.json"), invalid_input_error);
    EXPECT_THROW(classification_policy::load(dir.path() / "missing.json"), invalid_input_error);
}

TEST_F(ConfusionMatrixTest, AllCorrectTest) {
    vector<string> expected = {"1", "2", "3"};
    vector<string> generated = {"1", "2", "3"};
    confusion_matrix cm = calculate_confusion_matrix_stats(expected, generated);
    EXPECT_EQ(cm, confusion_matrix(3, 0, 0, 0));
    EXPECT_EQ(cm.accuracy(), 1.0);
}

TEST_F(ConfusionMatrixTest, AllIncorrectTest) {
    vector<string> expected = {"1", "2", "3"};
    vector<string> generated = {"4", "5", "6"};
    EXPECT_EQ(calculate_confusion_matrix_stats(expected, generated), confusion_matrix(0, 0, 3, 0));
}

TEST_F(ConfusionMatrixTest, MixedResultsTest) {
    vector<string> expected = {"1", "2", "3"};
    vector<string> generated = {"1", "99", "3"};
    EXPECT_EQ(calculate_confusion_matrix_stats(expected, generated), confusion_matrix(2, 0, 1, 0));
}

TEST_F(ConfusionMatrixTest, EmptyGeneratedTest) {
    vector<string> expected = {"1", "2", "3"};
    vector<string> generated = {"1", "", "3"};
    EXPECT_EQ(calculate_confusion_matrix_stats(expected, generated), confusion_matrix(2, 0, 0, 1));
}

TEST_F(ConfusionMatrixTest, BothEmptyTest) {
    vector<string> expected = {"", "", ""};
    vector<string> generated = {"", "", ""};
    EXPECT_EQ(calculate_confusion_matrix_stats(expected, generated), confusion_matrix(0, 3, 0, 0));
}

TEST_F(ConfusionMatrixTest, CaseInsensitiveTest) {
    vector<string> expected = {"Hello", "WORLD"};
    vector<string> generated = {"hello", "world"};
    EXPECT_EQ(calculate_confusion_matrix_stats(expected, generated).true_positives, 2u);
}

TEST_F(ConfusionMatrixTest, TotalEqualsLengthTest) {
    vector<optional<string>> expected = {string("a"), nullopt, string(""), string("b"), string("N/A")};
    vector<optional<string>> generated = {string("a"), string("x"), nullopt, string("c"), string("")};
    confusion_matrix cm = calculate_confusion_matrix_stats(expected, generated);
    EXPECT_EQ(cm.total(), expected.size());
    EXPECT_GE(cm.accuracy(), 0.0);
    EXPECT_LE(cm.accuracy(), 1.0);
}

TEST_F(ConfusionMatrixTest, LengthMismatchTest) {
    vector<string> expected = {"1", "2", "3"};
    vector<string> generated = {"1", "2"};
    EXPECT_THROW(calculate_confusion_matrix_stats(expected, generated), invalid_input_error);
    EXPECT_THROW(calculate_confusion_matrix_stats(vector<string>(), generated), invalid_input_error);
}

TEST_F(ConfusionMatrixTest, JsonTest) {
    json j = sample;
    EXPECT_EQ(j["true_positives"], 10);
    EXPECT_EQ(j["true_negatives"], 5);
    EXPECT_EQ(j["false_positives"], 2);
    EXPECT_EQ(j["false_negatives"], 3);
    EXPECT_EQ(j["total_samples"], 20);
    EXPECT_DOUBLE_EQ(j["accuracy"].get<double>(), 0.75);
    for (auto key : {"precision", "recall", "specificity", "f1_score"})
        EXPECT_TRUE(j.count(key)) << key;

    EXPECT_EQ(j.get<confusion_matrix>(), sample);

    json partial = {{"true_positives", 4}};
    EXPECT_EQ(partial.get<confusion_matrix>(), confusion_matrix(4, 0, 0, 0));

    EXPECT_THROW(json({{"true_positives", -1}}).get<confusion_matrix>(), invalid_input_error);
    EXPECT_THROW(json({{"true_positives", "many"}}).get<confusion_matrix>(), invalid_input_error);
    EXPECT_THROW(json::array().get<confusion_matrix>(), invalid_input_error);
}

TEST_F(ConfusionMatrixTest, ZeroJsonTest) {
    json expected = {{"true_positives", 0},
                     {"true_negatives", 0},
                     {"false_positives", 0},
                     {"false_negatives", 0},
                     {"total_samples", 0},
                     {"accuracy", 0.0},
                     {"precision", 0.0},
                     {"recall", 0.0},
                     {"specificity", 0.0},
                     {"f1_score", 0.0}};
    EXPECT_JSON_EQ(json(confusion_matrix()), expected);
}
