#include <thread>
#include "evalbox/common/concurrent_queue.hpp"
#include "evalbox/common/defer.hpp"
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/common/status.hpp"
#include "evalbox/config.hpp"
#include "evalbox/sandbox/execution_result.hpp"
#include "evalbox/sandbox/program.hpp"
#include "evalbox/sandbox/resource_limits.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace evalbox;
using namespace nlohmann;

class CommonTest : public ::testing::Test {
};

TEST_F(CommonTest, VerdictTest) {
    EXPECT_STREQ(get_display_message(verdict::OK), "OK");
    EXPECT_STREQ(get_display_message(verdict::RUNTIME_ERROR), "Runtime Error");
    EXPECT_STREQ(get_display_message(verdict::TIME_LIMIT_ERROR), "Time Limit Error");
    EXPECT_STREQ(get_display_message(verdict::MEMORY_LIMIT_ERROR), "Memory Limit Error");
    EXPECT_STREQ(get_display_message(verdict::EXECUTION_FAILURE), "Execution Failure");

    for (auto v : {verdict::OK, verdict::RUNTIME_ERROR, verdict::TIME_LIMIT_ERROR, verdict::MEMORY_LIMIT_ERROR, verdict::EXECUTION_FAILURE})
        EXPECT_EQ(parse_verdict(get_display_message(v)), v);
    EXPECT_THROW(parse_verdict("Accepted"), invalid_input_error);
}

TEST_F(CommonTest, ResourceLimitsTest) {
    resource_limits limits = resource_limits::defaults();
    EXPECT_DOUBLE_EQ(limits.wall_clock_seconds, 2.0);
    EXPECT_EQ(limits.memory_megabytes, 256);
    EXPECT_EQ(limits.max_concurrency, 8);
    EXPECT_NO_THROW(validate(limits));

    EXPECT_THROW(validate(resource_limits{-1, 256, 8}), invalid_input_error);
    EXPECT_THROW(validate(resource_limits{2, 0, 8}), invalid_input_error);
    EXPECT_THROW(validate(resource_limits{2, 256, 0}), invalid_input_error);
    EXPECT_THROW(validate(resource_limits{2, 256, -1}), invalid_input_error);
}

TEST_F(CommonTest, ExecutionResultJsonTest) {
    json ok = execution_result::ok("42\n", 0.5, 12.5);
    json expected = {{"verdict", "OK"}, {"output", "42\n"}, {"error", nullptr}, {"time", 0.5}, {"memory", 12.5}};
    EXPECT_JSON_EQ(ok, expected);

    execution_result tle = json::parse(R"({"verdict": "Time Limit Error", "error": "time limit exceeded", "time": 2.1})").get<execution_result>();
    EXPECT_EQ(tle.verdict, verdict::TIME_LIMIT_ERROR);
    EXPECT_FALSE(tle.output.has_value());
    EXPECT_EQ(tle.error, string("time limit exceeded"));
    EXPECT_DOUBLE_EQ(tle.elapsed_seconds, 2.1);
    EXPECT_DOUBLE_EQ(tle.peak_memory_mb, 0);

    EXPECT_THROW(json::parse(R"({"verdict": "Wrong Answer"})").get<execution_result>(), invalid_input_error);
}

TEST_F(CommonTest, TestCaseJsonTest) {
    auto cases = json::parse(R"(["1 2", {"input": "3 4", "expected_output": "7"}, {"input": "5", "expected_output": null}])").get<vector<test_case>>();
    ASSERT_EQ(cases.size(), 3u);
    EXPECT_EQ(cases[0].input, "1 2");
    EXPECT_FALSE(cases[0].expected_output.has_value());
    EXPECT_EQ(cases[1].expected_output, string("7"));
    EXPECT_FALSE(cases[2].expected_output.has_value());

    vector<string> inputs = {"1 2", "3 4", "5"};
    EXPECT_EQ(inputs_of(cases), inputs);

    EXPECT_THROW(json::parse(R"([42])").get<vector<test_case>>(), invalid_input_error);
    EXPECT_THROW(json::parse(R"([{"expected_output": "7"}])").get<vector<test_case>>(), invalid_input_error);
}

TEST_F(CommonTest, ConcurrentQueueTest) {
    concurrent_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.pop(), optional<int>(1));

    queue.close();
    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop(), optional<int>(2));
    EXPECT_EQ(queue.pop(), nullopt);
}

TEST_F(CommonTest, ConcurrentQueueWakeUpTest) {
    concurrent_queue<int> queue;
    optional<int> received = 0;
    thread reader([&] { received = queue.pop(); });
    queue.close();
    reader.join();
    EXPECT_FALSE(received.has_value());
}

TEST_F(CommonTest, DeferTest) {
    int counter = 0;
    {
        defer { ++counter; };
        EXPECT_EQ(counter, 0);
    }
    EXPECT_EQ(counter, 1);

    {
        auto guard = scoped_guard() + [&] { ++counter; };
        guard.dismiss();
    }
    EXPECT_EQ(counter, 1);

    // 清理函数抛出的异常不会离开析构函数
    EXPECT_NO_THROW({ defer { throw runtime_error("cleanup"); }; });
}

TEST_F(CommonTest, TemporaryDirectoryTest) {
    filesystem::path path;
    {
        temporary_directory dir(RUN_DIR, "tmp-");
        path = dir.path();
        EXPECT_TRUE(filesystem::is_directory(path));
        write_file_content(path / "a.txt", "content");
        EXPECT_EQ(read_file_content(path / "a.txt"), "content");
        EXPECT_THROW(read_file_content(path / "b.txt"), system_error);
    }
    EXPECT_FALSE(filesystem::exists(path));

    {
        temporary_directory dir(RUN_DIR, "keep-");
        path = dir.path();
        dir.keep();
    }
    EXPECT_TRUE(filesystem::exists(path));
    filesystem::remove_all(path);
}

TEST_F(CommonTest, SafePathTest) {
    EXPECT_EQ(assert_safe_path("main.py"), "main.py");
    EXPECT_THROW(assert_safe_path("../main.py"), runtime_error);
    EXPECT_THROW(assert_safe_path("/etc/passwd"), runtime_error);
    EXPECT_THROW(assert_safe_path(""), runtime_error);
}
