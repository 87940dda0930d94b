#include "evalbox/sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <algorithm>
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/config.hpp"

namespace evalbox {
using namespace std;
namespace fs = std::filesystem;

const int64_t STREAM_SIZE = 64 << 20;

const char *TIME_LIMIT_MESSAGE = "time limit exceeded";

// 程序在地址空间上限下分配内存失败时的特征，峰值内存此时往往还没有超过限制
static const vector<string> MEMORY_SIGNATURES = {
    "MemoryError",
    "OutOfMemoryError",
    "std::bad_alloc",
    "Cannot allocate memory"};

static bool contains_any(const string &text, const vector<string> &signatures) {
    return any_of(signatures.begin(), signatures.end(), [&](const string &sig) {
        return !sig.empty() && text.find(sig) != string::npos;
    });
}

execution_result classify_outcome(const raw_outcome &outcome, const language_spec &lang, const resource_limits &limits) {
    double elapsed = max(0.0, outcome.elapsed_seconds);
    double memory = max(0.0, outcome.peak_memory_mb);

    if (!outcome.spawned)
        return execution_result::failed(verdict::EXECUTION_FAILURE, outcome.spawn_error, elapsed, memory);

    // SIGXCPU 来自 CPU 时间限制，它是时钟时间限制的后备
    if (outcome.timed_out || elapsed > limits.wall_clock_seconds || outcome.term_signal == SIGXCPU)
        return execution_result::failed(verdict::TIME_LIMIT_ERROR, TIME_LIMIT_MESSAGE, elapsed, memory);

    bool failed = outcome.exit_code != 0 || outcome.term_signal != -1;
    if (outcome.memory_exceeded || memory > limits.memory_megabytes ||
        (failed && contains_any(outcome.stderr_data, MEMORY_SIGNATURES))) {
        string message = memory > limits.memory_megabytes
                             ? fmt::format("memory limit exceeded ({:.1f}MB > {}MB)", memory, limits.memory_megabytes)
                             : fmt::format("memory allocation failed under the {}MB limit", limits.memory_megabytes);
        if (!outcome.stderr_data.empty()) message += "\n" + outcome.stderr_data;
        return execution_result::failed(verdict::MEMORY_LIMIT_ERROR, message, elapsed, memory);
    }

    if (failed || contains_any(outcome.stderr_data, lang.error_signatures)) {
        string message = outcome.stderr_data;
        if (message.empty()) {
            if (outcome.term_signal != -1)
                message = fmt::format("terminated by signal {}", outcome.term_signal);
            else
                message = fmt::format("exited with code {}", outcome.exit_code);
        }
        return execution_result::failed(verdict::RUNTIME_ERROR, message, elapsed, memory);
    }

    if (outcome.output_truncated)
        LOG(WARNING) << "Output of " << lang.name << " program was truncated to " << STREAM_SIZE << " bytes";
    return execution_result::ok(outcome.stdout_data, elapsed, memory);
}

process_executor::process_executor(process_backend &backend, const language_registry &registry)
    : backend(backend), registry(registry) {}

execution_result process_executor::execute(const program &prog, const string &input, const resource_limits &limits) const {
    validate(limits);

    try {
        return run(prog, input, limits);
    } catch (internal_error &ex) {
        LOG(WARNING) << "Execution failure of " << prog.language << " program: " << ex;
        return execution_result::failed(verdict::EXECUTION_FAILURE, ex.what(), 0, 0);
    } catch (invalid_input_error &ex) {
        // 未知的语言等问题只影响这一个测试点
        LOG(WARNING) << "Unable to run " << prog.language << " program: " << ex.what();
        return execution_result::failed(verdict::EXECUTION_FAILURE, ex.what(), 0, 0);
    } catch (exception &ex) {
        LOG(WARNING) << "Unable to prepare " << prog.language << " program: " << ex.what();
        return execution_result::failed(verdict::EXECUTION_FAILURE, ex.what(), 0, 0);
    }
}

execution_result process_executor::run(const program &prog, const string &input, const resource_limits &limits) const {
    const language_spec &lang = registry.find(prog.language);

    temporary_directory workdir(RUN_DIR, "run-");
    if (DEBUG) {
        LOG(INFO) << "Keeping run directory " << workdir.path();
        workdir.keep();
    }

    fs::path source_path = workdir.path() / assert_safe_path(lang.source_file);
    write_file_content(source_path, prog.source);

    launch_request request;
    request.command = lang.build_command(source_path);
    request.work_dir = workdir.path();
    request.env = lang.env;
    request.stdin_data = input;
    request.wall_limit_seconds = limits.wall_clock_seconds;
    request.memory_limit = (int64_t)limits.memory_megabytes << 20;
    if (lang.limit_address_space)
        request.address_space_limit = request.memory_limit;
    request.stream_size = STREAM_SIZE;

    raw_outcome outcome = backend.run(request);
    if (!outcome.spawned)
        LOG(WARNING) << "Unable to spawn " << lang.name << " program: " << outcome.spawn_error;

    execution_result result = classify_outcome(outcome, lang, limits);
    if (result.verdict == verdict::TIME_LIMIT_ERROR)
        LOG(WARNING) << "Killed " << lang.name << " program after " << result.elapsed_seconds << "s";
    return result;
}

}  // namespace evalbox
