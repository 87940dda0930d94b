#include "evalbox/sandbox/case_runner.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <thread>
#include "evalbox/common/concurrent_queue.hpp"
#include "evalbox/common/utils.hpp"

namespace evalbox {
using namespace std;

static thread start_thread(function<void()> task) {
    return thread(move(task));
}

case_runner::case_runner(const process_executor &executor, thread_factory spawn)
    : executor(executor), spawn(spawn ? move(spawn) : thread_factory(start_thread)) {}

/**
 * @brief worker 主循环
 * 不断从队列中取出测试点下标直到队列为空，每个下标只会被一个 worker 取到，
 * 因此 results 的每个位置只会被写一次，不需要加锁。
 */
static void worker_loop(int worker_id, const process_executor &executor, const program &prog,
                        const vector<string> &inputs, const resource_limits &limits,
                        concurrent_queue<size_t> &task_queue, vector<execution_result> &results) {
    while (auto index = task_queue.pop()) {
        try {
            results[*index] = executor.execute(prog, inputs[*index], limits);
        } catch (exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when running case " << *index << ", " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            results[*index] = execution_result::failed(verdict::EXECUTION_FAILURE, ex.what(), 0, 0);
        }
    }
}

vector<execution_result> case_runner::run_cases(const program &prog, const vector<string> &inputs, const resource_limits &limits) const {
    validate(limits);

    vector<execution_result> results(inputs.size());
    if (inputs.empty()) return results;

    concurrent_queue<size_t> task_queue;
    for (size_t i = 0; i < inputs.size(); ++i) task_queue.push(i);
    task_queue.close();

    size_t worker_count = min(inputs.size(), (size_t)limits.max_concurrency);
    LOG(INFO) << "Running " << inputs.size() << " " << prog.language << " cases with " << worker_count << " workers";

    elapsed_time timer;
    vector<thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        try {
            workers.push_back(spawn([&, i] {
                worker_loop((int)i, executor, prog, inputs, limits, task_queue, results);
            }));
        } catch (exception &ex) {
            LOG(WARNING) << "Unable to start worker " << i << ", continuing with " << workers.size() << " workers, " << ex.what();
            break;
        }
    }

    if (workers.empty()) {
        worker_loop(0, executor, prog, inputs, limits, task_queue, results);
    }
    for (auto &worker : workers) worker.join();

    size_t ok = count_if(results.begin(), results.end(), [](const execution_result &r) { return r.verdict == verdict::OK; });
    LOG(INFO) << "Finished " << inputs.size() << " cases in " << timer.seconds() << "s, " << ok << " OK";
    return results;
}

vector<execution_result> case_runner::run_cases(const program &prog, const vector<test_case> &cases, const resource_limits &limits) const {
    return run_cases(prog, inputs_of(cases), limits);
}

}  // namespace evalbox
