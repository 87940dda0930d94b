#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/common/utils.hpp"
#include "evalbox/config.hpp"
#include "evalbox/sandbox/case_runner.hpp"
#include "evalbox/sandbox/posix_backend.hpp"
#include "evalbox/scoring/aggregator.hpp"
#include "evalbox/scoring/confusion_matrix.hpp"
using namespace std;
using namespace evalbox;
using nlohmann::json;
namespace po = boost::program_options;

static json read_json_file(const filesystem::path &path) {
    string content;
    try {
        content = read_file_content(path);
    } catch (system_error &ex) {
        throw invalid_input_error(ex.what());
    }
    json j = json::parse(content, nullptr, false);
    if (j.is_discarded())
        throw invalid_input_error("file " + path.string() + " is not a valid json document");
    return j;
}

static void write_output(const po::variables_map &vm, const json &report) {
    if (vm.count("output")) {
        write_file_content(vm.at("output").as<string>(), report.dump(2) + "\n");
    } else {
        cout << report.dump(2) << endl;
    }
}

/**
 * @brief 选项没有给出时从环境变量读取
 */
template <typename T>
static T option_or_env(const po::variables_map &vm, const string &option, const string &env, const T &def) {
    if (vm.count(option)) return vm.at(option).as<T>();
    string value = get_env(env, "");
    if (value.empty()) return def;
    try {
        return boost::lexical_cast<T>(value);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_input_error("environment variable " + env + " has invalid value " + value);
    }
}

static int run_mode(const po::variables_map &vm) {
    for (const char *required : {"source", "language", "cases"})
        if (!vm.count(required))
            throw invalid_input_error(string("--") + required + " is required in run mode");

    language_registry registry;
    string languages = vm.count("languages") ? vm.at("languages").as<string>() : get_env("LANGUAGES", "");
    if (!languages.empty()) registry.load(filesystem::path(languages));

    classification_policy policy;
    if (vm.count("policy")) policy = classification_policy::load(vm.at("policy").as<string>());

    program prog;
    try {
        prog.source = read_file_content(vm.at("source").as<string>());
    } catch (system_error &ex) {
        throw invalid_input_error(ex.what());
    }
    prog.language = vm.at("language").as<string>();
    // 提前检查语言，否则每个测试点都会得到 EXECUTION_FAILURE
    registry.find(prog.language);

    json cases_json = read_json_file(vm.at("cases").as<string>());
    if (!cases_json.is_array())
        throw invalid_input_error("cases file must contain a json array");
    auto cases = cases_json.get<vector<test_case>>();

    resource_limits limits = resource_limits::defaults();
    limits.wall_clock_seconds = option_or_env(vm, "time-limit", "TIMELIMIT", limits.wall_clock_seconds);
    limits.memory_megabytes = option_or_env(vm, "memory-limit", "MEMLIMIT", limits.memory_megabytes);
    limits.max_concurrency = option_or_env(vm, "concurrency", "CONCURRENCY", limits.max_concurrency);

    posix_backend backend;
    process_executor executor(backend, registry);
    case_runner runner(executor);
    vector<execution_result> results = runner.run_cases(prog, cases, limits);

    json report;
    report["results"] = results;

    bool has_expected = any_of(cases.begin(), cases.end(), [](const test_case &c) { return c.expected_output.has_value(); });
    if (has_expected) {
        vector<optional<string>> expected, generated;
        for (size_t i = 0; i < cases.size(); ++i) {
            expected.push_back(cases[i].expected_output);
            generated.push_back(results[i].verdict == verdict::OK ? results[i].output : nullopt);
        }
        report["confusion_matrix"] = calculate_confusion_matrix_stats(expected, generated, policy);
    }

    write_output(vm, report);
    return EXIT_SUCCESS;
}

static int aggregate_mode(const po::variables_map &vm) {
    if (!vm.count("responses"))
        throw invalid_input_error("--responses is required in aggregate mode");

    json responses = read_json_file(vm.at("responses").as<string>());
    confusion_matrix cm = aggregate(responses);
    LOG(INFO) << "Aggregated " << responses.size() << " responses, " << cm.total() << " samples";

    write_output(vm, json(cm));
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("evalbox options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>(), "run: run a program against test cases; aggregate: sum confusion matrices of evaluated responses")
        ("source", po::value<string>(), "source file of the program to run")
        ("language", po::value<string>(), "language of the source file, for example python, bash, sh")
        ("cases", po::value<string>(), "json file with an array of test cases, each either a string or {\"input\", \"expected_output\"}")
        ("responses", po::value<string>(), "json file with an array of responses, each optionally containing a confusion_matrix")
        ("time-limit", po::value<double>(), "wall clock limit in seconds of each case, default to 2. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<int>(), "memory limit in MB of each case, default to 256. You can either pass it from environ MEMLIMIT")
        ("concurrency", po::value<int>(), "maximum number of cases running at the same time, default to 8. You can either pass it from environ CONCURRENCY")
        ("languages", po::value<string>(), "json file registering additional languages. You can either pass it from environ LANGUAGES")
        ("policy", po::value<string>(), "json file configuring the classification of empty expected outputs")
        ("run-dir", po::value<string>(), "set the directory to run user programs. You can either pass it from environ RUNDIR")
        ("output", po::value<string>(), "write the json report to this file instead of standard output")
        ("debug", "turn on the debug mode to keep the run directories for checking the materialized sources.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("mode", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "evalbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("help") || !vm.count("mode")) {
        cout << "evalbox: run untrusted programs against test cases and score their outputs" << endl
             << "Usage: " << argv[0] << " run --source FILE --language LANG --cases FILE [options]" << endl
             << "       " << argv[0] << " aggregate --responses FILE [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("debug")) {
        DEBUG = true;
    } else if (getenv("DEBUG")) {
        DEBUG = true;
    }

    if (vm.count("run-dir")) {
        RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    error_code ec;
    filesystem::create_directories(RUN_DIR, ec);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist";

    string mode = vm.at("mode").as<string>();
    try {
        if (mode == "run") return run_mode(vm);
        if (mode == "aggregate") return aggregate_mode(vm);
        cerr << "Unrecognized mode " << mode << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (invalid_input_error &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << "evalbox has crashed, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
