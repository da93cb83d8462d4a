#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <fmt/core.h>
#include <iostream>
#include "analyzer/analyzer.hpp"
#include "batch/manifest.hpp"
#include "batch/orchestrator.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/coordinator.hpp"
#include "sandbox/runguard_backend.hpp"
#include "sandbox/sandbox.hpp"
using namespace std;

static grader::batch_orchestrator *running_batch = nullptr;

void sigintHandler(int /* signum */) {
    if (running_batch) running_batch->cancel();
}

static void print_summary(const grader::batch_outcome &outcome) {
    cout << fmt::format("Total: {}, processed: {}, failed: {}, time: {:.2f}s (average {:.2f}s)",
                        outcome.total, outcome.processed, outcome.failed, outcome.processing_time, outcome.average_time)
         << endl;
    if (outcome.average_score)
        cout << fmt::format("Average score: {:.1f}", *outcome.average_score) << endl;
    for (auto &[grade, count] : outcome.score_distribution)
        cout << "  " << grade << ": " << count << endl;
    for (auto &result : outcome.results)
        if (!result.success)
            cout << fmt::format("  #{} {}: {}", result.index, result.student.value_or("-"),
                                result.error_message.value_or(get_display_message(result.status)))
                 << endl;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given JSON file, command line options override it")
        ("batch", po::value<string>(), "grade submissions listed in the given JSON manifest")
        ("run", po::value<string>(), "run a single python file")
        ("stdin", po::value<string>(), "file passed as standard input when used with --run")
        ("output", po::value<string>(), "write results as JSON into the given file, default to stdout")
        ("timeout", po::value<double>(), "default and maximum wall clock time limit in seconds")
        ("memory-limit", po::value<string>(), "default and maximum memory limit, e.g. 128m")
        ("cpu-share", po::value<double>(), "CPU share of each execution unit, 0.5 means half a core")
        ("max-concurrent", po::value<size_t>(), "maximum number of submissions graded concurrently")
        ("max-batch-size", po::value<size_t>(), "maximum number of submissions in a batch")
        ("max-source-size", po::value<size_t>(), "maximum size of a submission in bytes")
        ("sequential", "grade submissions one by one in the main thread")
        ("risks-fatal", "reject submissions matching any deny pattern")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNDIR")
        ("runguard", po::value<string>(), "set the path of runguard. You can either pass it from environ RUNGUARD")
        ("python", po::value<string>(), "set the python interpreter used in execution units. You can either pass it from environ PYTHON")
        ("run-user", po::value<string>(), "run submissions as the given user")
        ("run-group", po::value<string>(), "run submissions as the given group")
        ("isolate", "unshare namespaces and mount workspaces read-only, requires root privilege")
        ("no-cgroup", "do not use cgroups, memory is limited by RLIMIT_AS")
        ("debug", "turn on the debug mode, workspaces will not be deleted to check the validity of files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Run python submissions in a sandbox and grade them against tests" << endl
             << "Usage: " << argv[0] << " [options] (--batch manifest.json | --run file.py)" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("batch") && !vm.count("run")) {
        cerr << "Either --batch or --run should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    grader::grader_config config;
    vector<grader::batch_item> items;
    try {
        if (vm.count("config"))
            config = grader::load_config(vm.at("config").as<string>());

        if (vm.count("timeout")) config.timeout = vm.at("timeout").as<double>();
        if (vm.count("memory-limit")) config.memory_limit = grader::parse_memory_size(vm.at("memory-limit").as<string>());
        if (vm.count("cpu-share")) config.cpu_share = vm.at("cpu-share").as<double>();
        if (vm.count("max-concurrent")) config.max_concurrent = vm.at("max-concurrent").as<size_t>();
        if (vm.count("max-batch-size")) config.max_batch_size = vm.at("max-batch-size").as<size_t>();
        if (vm.count("max-source-size")) config.max_source_size = vm.at("max-source-size").as<size_t>();
        if (vm.count("sequential")) config.sequential = true;
        if (vm.count("risks-fatal")) config.risks_fatal = true;
        if (vm.count("run-user")) config.run_user = vm.at("run-user").as<string>();
        if (vm.count("run-group")) config.run_group = vm.at("run-group").as<string>();
        if (vm.count("isolate")) config.isolate = true;
        if (vm.count("no-cgroup")) config.use_cgroup = false;

        if (vm.count("debug") || !grader::get_env("DEBUG", "").empty())
            config.debug = true;

        if (vm.count("run-dir")) {
            config.run_dir = vm.at("run-dir").as<string>();
        } else {
            config.run_dir = grader::get_env("RUNDIR", config.run_dir.string());
        }
        if (config.run_dir.empty())
            config.run_dir = filesystem::temp_directory_path() / "grader";
        filesystem::create_directories(config.run_dir);

        if (vm.count("runguard")) {
            config.runguard = vm.at("runguard").as<string>();
        } else {
            config.runguard = grader::get_env("RUNGUARD", config.runguard.string());
        }
        // 默认情况下，假设 runguard 与 grader 编译在同一个目录下
        if (config.runguard.empty())
            config.runguard = repo_dir / "runguard";

        if (vm.count("python")) {
            config.python = vm.at("python").as<string>();
        } else {
            config.python = grader::get_env("PYTHON", config.python);
        }

        grader::check_config(config);

        if (vm.count("batch")) {
            items = grader::load_manifest(vm.at("batch").as<string>());
        } else {
            grader::batch_item item;
            filesystem::path path = vm.at("run").as<string>();
            item.student = path.stem().string();
            item.request.source = grader::read_file_content(path);
            if (vm.count("stdin"))
                item.request.stdin_data = grader::read_file_content(vm.at("stdin").as<string>());
            items.push_back(move(item));
        }
    } catch (std::exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(filesystem::is_directory(config.run_dir))
        << "Run directory " << config.run_dir << " does not exist";

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    Py_Initialize();
    grader::PyThread_guard guard;

    grader::runguard_backend_options backend_options;
    backend_options.runguard = config.runguard;
    if (!config.run_user.empty()) backend_options.run_user = config.run_user;
    if (!config.run_group.empty()) backend_options.run_group = config.run_group;
    backend_options.use_cgroup = config.use_cgroup;
    backend_options.isolate = config.isolate;

    grader::runguard_backend backend(backend_options);
    try {
        backend.open();
    } catch (grader::sandbox_unavailable& e) {
        // 后端不可用时每个提交都会以 RUNTIME_UNAVAILABLE 结束，仍然输出完整的结果
        LOG(ERROR) << "Isolation backend is not available: " << e.what();
    }

    int exitcode = EXIT_FAILURE;
    try {
        grader::sandbox box(backend, config.run_dir, config.debug);
        grader::execution_coordinator coordinator(config, box);
        grader::line_metrics_analyzer analyzer;
        grader::grading_pipeline pipeline(coordinator, &analyzer);
        grader::batch_orchestrator orchestrator(pipeline, config.max_batch_size);

        running_batch = &orchestrator;
        signal(SIGINT, sigintHandler);
        grader::batch_outcome outcome = orchestrator.process_batch(items, config.max_concurrent, config.sequential);
        signal(SIGINT, SIG_DFL);
        running_batch = nullptr;

        nlohmann::json j;
        if (vm.count("run")) j = outcome.results.front();
        else j = outcome;
        string output = j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);

        if (vm.count("output")) {
            grader::write_file_content(vm.at("output").as<string>(), output);
            print_summary(outcome);
        } else {
            cout << output << endl;
        }
        exitcode = outcome.success ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (std::exception& e) {
        running_batch = nullptr;
        LOG(ERROR) << "Grading failed: " << e.what() << endl
                   << boost::diagnostic_information(e);
    }

    backend.close();
    return exitcode;
}
