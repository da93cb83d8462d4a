#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <cstdint>
#include <iostream>
#include "run.hpp"
#include "system.hpp"

using namespace std;
namespace po = boost::program_options;

// 大小类参数不接受负数，lexical_cast<size_t>("-1") 会被转成一个巨大的正数
void validate(boost::any &v, const vector<string> &values, size_t *, int) {
    po::validators::check_first_occurrence(v);
    const string &s = po::validators::get_single_string(values);
    if (s.empty() || s[0] == '-')
        throw po::validation_error(po::validation_error::invalid_option_value);
    v = boost::lexical_cast<size_t>(s);
}

// 时间限制的格式为 soft[:hard]，省略 hard 时与 soft 相同
void validate(boost::any &v, const vector<string> &values, struct time_limit *, int) {
    po::validators::check_first_occurrence(v);
    const string &s = po::validators::get_single_string(values);
    auto colon = s.find(':');

    struct time_limit result;
    result.soft = boost::lexical_cast<double>(s.substr(0, colon));
    result.hard = colon == string::npos ? result.soft : boost::lexical_cast<double>(s.substr(colon + 1));

    if (!isfinite(result.soft) || !isfinite(result.hard) || result.soft < 0 || result.hard < result.soft)
        throw po::validation_error(po::validation_error::invalid_option_value);
    v = result;
}

static po::options_description describe_options() {
    po::options_description desc("runguard options");
    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "change root directory before running the command")
        ("work-dir,d", po::value<string>(), "change to this directory before running the command")
        ("read-only-dir", po::value<string>(), "remount this directory read-only for the command (requires --isolate)")
        ("scratch-dir", po::value<string>(), "the only directory the command is supposed to write to")
        ("user,u", po::value<string>(), "run the command as this user (name or id)")
        ("group,g", po::value<string>(), "run the command under this group (name or id), defaults to the user")
        ("wall-time,T", po::value<time_limit>(), "kill the command after soft[:hard] wall clock seconds")
        ("cpu-time,t", po::value<time_limit>(), "limit CPU time of the command to soft[:hard] seconds")
        ("memory-limit,m", po::value<size_t>(), "limit memory of the command in KB")
        ("file-limit,f", po::value<size_t>(), "limit size of files created by the command in KB")
        ("nproc,p", po::value<size_t>(), "limit number of processes living simultaneously")
        ("cpuset,P", po::value<string>(), "processor ids the command may run on (e.g. \"0,2-3\")")
        ("cpu-share,c", po::value<double>(), "fraction of one core the command may use (e.g. 0.5)")
        ("isolate", "run the command in new ipc/net/mount/uts namespaces (requires root privilege)")
        ("no-cgroup", "do not use cgroup, limit memory by address space and measure peak resident memory")
        ("no-core-dumps", "disable core dumps")
        ("standard-input-file,i", po::value<string>(), "redirect standard input of the command from file")
        ("standard-output-file,o", po::value<string>(), "redirect standard output of the command to file")
        ("standard-error-file,e", po::value<string>(), "redirect standard error of the command to file")
        ("stream-size", po::value<size_t>(), "truncate output streams of the command at this size in KB")
        ("environment,E", "preserve environment variables (otherwise only PATH is set)")
        ("variable,V", po::value<vector<string>>(), "additional environment variables (e.g. -Vkey=value)")
        ("out-meta,M", po::value<string>(), "write run time, exit code and memory usage to this meta file")
        ("cmd", po::value<vector<string>>()->composing(), "command")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    return desc;
}

template <typename T>
static void assign_if(const po::variables_map &vm, const char *key, T &field) {
    if (vm.count(key)) field = vm[key].as<T>();
}

/**
 * @brief 将命令行参数转换为 runguard_options
 * @throw std::runtime_error 用户或用户组不存在，或参数取值非法
 */
static runguard_options to_options(const po::variables_map &vm) {
    runguard_options opt;

    assign_if(vm, "root", opt.chroot_dir);
    assign_if(vm, "work-dir", opt.work_dir);
    assign_if(vm, "read-only-dir", opt.read_only_dir);
    assign_if(vm, "scratch-dir", opt.scratch_dir);
    assign_if(vm, "cpuset", opt.cpuset);
    assign_if(vm, "nproc", opt.nproc);
    assign_if(vm, "standard-input-file", opt.stdin_filename);
    assign_if(vm, "standard-output-file", opt.stdout_filename);
    assign_if(vm, "standard-error-file", opt.stderr_filename);
    assign_if(vm, "out-meta", opt.metafile_path);
    assign_if(vm, "variable", opt.env);
    assign_if(vm, "cmd", opt.command);

    if (vm.count("user")) {
        opt.user_id = resolve_user(vm["user"].as<string>());
        opt.group_id = resolve_group(vm.count("group") ? vm["group"].as<string>() : vm["user"].as<string>());
    } else if (vm.count("group")) {
        opt.group_id = resolve_group(vm["group"].as<string>());
    }

    if (vm.count("wall-time")) {
        opt.use_wall_limit = true;
        opt.wall_limit = vm["wall-time"].as<time_limit>();
    }
    if (vm.count("cpu-time")) {
        opt.use_cpu_limit = true;
        opt.cpu_limit = vm["cpu-time"].as<time_limit>();
    }

    if (vm.count("memory-limit")) {
        size_t kb = vm["memory-limit"].as<size_t>();
        // 溢出时视为不限制
        opt.memory_limit = kb > (size_t)(INT64_MAX / 1024) ? -1 : (int64_t)kb * 1024;
    }
    if (vm.count("file-limit")) opt.file_limit = vm["file-limit"].as<size_t>() * 1024;
    if (vm.count("stream-size")) opt.stream_size = vm["stream-size"].as<size_t>() * 1024;

    if (vm.count("cpu-share")) {
        opt.cpu_share = vm["cpu-share"].as<double>();
        if (!isfinite(opt.cpu_share) || opt.cpu_share <= 0)
            throw runtime_error("cpu-share must be a positive number");
    }

    opt.isolate = vm.count("isolate") > 0;
    opt.use_cgroup = vm.count("no-cgroup") == 0;
    opt.no_core_dumps = vm.count("no-core-dumps") > 0;
    opt.preserve_sys_env = vm.count("environment") > 0;
    return opt;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    po::options_description desc = describe_options();
    po::positional_options_description pos;
    pos.add("cmd", -1);
    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl << endl << desc << endl;
        return 1;
    }

    if (vm.count("help")) {
        cout << "Runguard: run a program under resource limits and report its usage." << endl
             << "Root privilege is required by 'root', 'user', 'isolate' and cgroup." << endl
             << "Usage: " << argv[0] << " [options] -- [command]" << endl
             << desc << endl;
        return 0;
    }

    if (vm.count("version")) {
        cout << "runguard" << endl;
        return 0;
    }

    if (!vm.count("cmd")) {
        cerr << "no command specified" << endl << endl << desc << endl;
        return 1;
    }

    runguard_options opt;
    try {
        opt = to_options(vm);
    } catch (exception &e) {
        cerr << e.what() << endl;
        return 1;
    }
    return runit(opt);
}
