#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const fs::path &run_dir, bool keep) : keep(keep) {
    static thread_local boost::uuids::random_generator uuid_generator;
    dir = run_dir / ("run-" + boost::uuids::to_string(uuid_generator()));

    error_code ec;
    fs::create_directories(files(), ec);
    if (!ec) fs::create_directories(scratch(), ec);
    if (ec)
        throw internal_error("Unable to create workspace " + dir.string() + ": " + ec.message());

    // 选手程序可能以其他用户运行，需要能读取 workspace、写入 scratch
    fs::permissions(dir, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec, ec);
    fs::permissions(files(), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec, ec);
    fs::permissions(scratch(), fs::perms::all, ec);
}

workspace::~workspace() {
    if (keep) {
        LOG(INFO) << "keeping workspace " << dir << " in debug mode";
        return;
    }
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "unable to remove workspace " << dir << ": " << ec.message();
}

const fs::path &workspace::root() const {
    return dir;
}

fs::path workspace::files() const {
    return dir / "workspace";
}

fs::path workspace::scratch() const {
    return dir / "scratch";
}

void workspace::write_file(const string &name, const string &content) {
    try {
        fs::path path = files() / assert_safe_path(name);
        fs::create_directories(path.parent_path());
        write_file_content(path, content);
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read);
    } catch (std::exception &e) {
        throw internal_error("Unable to write input file " + name + ": " + e.what());
    }
}

}  // namespace grader
