#include "common/io_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace grader {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const filesystem::path &path, size_t limit) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace grader
