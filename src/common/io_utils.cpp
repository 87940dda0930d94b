#include "evalbox/common/io_utils.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <fstream>
#include <system_error>
#include <vector>

namespace evalbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout << content;
    if (!fout.flush())
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

temporary_directory::temporary_directory(const fs::path &parent, const string &prefix) {
    fs::create_directories(parent);
    string pattern = (parent / (prefix + "XXXXXX")).string();
    vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
        throw system_error(errno, system_category(), "unable to create temporary directory in " + parent.string());
    dir = fs::path(buf.data());
    valid = true;
}

temporary_directory::temporary_directory(temporary_directory &&other)
    : dir(move(other.dir)), valid(other.valid) {
    other.valid = false;
}

temporary_directory &temporary_directory::operator=(temporary_directory &&other) {
    swap(dir, other.dir);
    swap(valid, other.valid);
    return *this;
}

temporary_directory::~temporary_directory() {
    if (!valid) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove temporary directory " << dir << ": " << ec.message();
}

const fs::path &temporary_directory::path() const {
    return dir;
}

void temporary_directory::keep() {
    valid = false;
}

}  // namespace evalbox
