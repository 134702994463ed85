#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath.find("/..") != string::npos || subpath == "..")
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_directory::scoped_directory(const fs::path &path) : dir(path), valid(false) {
    if (!fs::create_directories(dir))
        throw fs::filesystem_error("directory already exists", dir, make_error_code(errc::file_exists));
    valid = true;
}

scoped_directory::scoped_directory(scoped_directory &&other) : valid(false) {
    *this = move(other);
}

scoped_directory::~scoped_directory() {
    release();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) {
    swap(dir, other.dir);
    swap(valid, other.valid);
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::release() {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "unable to remove directory " << dir << ": " << ec.message();
}

}  // namespace codejudge
