#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace executor {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw internal_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const filesystem::path &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw internal_error("Unable to create file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout) throw internal_error("Unable to write file " + path.string());
}

}  // namespace executor
