#include "util/TextFile.hpp"

#include <fstream>
#include <sstream>

namespace baretree {

Expected<std::string> readTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::IoError, "failed to open " + path.string()};
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return Error{ErrorCode::IoError, "failed to read " + path.string()};
    return ss.str();
}

Expected<void> writeTextFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::IoError, "failed to open " + path.string() + " for writing"};
    out << content;
    out.close();
    if (!out) return Error{ErrorCode::IoError, "failed to write " + path.string()};
    return {};
}

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                             text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

}
