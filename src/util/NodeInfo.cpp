#include "util/NodeInfo.hpp"

namespace fs = std::filesystem;

namespace baretree {

NodeInfo getNodeInfo(const fs::path& p, std::error_code& ec) {
    NodeInfo info;
    ec.clear();

    // Symlinks must be detected before any directory/file branching
    fs::file_status st = fs::symlink_status(p, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) ec.clear();
        return info;
    }

    switch (st.type()) {
        case fs::file_type::not_found:
            return info;
        case fs::file_type::symlink:
            info.type = NodeType::Symlink;
            info.symlinkTarget = fs::read_symlink(p, ec);
            break;
        case fs::file_type::directory:
            info.type = NodeType::Directory;
            break;
        case fs::file_type::regular:
            info.type = NodeType::RegularFile;
            break;
        default:
            info.type = NodeType::Other;
            break;
    }
    info.permissions = st.permissions() & fs::perms::mask;
    return info;
}

const char* nodeTypeName(NodeType type) {
    switch (type) {
        case NodeType::Missing: return "missing";
        case NodeType::RegularFile: return "file";
        case NodeType::Directory: return "directory";
        case NodeType::Symlink: return "symlink";
        case NodeType::Other: return "special file";
    }
    return "unknown";
}

}
