#include "util/Paths.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace Paths {

fs::path normalizeAbsolute(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    if (abs.filename().empty() && abs.has_relative_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

bool isWithin(const fs::path& parent, const fs::path& child) {
    fs::path rel = normalizeAbsolute(child).lexically_relative(normalizeAbsolute(parent));
    if (rel.empty()) return false;
    auto first = rel.begin();
    return *first != "..";
}

bool isStrictAncestor(const fs::path& ancestor, const fs::path& descendant) {
    fs::path rel = normalizeAbsolute(descendant).lexically_relative(normalizeAbsolute(ancestor));
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

std::size_t componentCount(const fs::path& relative) {
    std::size_t n = 0;
    for (const auto& part : relative.lexically_normal()) {
        if (part.empty() || part == ".") continue;
        ++n;
    }
    return n;
}

fs::path canonicalOrNormal(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) return normalizeAbsolute(p);
    return normalizeAbsolute(c);
}

}

}
