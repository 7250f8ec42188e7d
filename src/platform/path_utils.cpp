#include "ctxstage/path_utils.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace ctxstage {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return p.lexically_normal().string();
}

} // namespace

PathResult resolve_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    if (!relative_path.empty() && relative_path[0] == '/') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(relative_path, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    return {true, join_components(root, normalized), PathError::None};
}

} // namespace ctxstage
