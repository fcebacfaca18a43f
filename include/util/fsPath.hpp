#pragma once

#include <optional>
#include <string>

// String-level path helpers. They work the same on local paths and remote URIs,
// which is why they never go through std::filesystem.
namespace usync::util {

inline std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/' && !path.ends_with("://")) path.pop_back();
    return path;
}

// Path of `path` below `root`, without a leading slash; "" for the root itself.
// nullopt when path does not live under root.
inline std::optional<std::string> relativeTo(const std::string& root, const std::string& path) {
    const auto base = trimTrailingSlash(root);
    const auto full = trimTrailingSlash(path);

    if (full == base) return std::string{};

    const auto prefix = base.ends_with('/') ? base : base + '/';
    if (!full.starts_with(prefix)) return std::nullopt;
    return full.substr(prefix.size());
}

inline std::string joinUnder(const std::string& root, const std::string& rel) {
    if (rel.empty()) return root;
    const auto start = rel.find_first_not_of('/');
    if (start == std::string::npos) return root;
    if (root.ends_with('/')) return root + rel.substr(start);
    return root + '/' + rel.substr(start);
}

inline std::string baseName(const std::string& path) {
    const auto trimmed = trimTrailingSlash(path);
    const auto pos = trimmed.find_last_of('/');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

}
