#include "filters/Pattern.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <fmt/format.h>

using namespace usync::filters;
using namespace usync::fs::model;
using namespace usync::transfer;
using namespace usync::logging;

namespace {

bool globMatches(const std::string& pattern, const std::string& path) {
    return fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

void validateAll(const std::vector<std::string>& patterns, const char* which) {
    for (const auto& p : patterns)
        if (!Pattern::isValidGlob(p))
            throw BackendError(BackendError::Kind::Other, fmt::format("Invalid {} pattern: {}", which, p));
}

}

Pattern::Pattern(std::vector<std::string> include, std::vector<std::string> exclude)
    : include_(std::move(include)), exclude_(std::move(exclude)) {
    validateAll(include_, "include");
    validateAll(exclude_, "exclude");
    LogRegistry::filters()->debug("[Pattern] {} include, {} exclude globs", include_.size(), exclude_.size());
}

bool Pattern::matches(const Entry& entry) const {
    const auto hit = [&entry](const std::string& p) { return globMatches(p, entry.path); };

    if (std::ranges::any_of(exclude_, hit)) return false;
    if (include_.empty()) return true;
    return std::ranges::any_of(include_, hit);
}

// Rejects empty globs, unterminated character classes and dangling escapes
bool Pattern::isValidGlob(const std::string& pattern) {
    if (pattern.empty()) return false;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            if (++i >= pattern.size()) return false;
            continue;
        }
        if (c != '[') continue;

        size_t j = i + 1;
        if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) ++j;
        if (j < pattern.size() && pattern[j] == ']') ++j; // leading ']' is literal

        while (j < pattern.size() && pattern[j] != ']') ++j;
        if (j >= pattern.size()) return false;
        i = j;
    }
    return true;
}
