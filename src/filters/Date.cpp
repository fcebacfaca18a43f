#include "filters/Date.hpp"

using namespace usync::filters;
using namespace usync::fs::model;

Date::Date(const std::optional<uint64_t> min, const std::optional<uint64_t> max)
    : min_(min), max_(max) {}

bool Date::matches(const Entry& entry) const {
    if (!entry.modified) return true;
    const auto mtime = *entry.modified;
    if (min_ && mtime < *min_) return false;
    if (max_ && mtime > *max_) return false;
    return true;
}
