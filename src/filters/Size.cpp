#include "filters/Size.hpp"

using namespace usync::filters;
using namespace usync::fs::model;

Size::Size(const std::optional<uint64_t> min, const std::optional<uint64_t> max)
    : min_(min), max_(max) {}

bool Size::matches(const Entry& entry) const {
    if (entry.is_dir) return true;
    if (min_ && entry.size < *min_) return false;
    if (max_ && entry.size > *max_) return false;
    return true;
}
