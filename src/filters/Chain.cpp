#include "filters/Chain.hpp"
#include "filters/Pattern.hpp"
#include "filters/Size.hpp"
#include "filters/Date.hpp"
#include "config/Config.hpp"

#include <algorithm>

using namespace usync::filters;
using namespace usync::fs::model;

void Chain::add(std::unique_ptr<Filter> filter) {
    if (filter) filters_.push_back(std::move(filter));
}

bool Chain::matches(const Entry& entry) const {
    return std::ranges::all_of(filters_, [&entry](const auto& f) { return f->matches(entry); });
}

std::shared_ptr<const Chain> Chain::fromConfig(const config::FiltersConfig& cfg) {
    if (cfg.empty()) return nullptr;

    auto chain = std::make_shared<Chain>();
    if (!cfg.include.empty() || !cfg.exclude.empty())
        chain->add(std::make_unique<Pattern>(cfg.include, cfg.exclude));
    if (cfg.min_size || cfg.max_size)
        chain->add(std::make_unique<Size>(cfg.min_size, cfg.max_size));
    if (cfg.min_date || cfg.max_date)
        chain->add(std::make_unique<Date>(cfg.min_date, cfg.max_date));
    return chain;
}
