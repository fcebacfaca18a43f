#pragma once

#include "filters/Filter.hpp"

#include <memory>
#include <vector>

namespace usync::config { struct FiltersConfig; }

namespace usync::filters {

// Logical AND over every filter, evaluated in insertion order
class Chain final : public Filter {
public:
    Chain() = default;

    void add(std::unique_ptr<Filter> filter);

    [[nodiscard]] bool matches(const fs::model::Entry& entry) const override;

    [[nodiscard]] size_t size() const { return filters_.size(); }
    [[nodiscard]] bool empty() const { return filters_.empty(); }

    // Pattern, size, then date; only the kinds the config actually sets
    static std::shared_ptr<const Chain> fromConfig(const config::FiltersConfig& cfg);

private:
    std::vector<std::unique_ptr<Filter>> filters_;
};

}
