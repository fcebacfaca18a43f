#pragma once

#include "filters/Filter.hpp"

#include <cstdint>
#include <optional>

namespace usync::filters {

// Inclusive bounds on modification time (epoch seconds).
// Entries without a modification time cannot be judged and pass.
class Date final : public Filter {
public:
    Date(std::optional<uint64_t> min, std::optional<uint64_t> max);

    [[nodiscard]] bool matches(const fs::model::Entry& entry) const override;

private:
    std::optional<uint64_t> min_, max_;
};

}
