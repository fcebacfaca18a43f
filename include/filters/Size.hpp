#pragma once

#include "filters/Filter.hpp"

#include <cstdint>
#include <optional>

namespace usync::filters {

// Inclusive bounds on regular-file size. Directories always pass.
class Size final : public Filter {
public:
    Size(std::optional<uint64_t> min, std::optional<uint64_t> max);

    [[nodiscard]] bool matches(const fs::model::Entry& entry) const override;

private:
    std::optional<uint64_t> min_, max_;
};

}
