#pragma once

#include "fs/model/Entry.hpp"

namespace usync::filters {

struct Filter {
    virtual ~Filter() = default;
    [[nodiscard]] virtual bool matches(const fs::model::Entry& entry) const = 0;
};

}
