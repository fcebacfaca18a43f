#pragma once

#include "filters/Filter.hpp"

#include <string>
#include <vector>

namespace usync::filters {

// Shell globs matched against the whole entry path; '*' also crosses '/'.
// Excludes win over includes, and no includes means accept.
class Pattern final : public Filter {
public:
    Pattern(std::vector<std::string> include, std::vector<std::string> exclude);

    [[nodiscard]] bool matches(const fs::model::Entry& entry) const override;

    static bool isValidGlob(const std::string& pattern);

private:
    std::vector<std::string> include_, exclude_;
};

}
