#pragma once

#include "sync/model/Action.hpp"
#include "transfer/Options.hpp"

#include <string>
#include <vector>

namespace usync::filters { class Chain; }

namespace usync::sync {

struct Listing {
    std::string root;
    std::vector<fs::model::Entry> entries;
};

struct Planner {
    // One-way diff: copies for new or changed source files in listing order, then
    // deletes for destination files with no source counterpart. CopyOnly plans every
    // source file and never deletes. Directories never become actions.
    static std::vector<model::Action> build(const Listing& source, const Listing& destination,
                                            transfer::SyncMode mode, const filters::Chain* filter = nullptr);
};

}
