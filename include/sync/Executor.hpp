#pragma once

#include "transfer/Options.hpp"
#include "transfer/Stats.hpp"

#include <vector>

namespace usync::storage { class Backend; }

namespace usync::sync {

namespace model {
struct Action;
}

struct SyncContext {
    const storage::Backend& source;
    const storage::Backend& destination;
    const storage::Backend& transfer;  // moves the bytes for copies
    const transfer::CopyOptions& opts;
};

class Executor {
public:
    // All copies in plan order, then all deletes. The first failure aborts the run.
    static transfer::SyncStats run(const SyncContext& ctx, const std::vector<model::Action>& plan);

private:
    static void dispatch(const SyncContext& ctx, const model::Action& action, transfer::SyncStats& stats);
};

}
