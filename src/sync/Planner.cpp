#include "sync/Planner.hpp"
#include "filters/Chain.hpp"
#include "transfer/Error.hpp"
#include "util/fsPath.hpp"

#include <unordered_map>
#include <unordered_set>

using namespace usync::sync;
using namespace usync::sync::model;
using namespace usync::transfer;
using namespace usync::util;
using namespace usync::fs::model;

namespace {

std::string relOrThrow(const std::string& root, const Entry& e) {
    auto rel = relativeTo(root, e.path);
    if (!rel) throw BackendError::invalidPath(e.path, "Listed entry is outside of " + root);
    return *rel;
}

}

namespace usync::sync::model {

std::string to_string(const ActionType type) {
    switch (type) {
        case ActionType::Copy: return "copy";
        case ActionType::Delete: return "delete";
    }
    return "unknown";
}

}

std::vector<Action> Planner::build(const Listing& source, const Listing& destination,
                                   const SyncMode mode, const filters::Chain* filter) {
    if (mode == SyncMode::TwoWay) throw BackendError::unsupported("Two-way sync not yet implemented");

    std::vector<Action> plan;
    plan.reserve(source.entries.size());

    std::unordered_map<std::string, const Entry*> dstByRel;
    if (mode == SyncMode::OneWay)
        for (const auto& d : destination.entries) dstByRel.emplace(relOrThrow(destination.root, d), &d);

    std::unordered_set<std::string> srcRels;

    for (const auto& s : source.entries) {
        const auto rel = relOrThrow(source.root, s);
        srcRels.insert(rel);

        if (s.is_dir) continue;
        if (filter && !filter->matches(s)) continue;

        if (mode == SyncMode::OneWay) {
            const auto it = dstByRel.find(rel);
            if (it != dstByRel.end() && it->second->sameAs(s)) continue;
        }

        plan.push_back({ActionType::Copy, rel, s.path, joinUnder(destination.root, rel), s.size});
    }

    if (mode == SyncMode::OneWay) {
        for (const auto& d : destination.entries) {
            if (d.is_dir) continue;
            const auto rel = relOrThrow(destination.root, d);
            if (!srcRels.contains(rel)) plan.push_back({ActionType::Delete, rel, {}, d.path, d.size});
        }
    }

    return plan;
}
