#include "sync/Engine.hpp"
#include "sync/Executor.hpp"
#include "storage/Backend.hpp"
#include "storage/List.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::sync;
using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::logging;
using namespace usync::fs::model;

Engine::Engine(std::shared_ptr<Backend> source, std::shared_ptr<Backend> destination,
               const SyncMode mode, CopyOptions opts)
    : source_(std::move(source)), destination_(std::move(destination)), mode_(mode), opts_(std::move(opts)) {
    if (!source_ || !destination_) throw std::invalid_argument("sync::Engine requires two backends");
}

std::vector<Entry> Engine::listSource(const std::string& root) const {
    return opts_.recursive ? listRecursive(*source_, root) : source_->list(root);
}

std::vector<Entry> Engine::listDestination(const std::string& root) const {
    try {
        return opts_.recursive ? listRecursive(*destination_, root) : destination_->list(root);
    } catch (const BackendError& e) {
        // A destination that cannot be listed yet is an empty one
        LogRegistry::sync()->debug("[Engine] Destination {} not listable, treating as empty: {}", root, e.what());
        return {};
    }
}

std::vector<model::Action> Engine::plan(const std::string& srcRoot, const std::string& dstRoot) const {
    if (mode_ == SyncMode::TwoWay) throw BackendError::unsupported("Two-way sync not yet implemented");

    const Listing source{srcRoot, listSource(srcRoot)};
    const Listing destination{dstRoot, mode_ == SyncMode::OneWay ? listDestination(dstRoot) : std::vector<Entry>{}};

    auto actions = Planner::build(source, destination, mode_, opts_.filters.get());
    LogRegistry::sync()->debug("[Engine] {} source / {} destination entries, {} actions planned",
                               source.entries.size(), destination.entries.size(), actions.size());
    return actions;
}

SyncStats Engine::sync(const std::string& srcRoot, const std::string& dstRoot) const {
    const auto actions = plan(srcRoot, dstRoot);

    const auto& transfer = source_->isRemote() ? *source_ : *destination_;
    const SyncContext ctx{*source_, *destination_, transfer, opts_};

    auto stats = Executor::run(ctx, actions);
    if (opts_.verbose) stats.logSummary();
    return stats;
}
