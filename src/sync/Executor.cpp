#include "sync/Executor.hpp"
#include "sync/model/Action.hpp"
#include "storage/Backend.hpp"
#include "transfer/ChecksumVerifier.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::sync;
using namespace usync::sync::model;
using namespace usync::transfer;
using namespace usync::logging;

SyncStats Executor::run(const SyncContext& ctx, const std::vector<Action>& plan) {
    SyncStats stats;

    // Copies form the first phase, deletes the second
    for (const auto type : {ActionType::Copy, ActionType::Delete}) {
        for (const auto& a : plan) {
            if (a.type != type) continue;
            dispatch(ctx, a, stats);
        }
    }

    return stats;
}

void Executor::dispatch(const SyncContext& ctx, const Action& action, SyncStats& stats) {
    if (ctx.opts.dry_run) {
        LogRegistry::sync()->info("[dry-run] Would {} {}", to_string(action.type),
                                  action.type == ActionType::Copy ? action.from + " -> " + action.to : action.to);
        return;
    }

    switch (action.type) {
    case ActionType::Copy: {
        if (ctx.opts.verbose) LogRegistry::sync()->info("Copying: {} -> {}", action.from, action.to);
        const auto bytes = ctx.transfer.copyFile(action.from, action.to, ctx.opts);
        if (ctx.opts.checksum) ChecksumVerifier(*ctx.opts.checksum).verifyFile(ctx.source, action.from, ctx.destination, action.to);
        ++stats.files_copied;
        stats.bytes_copied += bytes;
        return;
    }
    case ActionType::Delete:
        if (ctx.opts.verbose) LogRegistry::sync()->info("Deleting: {}", action.to);
        ctx.destination.remove(action.to);
        ++stats.files_deleted;
        return;
    }
}
