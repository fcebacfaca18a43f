#pragma once

#include "sync/Planner.hpp"
#include "transfer/Options.hpp"
#include "transfer/Stats.hpp"

#include <memory>
#include <string>

namespace usync::storage { class Backend; }

namespace usync::sync {

// Listing -> Diff -> Apply, recomputed from live listings on every call
class Engine {
public:
    Engine(std::shared_ptr<storage::Backend> source, std::shared_ptr<storage::Backend> destination,
           transfer::SyncMode mode, transfer::CopyOptions opts);

    transfer::SyncStats sync(const std::string& srcRoot, const std::string& dstRoot) const;

    // Listing and diff only
    [[nodiscard]] std::vector<model::Action> plan(const std::string& srcRoot, const std::string& dstRoot) const;

    [[nodiscard]] transfer::SyncMode mode() const { return mode_; }
    void setMode(transfer::SyncMode mode) { mode_ = mode; }

    [[nodiscard]] const transfer::CopyOptions& options() const { return opts_; }
    void setOptions(transfer::CopyOptions opts) { opts_ = std::move(opts); }

private:
    [[nodiscard]] std::vector<fs::model::Entry> listSource(const std::string& root) const;
    [[nodiscard]] std::vector<fs::model::Entry> listDestination(const std::string& root) const;

    std::shared_ptr<storage::Backend> source_, destination_;
    transfer::SyncMode mode_;
    transfer::CopyOptions opts_;
};

}
