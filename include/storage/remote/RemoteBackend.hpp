#pragma once

#include "storage/Backend.hpp"
#include "storage/Location.hpp"
#include "transfer/Settings.hpp"
#include "util/process.hpp"

namespace usync::storage::remote {

// Shared plumbing for backends that drive an external command-line tool
class RemoteBackend : public Backend {
public:
    RemoteBackend(Location location, transfer::TransferSettings settings);

    [[nodiscard]] bool isRemote() const override { return true; }
    [[nodiscard]] bool owns(const std::string& path) const override;

    [[nodiscard]] const Location& location() const { return location_; }

protected:
    // Exit 127 is ConnectionError, "No such file" on stderr is NotFound(subject),
    // any other non-zero exit is IoError carrying stderr or the exit code.
    util::ProcessResult run(const std::vector<std::string>& argv, const std::string& what,
                            const std::string& subject = {}) const;

    static void prepareLocalParent(const std::string& localPath);
    static uint64_t localSize(const std::string& localPath);

    // Exactly one side of a transfer must belong to this endpoint
    struct Direction {
        bool upload;
        std::string local, remote; // remote is the bare remote path
    };
    [[nodiscard]] Direction directionOf(const std::string& src, const std::string& dst) const;

    Location location_;
    transfer::TransferSettings settings_;
};

}
