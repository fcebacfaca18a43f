#pragma once

#include "fs/model/Entry.hpp"
#include "transfer/Options.hpp"
#include "transfer/Stats.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace usync::storage {

// One implementation per location kind. Backends keep no mutable state between
// calls, so a single instance may be driven from several workers at once.
class Backend : public std::enable_shared_from_this<Backend> {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Exactly one regular file. Missing destination parents are created.
    virtual uint64_t copyFile(const std::string& src, const std::string& dst,
                              const transfer::CopyOptions& opts) const = 0;

    // Whole tree; requires opts.recursive. Not transactional.
    virtual transfer::CopyStats copyDirectory(const std::string& src, const std::string& dst,
                                              const transfer::CopyOptions& opts) const = 0;

    // A file yields itself, a directory its immediate children
    [[nodiscard]] virtual std::vector<fs::model::Entry> list(const std::string& path) const = 0;

    virtual void remove(const std::string& path) const = 0;

    [[nodiscard]] virtual std::string checksum(const std::string& path, transfer::ChecksumAlgorithm algo) const = 0;

    // True when list() succeeds, false on NotFound; every other failure propagates
    [[nodiscard]] virtual bool exists(const std::string& path) const;

    // Remote backends claim the paths that carry their URI prefix
    [[nodiscard]] virtual bool isRemote() const { return false; }
    [[nodiscard]] virtual bool owns(const std::string& path) const;
};

}
