#pragma once

#include "transfer/Options.hpp"
#include "transfer/Stats.hpp"

#include <memory>
#include <string>

namespace usync::storage { class Backend; }

namespace usync::transfer {

// Drives plain copies between two endpoints. Bytes move through the transfer
// backend: the source backend when it is remote, the destination backend otherwise.
class CopyEngine {
public:
    CopyEngine(std::shared_ptr<storage::Backend> source, std::shared_ptr<storage::Backend> destination,
               CopyOptions opts);

    // Single file, then checksum verification when requested
    uint64_t copyFile(const std::string& src, const std::string& dst) const;

    // Whole tree, then collect-all verification when requested
    CopyStats copyDirectory(const std::string& src, const std::string& dst) const;

    // File or directory, decided by listing the source
    CopyStats copy(const std::string& src, const std::string& dst) const;

    // Copy, verify, then delete the source. Dry runs only report.
    CopyStats move(const std::string& src, const std::string& dst) const;

    // Buffered copy continuing at offset; local endpoints only
    uint64_t copyFileResuming(const std::string& src, const std::string& dst, uint64_t offset) const;

    [[nodiscard]] const storage::Backend& transferBackend() const;
    [[nodiscard]] const CopyOptions& options() const { return opts_; }

    [[nodiscard]] bool isDirectory(const std::string& src) const;

private:
    std::shared_ptr<storage::Backend> source_, destination_;
    CopyOptions opts_;
};

}
