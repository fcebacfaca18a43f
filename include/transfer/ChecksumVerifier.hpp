#pragma once

#include "transfer/Error.hpp"
#include "transfer/Options.hpp"

#include <optional>
#include <string>

namespace usync::storage { class Backend; }
namespace usync::filters { class Chain; }

namespace usync::transfer {

class ChecksumVerifier {
public:
    explicit ChecksumVerifier(ChecksumAlgorithm algo) : algo_(algo) {}

    [[nodiscard]] ChecksumAlgorithm algorithm() const { return algo_; }

    // Digests of both sides; nullopt when they agree
    [[nodiscard]] std::optional<ChecksumMismatch> compare(const storage::Backend& srcBackend, const std::string& src,
                                                          const storage::Backend& dstBackend, const std::string& dst) const;

    // Throws ChecksumMismatchError
    void verifyFile(const storage::Backend& srcBackend, const std::string& src,
                    const storage::Backend& dstBackend, const std::string& dst) const;

    // Every regular source file under srcRoot against its counterpart under dstRoot.
    // All mismatches are collected before one ChecksumMismatchError is thrown.
    // Files the filter rejects were never copied and are not checked.
    void verifyDirectory(const storage::Backend& srcBackend, const std::string& srcRoot,
                         const storage::Backend& dstBackend, const std::string& dstRoot,
                         const filters::Chain* filter = nullptr) const;

private:
    ChecksumAlgorithm algo_;
};

}
