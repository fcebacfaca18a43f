#pragma once

#include "storage/remote/RemoteBackend.hpp"

namespace usync::util { struct HttpResponse; }

namespace usync::storage::remote {

// Read-only endpoint: downloads and checksums over libcurl, nothing else
class HttpBackend final : public RemoteBackend {
public:
    HttpBackend(Location location, transfer::TransferSettings settings);

    [[nodiscard]] std::string name() const override { return "http"; }

    uint64_t copyFile(const std::string& src, const std::string& dst,
                      const transfer::CopyOptions& opts) const override;

    transfer::CopyStats copyDirectory(const std::string& src, const std::string& dst,
                                      const transfer::CopyOptions& opts) const override;

    [[nodiscard]] std::vector<fs::model::Entry> list(const std::string& path) const override;

    void remove(const std::string& path) const override;

    // Digest of the response body, streamed without a temp file
    [[nodiscard]] std::string checksum(const std::string& path, transfer::ChecksumAlgorithm algo) const override;

    [[nodiscard]] std::string url(const std::string& pathOrUri) const;

private:
    static void raiseFor(const util::HttpResponse& res, const std::string& url);
};

}
