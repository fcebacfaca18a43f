#pragma once

#include "storage/remote/RemoteBackend.hpp"

namespace usync::storage::remote {

// Bucket is the location host; everything goes through the aws CLI
class S3Backend final : public RemoteBackend {
public:
    S3Backend(Location location, transfer::TransferSettings settings);

    [[nodiscard]] std::string name() const override { return "s3"; }

    uint64_t copyFile(const std::string& src, const std::string& dst,
                      const transfer::CopyOptions& opts) const override;

    transfer::CopyStats copyDirectory(const std::string& src, const std::string& dst,
                                      const transfer::CopyOptions& opts) const override;

    [[nodiscard]] std::vector<fs::model::Entry> list(const std::string& path) const override;

    void remove(const std::string& path) const override;

    // MD5 only, read from the object's ETag
    [[nodiscard]] std::string checksum(const std::string& path, transfer::ChecksumAlgorithm algo) const override;

    [[nodiscard]] const std::string& bucket() const { return location_.host; }

    // Object key without a leading slash
    [[nodiscard]] std::string keyOf(const std::string& pathOrUri) const;
    [[nodiscard]] std::string s3Url(const std::string& pathOrUri) const;

    // aws <args...> [--endpoint-url X]
    [[nodiscard]] std::vector<std::string> awsArgs(std::vector<std::string> args) const;

    [[nodiscard]] std::vector<std::string> cpArgs(const transfer::CopyOptions& opts,
                                                  const std::string& from, const std::string& to) const;

    // `aws s3 ls` output; PRE lines are directories. Paths are URIs under dirUri.
    static std::vector<fs::model::Entry> parseLsOutput(const std::string& output, const std::string& dirUri);

    // Quoted ETag from head-object JSON, unquoted
    static std::string parseETag(const std::string& headObjectJson);
};

}
