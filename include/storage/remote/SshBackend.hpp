#pragma once

#include "storage/remote/RemoteBackend.hpp"

namespace usync::storage::remote {

// scp for transfers, ssh for everything else
class SshBackend final : public RemoteBackend {
public:
    SshBackend(Location location, transfer::TransferSettings settings);

    [[nodiscard]] std::string name() const override { return "ssh"; }

    uint64_t copyFile(const std::string& src, const std::string& dst,
                      const transfer::CopyOptions& opts) const override;

    transfer::CopyStats copyDirectory(const std::string& src, const std::string& dst,
                                      const transfer::CopyOptions& opts) const override;

    [[nodiscard]] std::vector<fs::model::Entry> list(const std::string& path) const override;

    void remove(const std::string& path) const override;

    [[nodiscard]] std::string checksum(const std::string& path, transfer::ChecksumAlgorithm algo) const override;

    // user@host:path as scp expects it
    [[nodiscard]] std::string remoteSpec(const std::string& remotePath) const;

    [[nodiscard]] std::vector<std::string> scpArgs(const transfer::CopyOptions& opts, bool recursive,
                                                   const std::string& from, const std::string& to) const;

    [[nodiscard]] std::vector<std::string> sshArgs(const std::string& remoteCommand) const;

    // `ls -la` output; entries are URIs under dirUri. "." and ".." are dropped.
    static std::vector<fs::model::Entry> parseLsOutput(const std::string& output, const std::string& dirUri);

    static std::string checksumCommand(transfer::ChecksumAlgorithm algo);

private:
    [[nodiscard]] std::string destination() const;
    [[nodiscard]] uint16_t port() const { return location_.port.value_or(22); }
};

}
