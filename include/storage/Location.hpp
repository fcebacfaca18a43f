#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usync::storage {

enum class Protocol { Local, Ssh, Sftp, S3, Http, Https };

std::string to_string(Protocol protocol);

// Resolved endpoint: a local path, or a remote descriptor handed to a tool-backed backend
struct Location {
    Protocol protocol{Protocol::Local};
    std::string user{};
    std::string host{};
    std::optional<uint16_t> port{};
    std::string path{};
    std::vector<std::string> options{}; // opaque, e.g. ssh -o values

    static Location local(std::string path);

    // scheme://[user@]host[:port]/path, user@host:path (ssh), anything else is local
    static Location parse(const std::string& input);

    [[nodiscard]] bool isRemote() const { return protocol != Protocol::Local; }

    // scheme://[user@]host[:port] for remotes, empty for local
    [[nodiscard]] std::string prefix() const;

    // Full URI for remotes, the plain path for local
    [[nodiscard]] std::string str() const;

    // The URI-form of another path on the same endpoint
    [[nodiscard]] std::string uriFor(const std::string& remotePath) const;

    // Accepts a URI under prefix() or a bare remote path; returns the bare path
    [[nodiscard]] std::string remotePathOf(const std::string& pathOrUri) const;
};

}
