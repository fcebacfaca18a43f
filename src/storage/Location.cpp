#include "storage/Location.hpp"
#include "transfer/Error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fmt/format.h>

using namespace usync::storage;
using namespace usync::transfer;

namespace {

Protocol protocolFromScheme(const std::string& input, std::string scheme) {
    std::ranges::transform(scheme, scheme.begin(), [](unsigned char c) { return std::tolower(c); });
    if (scheme == "file") return Protocol::Local;
    if (scheme == "ssh") return Protocol::Ssh;
    if (scheme == "sftp") return Protocol::Sftp;
    if (scheme == "s3") return Protocol::S3;
    if (scheme == "http") return Protocol::Http;
    if (scheme == "https") return Protocol::Https;
    throw BackendError::invalidPath(input, fmt::format("Unsupported protocol '{}'", scheme));
}

std::optional<uint16_t> parsePort(const std::string& input, const std::string& text) {
    if (text.empty()) return std::nullopt;
    unsigned int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 65535)
        throw BackendError::invalidPath(input, fmt::format("Invalid port '{}'", text));
    return static_cast<uint16_t>(value);
}

// Relative ssh paths are carried as "/~/rel" inside a URI
constexpr auto HOME_MARKER = "/~/";

}

namespace usync::storage {

std::string to_string(const Protocol protocol) {
    switch (protocol) {
        case Protocol::Local: return "local";
        case Protocol::Ssh: return "ssh";
        case Protocol::Sftp: return "sftp";
        case Protocol::S3: return "s3";
        case Protocol::Http: return "http";
        case Protocol::Https: return "https";
    }
    return "unknown";
}

}

Location Location::local(std::string path) {
    Location loc;
    loc.path = std::move(path);
    return loc;
}

Location Location::parse(const std::string& input) {
    if (input.empty()) throw BackendError::invalidPath(input, "Empty location");

    if (const auto schemeEnd = input.find("://"); schemeEnd != std::string::npos) {
        Location loc;
        loc.protocol = protocolFromScheme(input, input.substr(0, schemeEnd));

        const auto rest = input.substr(schemeEnd + 3);
        if (loc.protocol == Protocol::Local) return local(rest.empty() ? "/" : rest);

        const auto slash = rest.find('/');
        auto authority = rest.substr(0, slash);
        loc.path = slash == std::string::npos ? "/" : rest.substr(slash);

        if (const auto at = authority.rfind('@'); at != std::string::npos) {
            loc.user = authority.substr(0, at);
            authority = authority.substr(at + 1);
        }

        if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
            loc.port = parsePort(input, authority.substr(colon + 1));
            authority = authority.substr(0, colon);
        }

        if (authority.empty()) throw BackendError::invalidPath(input, "Missing host");
        loc.host = authority;

        if (loc.path == "/~") loc.path = ".";
        else if (loc.path.starts_with(HOME_MARKER)) loc.path = loc.path.substr(3);
        return loc;
    }

    // user@host:path
    if (const auto at = input.find('@'); at != std::string::npos) {
        const auto afterAt = input.substr(at + 1);
        const auto colon = afterAt.find(':');
        if (colon != std::string::npos && colon > 0 && !afterAt.starts_with("//")) {
            Location loc;
            loc.protocol = Protocol::Ssh;
            loc.user = input.substr(0, at);
            loc.host = afterAt.substr(0, colon);
            loc.path = afterAt.substr(colon + 1);
            if (loc.path.empty()) loc.path = ".";
            return loc;
        }
    }

    return local(input);
}

std::string Location::prefix() const {
    if (!isRemote()) return {};

    std::string out = to_string(protocol) + "://";
    if (!user.empty()) out += user + '@';
    out += host;
    if (port) out += fmt::format(":{}", *port);
    return out;
}

std::string Location::uriFor(const std::string& remotePath) const {
    if (!isRemote()) return remotePath;
    if (remotePath.starts_with('/')) return prefix() + remotePath;
    if (remotePath == "." || remotePath.empty()) return prefix() + "/~";
    return prefix() + HOME_MARKER + remotePath;
}

std::string Location::str() const {
    return uriFor(path);
}

std::string Location::remotePathOf(const std::string& pathOrUri) const {
    if (!isRemote()) return pathOrUri;

    const auto pre = prefix();
    if (!pathOrUri.starts_with(pre)) return pathOrUri;

    auto rest = pathOrUri.substr(pre.size());
    if (rest.empty()) return "/";
    if (rest == "/~") return ".";
    if (rest.starts_with(HOME_MARKER)) return rest.substr(3);
    return rest;
}
