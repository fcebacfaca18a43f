#include "storage/remote/SshBackend.hpp"
#include "transfer/Error.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <sstream>
#include <fmt/format.h>

using namespace usync::storage::remote;
using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::util;
using namespace usync::logging;
using namespace usync::fs::model;

SshBackend::SshBackend(Location location, TransferSettings settings)
    : RemoteBackend(std::move(location), std::move(settings)) {
    if (location_.host.empty()) throw BackendError::connection("No host specified");
}

std::string SshBackend::destination() const {
    if (location_.user.empty()) return location_.host;
    return location_.user + '@' + location_.host;
}

std::string SshBackend::remoteSpec(const std::string& remotePath) const {
    return destination() + ':' + remotePath;
}

std::vector<std::string> SshBackend::scpArgs(const CopyOptions& opts, const bool recursive,
                                             const std::string& from, const std::string& to) const {
    std::vector<std::string> args{settings_.scpBin};
    if (recursive) args.emplace_back("-r");
    if (port() != 22) {
        args.emplace_back("-P");
        args.push_back(std::to_string(port()));
    }
    if (!opts.verbose && !opts.progress) args.emplace_back("-q");

    for (const auto& o : location_.options) {
        args.emplace_back("-o");
        args.push_back(o);
    }
    for (const auto& o : opts.ssh_opts) {
        args.emplace_back("-o");
        args.push_back(o);
    }

    args.push_back(from);
    args.push_back(to);
    return args;
}

std::vector<std::string> SshBackend::sshArgs(const std::string& remoteCommand) const {
    std::vector<std::string> args{settings_.sshBin};
    if (port() != 22) {
        args.emplace_back("-p");
        args.push_back(std::to_string(port()));
    }
    for (const auto& o : location_.options) {
        args.emplace_back("-o");
        args.push_back(o);
    }
    args.push_back(destination());
    args.push_back(remoteCommand);
    return args;
}

uint64_t SshBackend::copyFile(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    const auto dir = directionOf(src, dst);

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would scp {} -> {}", src, dst);
        return 0;
    }

    if (dir.upload) {
        std::error_code ec;
        if (!std::filesystem::exists(dir.local, ec)) throw BackendError::notFound(dir.local);
        run(scpArgs(opts, false, dir.local, remoteSpec(dir.remote)), "scp", dst);
        return localSize(dir.local);
    }

    prepareLocalParent(dir.local);
    run(scpArgs(opts, false, remoteSpec(dir.remote), dir.local), "scp", src);
    return localSize(dir.local);
}

CopyStats SshBackend::copyDirectory(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    if (!opts.recursive) throw BackendError::unsupported("Recursive copy requires the recursive option");

    const auto dir = directionOf(src, dst);
    auto stats = opts.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would scp -r {} -> {}", src, dst);
        return stats;
    }

    if (dir.upload) {
        run(scpArgs(opts, true, dir.local, remoteSpec(dir.remote)), "scp -r", dst);
    } else {
        prepareLocalParent(dir.local);
        run(scpArgs(opts, true, remoteSpec(dir.remote), dir.local), "scp -r", src);
    }

    // scp reports no per-file totals
    return stats;
}

std::vector<Entry> SshBackend::list(const std::string& path) const {
    const auto remotePath = location_.remotePathOf(path);
    const auto res = run(sshArgs("ls -la " + shellQuote(remotePath)), "ssh ls", location_.uriFor(remotePath));

    auto entries = parseLsOutput(res.out, location_.uriFor(remotePath));

    // ls on a file prints the file itself under the name we gave it
    if (entries.size() == 1 && !entries.front().is_dir) {
        const auto& only = entries.front().path;
        const auto asGiven = joinUnder(location_.uriFor(remotePath), remotePath);
        if (only == asGiven) entries.front().path = location_.uriFor(remotePath);
    }
    return entries;
}

std::vector<Entry> SshBackend::parseLsOutput(const std::string& output, const std::string& dirUri) {
    std::vector<Entry> entries;
    std::istringstream in(output);
    std::string line;

    while (std::getline(in, line)) {
        if (line.starts_with("total ")) continue;

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string tok;
        while (parts.size() < 8 && fields >> tok) parts.push_back(tok);
        if (parts.size() < 8) continue;

        std::string name;
        std::getline(fields >> std::ws, name);
        if (name.empty()) continue;

        const bool isDir = parts[0].starts_with('d');
        if (parts[0].starts_with('l')) {
            if (const auto arrow = name.find(" -> "); arrow != std::string::npos) name = name.substr(0, arrow);
        }
        if (name == "." || name == "..") continue;

        uint64_t size = 0;
        std::from_chars(parts[4].data(), parts[4].data() + parts[4].size(), size);

        entries.push_back({joinUnder(dirUri, name), isDir ? 0 : size, isDir, std::nullopt});
    }
    return entries;
}

void SshBackend::remove(const std::string& path) const {
    const auto remotePath = location_.remotePathOf(path);
    const auto quoted = shellQuote(remotePath);
    run(sshArgs(fmt::format("ls -d {} >/dev/null && rm -rf {}", quoted, quoted)), "ssh rm", location_.uriFor(remotePath));
}

std::string SshBackend::checksumCommand(const ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Md5: return "md5sum";
        case ChecksumAlgorithm::Sha1: return "sha1sum";
        case ChecksumAlgorithm::Sha256: return "sha256sum";
    }
    return "md5sum";
}

std::string SshBackend::checksum(const std::string& path, const ChecksumAlgorithm algo) const {
    const auto remotePath = location_.remotePathOf(path);
    const auto cmd = checksumCommand(algo);
    const auto res = run(sshArgs(cmd + ' ' + shellQuote(remotePath)), "ssh " + cmd, location_.uriFor(remotePath));

    std::istringstream in(res.out);
    std::string hash;
    if (!(in >> hash) || hash.size() != digestHexLength(algo))
        throw BackendError(BackendError::Kind::Other, fmt::format("Failed to parse {} output", cmd), path);
    return hash;
}
