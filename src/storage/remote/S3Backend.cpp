#include "storage/remote/S3Backend.hpp"
#include "transfer/Error.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace usync::storage::remote;
using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::util;
using namespace usync::logging;
using namespace usync::fs::model;

namespace {

bool isMissingKey(const BackendError& e) {
    return e.kind() == BackendError::Kind::IoError && e.cause() == "Exit code: 1";
}

}

S3Backend::S3Backend(Location location, TransferSettings settings)
    : RemoteBackend(std::move(location), std::move(settings)) {
    if (location_.host.empty()) throw BackendError::invalidPath(location_.str(), "No bucket specified");
}

std::string S3Backend::keyOf(const std::string& pathOrUri) const {
    auto key = location_.remotePathOf(pathOrUri);
    const auto start = key.find_first_not_of('/');
    return start == std::string::npos ? std::string{} : key.substr(start);
}

std::string S3Backend::s3Url(const std::string& pathOrUri) const {
    return fmt::format("s3://{}/{}", bucket(), keyOf(pathOrUri));
}

std::vector<std::string> S3Backend::awsArgs(std::vector<std::string> args) const {
    args.insert(args.begin(), settings_.awsBin);
    if (settings_.s3EndpointUrl) {
        args.emplace_back("--endpoint-url");
        args.push_back(*settings_.s3EndpointUrl);
    }
    return args;
}

std::vector<std::string> S3Backend::cpArgs(const CopyOptions& opts, const std::string& from, const std::string& to) const {
    std::vector<std::string> args{"s3", "cp", from, to};
    if (!opts.progress) args.emplace_back("--no-progress");
    if (!opts.verbose && !opts.progress) args.emplace_back("--only-show-errors");
    return awsArgs(std::move(args));
}

uint64_t S3Backend::copyFile(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    const auto dir = directionOf(src, dst);

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would aws s3 cp {} -> {}", src, dst);
        return 0;
    }

    if (dir.upload) {
        std::error_code ec;
        if (!std::filesystem::exists(dir.local, ec)) throw BackendError::notFound(dir.local);
        run(cpArgs(opts, dir.local, s3Url(dir.remote)), "aws s3 cp", dst);
        return localSize(dir.local);
    }

    prepareLocalParent(dir.local);
    run(cpArgs(opts, s3Url(dir.remote), dir.local), "aws s3 cp", src);
    return localSize(dir.local);
}

CopyStats S3Backend::copyDirectory(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    if (!opts.recursive) throw BackendError::unsupported("Recursive copy requires the recursive option");

    const auto dir = directionOf(src, dst);
    auto stats = opts.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would aws s3 sync {} -> {}", src, dst);
        return stats;
    }

    std::vector<std::string> args{"s3", "sync"};
    if (dir.upload) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir.local, ec)) throw BackendError::notFound(dir.local);
        args.push_back(dir.local);
        args.push_back(s3Url(dir.remote));
    } else {
        prepareLocalParent(joinUnder(dir.local, "."));
        args.push_back(s3Url(dir.remote));
        args.push_back(dir.local);
    }
    if (!opts.progress) args.emplace_back("--no-progress");

    run(awsArgs(std::move(args)), "aws s3 sync", dir.upload ? dst : src);
    return stats;
}

std::vector<Entry> S3Backend::parseLsOutput(const std::string& output, const std::string& dirUri) {
    std::vector<Entry> entries;
    std::istringstream in(output);
    std::string line;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string first;
        if (!(fields >> first)) continue;

        if (first == "PRE") {
            std::string name;
            std::getline(fields >> std::ws, name);
            while (name.ends_with('/')) name.pop_back();
            if (!name.empty()) entries.push_back({joinUnder(dirUri, name), 0, true, std::nullopt});
            continue;
        }

        // date time size key
        std::string time, sizeText, name;
        if (!(fields >> time >> sizeText)) continue;
        std::getline(fields >> std::ws, name);
        if (name.empty()) continue;

        uint64_t size = 0;
        std::from_chars(sizeText.data(), sizeText.data() + sizeText.size(), size);
        entries.push_back({joinUnder(dirUri, name), size, false, std::nullopt});
    }
    return entries;
}

std::vector<Entry> S3Backend::list(const std::string& path) const {
    const auto key = keyOf(path);
    const auto uri = location_.uriFor('/' + key);

    const auto listPrefix = [&](const std::string& prefix, const std::string& under) {
        try {
            const auto res = run(awsArgs({"s3", "ls", fmt::format("s3://{}/{}", bucket(), prefix)}), "aws s3 ls", uri);
            return parseLsOutput(res.out, under);
        } catch (const BackendError& e) {
            // aws exits 1 without output when nothing matches the prefix
            if (isMissingKey(e)) throw BackendError::notFound(uri);
            throw;
        }
    };

    if (key.empty() || key.ends_with('/')) return listPrefix(key, trimTrailingSlash(uri));

    // A bare key matches by prefix: pick out the object itself or the directory of that name
    const auto parent = trimTrailingSlash(uri).substr(0, trimTrailingSlash(uri).find_last_of('/'));
    for (const auto& e : listPrefix(key, parent)) {
        if (e.path != trimTrailingSlash(uri)) continue;
        if (!e.is_dir) return {e};
        return listPrefix(key + '/', trimTrailingSlash(uri));
    }
    throw BackendError::notFound(uri);
}

void S3Backend::remove(const std::string& path) const {
    const auto entries = list(path);
    const bool singleObject = entries.size() == 1 && !entries.front().is_dir
                              && entries.front().path == trimTrailingSlash(location_.uriFor('/' + keyOf(path)));

    std::vector<std::string> args{"s3", "rm", s3Url(path)};
    if (!singleObject) args.emplace_back("--recursive");
    run(awsArgs(std::move(args)), "aws s3 rm", path);
}

std::string S3Backend::parseETag(const std::string& headObjectJson) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(headObjectJson);
    } catch (const nlohmann::json::parse_error& e) {
        throw BackendError(BackendError::Kind::Other, "Failed to parse head-object output", {}, e.what());
    }

    if (!j.contains("ETag") || !j["ETag"].is_string())
        throw BackendError(BackendError::Kind::Other, "head-object output carries no ETag");

    auto etag = j["ETag"].get<std::string>();
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') etag = etag.substr(1, etag.size() - 2);
    return etag;
}

std::string S3Backend::checksum(const std::string& path, const ChecksumAlgorithm algo) const {
    if (algo != ChecksumAlgorithm::Md5)
        throw BackendError::unsupported(fmt::format("S3 checksum only supports MD5 (ETag), not {}", to_string(algo)));

    const auto res = run(awsArgs({"s3api", "head-object", "--bucket", bucket(), "--key", keyOf(path), "--output", "json"}),
                         "aws s3api head-object", path);

    auto etag = parseETag(res.out);
    // Multipart uploads get "<md5-of-md5s>-<parts>", which is no content digest
    if (etag.find('-') != std::string::npos)
        throw BackendError::unsupported(fmt::format("ETag of {} is a multipart tag, not an MD5 digest", path));
    return etag;
}
