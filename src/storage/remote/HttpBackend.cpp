#include "storage/remote/HttpBackend.hpp"
#include "crypto/Digest.hpp"
#include "transfer/Error.hpp"
#include "util/curlWrappers.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <fmt/format.h>

using namespace usync::storage::remote;
using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::util;
using namespace usync::logging;
using namespace usync::fs::model;

namespace stdfs = std::filesystem;

HttpBackend::HttpBackend(Location location, TransferSettings settings)
    : RemoteBackend(std::move(location), std::move(settings)) {
    if (location_.host.empty()) throw BackendError::connection("No host specified");
}

std::string HttpBackend::url(const std::string& pathOrUri) const {
    return location_.uriFor(location_.remotePathOf(pathOrUri));
}

void HttpBackend::raiseFor(const HttpResponse& res, const std::string& url) {
    if (res.curl != CURLE_OK) {
        switch (res.curl) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SSL_CONNECT_ERROR:
                throw BackendError::connection(fmt::format("Cannot reach {}", url), res.error);
            default:
                throw BackendError::io("Download failed for", url, res.error);
        }
    }

    if (res.http == 404 || res.http == 410) throw BackendError::notFound(url);
    if (res.http >= 400) throw BackendError::io("Download failed for", url, fmt::format("HTTP {}", res.http));
}

uint64_t HttpBackend::copyFile(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    const auto dir = directionOf(src, dst);
    if (dir.upload) throw BackendError::unsupported("Uploading over HTTP is not supported");

    const auto source = url(src);
    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would download {} -> {}", source, dir.local);
        return 0;
    }

    prepareLocalParent(dir.local);
    std::ofstream out(dir.local, std::ios::binary | std::ios::trunc);
    if (!out) throw BackendError::io("Failed to open destination", dir.local, "cannot create file");

    uint64_t written = 0;
    const auto res = performCurl(source, [&](const char* data, const size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        if (!out) throw BackendError::io("Failed to write", dir.local, "stream error");
        written += len;
    });
    out.close();

    if (!res.ok()) {
        std::error_code ec;
        stdfs::remove(dir.local, ec);
        raiseFor(res, source);
    }

    if (opts.verbose) LogRegistry::transfer()->info("Downloaded {} bytes from {} to {}", written, source, dir.local);
    return written;
}

CopyStats HttpBackend::copyDirectory(const std::string&, const std::string&, const CopyOptions&) const {
    throw BackendError::unsupported("Directory copy is not supported over HTTP");
}

std::vector<Entry> HttpBackend::list(const std::string&) const {
    throw BackendError::unsupported("Listing is not supported over HTTP");
}

void HttpBackend::remove(const std::string&) const {
    throw BackendError::unsupported("Delete is not supported over HTTP");
}

std::string HttpBackend::checksum(const std::string& path, const ChecksumAlgorithm algo) const {
    const auto source = url(path);
    crypto::Hasher hasher(algo);

    const auto res = performCurl(source, [&hasher](const char* data, const size_t len) {
        hasher.update(data, len);
    });
    if (!res.ok()) raiseFor(res, source);

    return hasher.finalHex();
}
