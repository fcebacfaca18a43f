// Storage
#include "storage/Factory.hpp"
#include "storage/Location.hpp"
#include "storage/List.hpp"

// Transfer / sync
#include "transfer/CopyEngine.hpp"
#include "transfer/Error.hpp"
#include "transfer/Settings.hpp"
#include "sync/Engine.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

// Libraries
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>

using namespace usync::config;
using namespace usync::logging;
using namespace usync::storage;
using namespace usync::transfer;

namespace {

void usage() {
    fmt::print(stderr,
               "usage: usync <copy|move|sync> <src> <dst> [config.yaml]\n"
               "       usync ls <path> [config.yaml]\n");
}

int runLs(const Location& where, const TransferSettings& settings, const CopyOptions& opts) {
    const auto backend = makeBackend(where, settings);
    const auto entries = opts.recursive ? listRecursive(*backend, where.str()) : backend->list(where.str());

    for (const auto& e : entries)
        fmt::print("{} {:>10} {}\n", e.is_dir ? 'd' : '-', usync::util::bytesToSize(e.size), e.path);

    LogRegistry::usync()->debug("[ls] {} entries under {}", entries.size(), where.str());
    return EXIT_SUCCESS;
}

int runTransfer(const std::string& command, const Location& src, const Location& dst,
                const TransferSettings& settings, const CopyOptions& opts) {
    const auto srcBackend = makeBackend(src, settings);
    const auto dstBackend = makeBackend(dst, settings);

    if (command == "sync") {
        const auto mode = syncModeFromString(ConfigRegistry::get().defaults.sync_mode);
        const usync::sync::Engine engine(srcBackend, dstBackend, mode, opts);
        engine.sync(src.str(), dst.str()).logSummary();
        return EXIT_SUCCESS;
    }

    const CopyEngine engine(srcBackend, dstBackend, opts);
    const auto stats = command == "move" ? engine.move(src.str(), dst.str()) : engine.copy(src.str(), dst.str());
    stats.logSummary();
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    if (argc < 3) {
        usage();
        return EXIT_FAILURE;
    }

    const std::string command = argv[1];
    const bool isLs = command == "ls";
    const bool isTransfer = command == "copy" || command == "move" || command == "sync";

    if ((!isLs && !isTransfer) || (isTransfer && argc < 4)) {
        usage();
        return EXIT_FAILURE;
    }

    const int configArg = isLs ? 3 : 4;

    try {
        if (argc > configArg) ConfigRegistry::init(std::filesystem::path(argv[configArg]));
        else ConfigRegistry::init();
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        const auto settings = TransferSettings::fromConfig();
        const auto opts = CopyOptions::fromDefaults(ConfigRegistry::get().defaults);

        if (isLs) return runLs(Location::parse(argv[2]), settings, opts);
        return runTransfer(command, Location::parse(argv[2]), Location::parse(argv[3]), settings, opts);
    } catch (const BackendError& e) {
        if (LogRegistry::isInitialized()) LogRegistry::usync()->error("[usync] {}", e.what());
        else fmt::print(stderr, "usync: {}\n", e.what());
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::usync()->error("[usync] Fatal: {}", e.what());
        else fmt::print(stderr, "usync: fatal: {}\n", e.what());
    }

    return EXIT_FAILURE;
}
