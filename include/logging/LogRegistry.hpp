#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace usync::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    // A log directory adds a rotating file sink next to the console sink.
    static void init(const std::optional<std::filesystem::path>& logDir = std::nullopt);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> usync()     { return get("usync"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> sync()      { return get("sync"); }
    static std::shared_ptr<spdlog::logger> filters()   { return get("filters"); }
    static std::shared_ptr<spdlog::logger> remote()    { return get("remote"); }
    static std::shared_ptr<spdlog::logger> crypto()    { return get("crypto"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline std::filesystem::path log_path_;
    static inline std::size_t max_bytes_ = 10 * 1024 * 1024; // 10MB x 3 files
    static inline std::size_t max_files_ = 3;
};

} // namespace usync::logging
