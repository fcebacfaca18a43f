#include "util/files.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <fmt/format.h>

using namespace usync::util;

std::vector<uint8_t> usync::util::readFileToVector(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(size);
    if (!in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

std::string usync::util::readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void usync::util::writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& data) {
    std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + absPath.string());
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<long>(data.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + absPath.string());
}

void usync::util::ensureParentDirs(const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) throw std::filesystem::filesystem_error("Failed to create parent directories", parent, ec);
}

std::string usync::util::bytesToSize(uintmax_t bytes) {
    static constexpr std::array<const char*, 5> suffix = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    // Capped at TB
    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    // Whole numbers drop the decimal
    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}
