#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace usync::fs::model {

// Snapshot of one path as reported by a backend listing. Never cached.
struct Entry {
    std::string path{};
    uint64_t size{0};
    bool is_dir{false};
    std::optional<uint64_t> modified{}; // epoch seconds

    [[nodiscard]] bool operator==(const Entry& other) const = default;

    // Same content for sync purposes: size, mtime and kind all agree
    [[nodiscard]] bool sameAs(const Entry& other) const {
        return size == other.size && modified == other.modified && is_dir == other.is_dir;
    }
};

void to_json(nlohmann::json& j, const Entry& entry);

void to_json(nlohmann::json& j, const std::vector<Entry>& entries);

}
