#include "fs/model/Entry.hpp"

#include <nlohmann/json.hpp>

namespace usync::fs::model {

void to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"path", entry.path},
        {"size", entry.size},
        {"is_dir", entry.is_dir}
    };
    if (entry.modified) j["modified"] = *entry.modified;
    else j["modified"] = nullptr;
}

void to_json(nlohmann::json& j, const std::vector<Entry>& entries) {
    j = nlohmann::json::array();
    for (const auto& e : entries) j.push_back(e);
}

}
