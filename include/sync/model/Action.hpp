#pragma once

#include "fs/model/Entry.hpp"

#include <string>

namespace usync::sync::model {

enum class ActionType {
    Copy,
    Delete,
};

struct Action {
    ActionType type{ActionType::Copy};
    std::string rel;             // path below both roots
    std::string from{};          // source path for Copy
    std::string to{};            // destination path, the target of both kinds
    uint64_t size{0};
};

std::string to_string(ActionType type);

}
