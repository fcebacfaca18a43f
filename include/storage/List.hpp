#pragma once

#include "storage/Backend.hpp"

namespace usync::storage {

// Every entry below path, depth-first, parents before their children.
// A file path yields just that file.
std::vector<fs::model::Entry> listRecursive(const Backend& backend, const std::string& path);

}
