#include "storage/List.hpp"

#include <stack>

namespace usync::storage {

std::vector<fs::model::Entry> listRecursive(const Backend& backend, const std::string& path) {
    std::vector<fs::model::Entry> out;
    std::stack<std::string> pending;
    pending.push(path);

    while (!pending.empty()) {
        const auto dir = pending.top();
        pending.pop();

        auto children = backend.list(dir);

        // Reverse push keeps the walk in listing order
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            if (it->is_dir) pending.push(it->path);

        for (auto& child : children) out.push_back(std::move(child));
    }

    return out;
}

}
