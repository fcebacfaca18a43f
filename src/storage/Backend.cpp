#include "storage/Backend.hpp"
#include "transfer/Error.hpp"

using namespace usync::storage;
using namespace usync::transfer;

bool Backend::exists(const std::string& path) const {
    try {
        (void)list(path);
        return true;
    } catch (const BackendError& e) {
        if (e.kind() == BackendError::Kind::NotFound) return false;
        throw;
    }
}

bool Backend::owns(const std::string& path) const {
    return !isRemote() && path.find("://") == std::string::npos;
}
