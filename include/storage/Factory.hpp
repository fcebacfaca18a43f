#pragma once

#include "storage/Backend.hpp"
#include "storage/Location.hpp"
#include "transfer/Settings.hpp"

#include <memory>

namespace usync::storage {

std::shared_ptr<Backend> makeBackend(const Location& location, const transfer::TransferSettings& settings = {});

}
