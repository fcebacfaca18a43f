#include "storage/Factory.hpp"
#include "storage/LocalBackend.hpp"
#include "storage/remote/SshBackend.hpp"
#include "storage/remote/S3Backend.hpp"
#include "storage/remote/HttpBackend.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::storage;
using namespace usync::storage::remote;
using namespace usync::transfer;
using namespace usync::logging;

std::shared_ptr<Backend> usync::storage::makeBackend(const Location& location, const TransferSettings& settings) {
    std::shared_ptr<Backend> backend;

    switch (location.protocol) {
        case Protocol::Local:
            backend = std::make_shared<LocalBackend>(settings);
            break;
        case Protocol::Ssh:
        case Protocol::Sftp:
            backend = std::make_shared<SshBackend>(location, settings);
            break;
        case Protocol::S3:
            backend = std::make_shared<S3Backend>(location, settings);
            break;
        case Protocol::Http:
        case Protocol::Https:
            backend = std::make_shared<HttpBackend>(location, settings);
            break;
    }

    if (!backend) throw BackendError::unsupported("Unsupported protocol: " + to_string(location.protocol));

    LogRegistry::storage()->debug("[Factory] {} backend for {}", backend->name(), location.str());
    return backend;
}
