#include "transfer/Settings.hpp"
#include "config/ConfigRegistry.hpp"

using namespace usync::transfer;
using namespace usync::config;

TransferSettings TransferSettings::fromConfig() {
    const auto& cfg = ConfigRegistry::get();

    TransferSettings s;
    s.zeroCopyThreshold = cfg.transfer.zero_copy_threshold_bytes;
    s.ramWarnThreshold = cfg.transfer.ram_warn_threshold_bytes;
    s.parallel = cfg.transfer.parallel;
    s.maxWorkers = cfg.transfer.max_workers;
    s.scpBin = cfg.remote.scp_bin;
    s.sshBin = cfg.remote.ssh_bin;
    s.awsBin = cfg.remote.aws_bin;
    s.s3EndpointUrl = cfg.remote.s3_endpoint_url;
    return s;
}
