/**
 * BluetoothDiscovery: reports whether a controller exists under sysfs.
 * No bluetooth backend is linked, so scans always end with an adapter error.
 */

#include "discovery/bluetooth_discovery.h"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

namespace fs = std::filesystem;

BluetoothDiscovery::BluetoothDiscovery(asio::io_context& io, std::string sysfs_root)
    : io_(io)
    , sysfs_root_(std::move(sysfs_root)) {}

std::error_code BluetoothDiscovery::start(const Beacon&) {
    controllers_ = 0;
    std::error_code ec;
    for (fs::directory_iterator it(sysfs_root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind("hci", 0) == 0)
            ++controllers_;
    }

    if (controllers_ == 0)
        spdlog::warn("Discovery: no bluetooth controller found, bluetooth discovery disabled");
    else
        spdlog::warn("Discovery: {} bluetooth controller(s) present but no bluetooth backend is available",
                     controllers_);
    return errc::discovery_adapter_error;
}

void BluetoothDiscovery::async_scan(std::chrono::milliseconds,
                                    std::chrono::milliseconds,
                                    SightingHandler,
                                    ScanHandler done) {
    asio::post(io_, [done = std::move(done)] { done(errc::discovery_adapter_error); });
}

} // namespace kizuna
