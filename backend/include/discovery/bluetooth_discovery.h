#pragma once

#include <asio.hpp>
#include <string>

#include "discovery/discovery_adapter.h"

namespace kizuna {

/**
 * Bluetooth discovery.
 *
 * Looks for a controller under `sysfs_root`. No Bluetooth
 * stack is linked, so the adapter always reports discovery_adapter_error and
 * contributes no sightings; the controller count only changes what is logged.
 */
class BluetoothDiscovery : public DiscoveryAdapter {
public:
    explicit BluetoothDiscovery(asio::io_context& io, std::string sysfs_root = "/sys/class/bluetooth");

    std::string method() const override { return "bluetooth"; }
    std::error_code start(const Beacon& local) override;
    void stop() override {}
    void async_scan(std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval,
                    SightingHandler on_sighting,
                    ScanHandler done) override;
    void cancel() override {}

    /// Number of controllers found by the last start().
    [[nodiscard]] std::size_t controllers() const { return controllers_; }

private:
    asio::io_context& io_;
    std::string sysfs_root_;
    std::size_t controllers_ = 0;
};

} // namespace kizuna
