#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <system_error>

#include "common/types.h"
#include "discovery/beacon.h"

namespace kizuna {

/**
 * One discovery medium (mDNS, UDP broadcast, Bluetooth, ...).
 *
 * An adapter runs an always-on responder between start() and stop() so other
 * peers can find this device, and on demand scans for peers, reporting each
 * raw sighting as it arrives.
 */
class DiscoveryAdapter {
public:
    using SightingHandler = std::function<void(Sighting)>;
    using ScanHandler = std::function<void(std::error_code)>;

    virtual ~DiscoveryAdapter() = default;

    /// Method tag recorded on peer records ("mdns", "udp", "bluetooth").
    virtual std::string method() const = 0;

    /// Begin answering queries with `local`. A failure disables the adapter.
    virtual std::error_code start(const Beacon& local) = 0;
    virtual void stop() = 0;

    /**
     * Query every `interval` until `timeout` elapses or cancel() is called,
     * reporting sightings through `on_sighting`. `done` runs exactly once,
     * after the last sighting; cancellation completes with errc::cancelled.
     */
    virtual void async_scan(std::chrono::milliseconds timeout,
                            std::chrono::milliseconds interval,
                            SightingHandler on_sighting,
                            ScanHandler done) = 0;

    virtual void cancel() = 0;
};

} // namespace kizuna
