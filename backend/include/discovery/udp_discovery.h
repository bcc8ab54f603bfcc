#pragma once

#include <array>
#include <asio.hpp>
#include <memory>

#include "discovery/discovery_adapter.h"

namespace kizuna {

/**
 * LAN discovery by UDP broadcast.
 *
 * Scans broadcast a query beacon every interval; every running instance
 * answers queries with a unicast announce, and announces are turned into
 * sightings while a scan is active.
 */
class UdpDiscovery : public DiscoveryAdapter, public std::enable_shared_from_this<UdpDiscovery> {
public:
    UdpDiscovery(asio::io_context& io, uint16_t port);

    std::string method() const override { return "udp"; }
    std::error_code start(const Beacon& local) override;
    void stop() override;
    void async_scan(std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval,
                    SightingHandler on_sighting,
                    ScanHandler done) override;
    void cancel() override;

private:
    void do_receive();
    void handle_datagram(std::size_t size);
    void send_beacon(const std::string& type, const asio::ip::udp::endpoint& to);
    void send_query(uint64_t generation, std::chrono::milliseconds interval);
    void finish_scan(std::error_code ec);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint sender_;
    std::array<char, 8192> buffer_{};
    uint16_t port_;
    Beacon local_;
    bool started_ = false;

    asio::steady_timer deadline_;
    asio::steady_timer query_timer_;
    uint64_t generation_ = 0;
    SightingHandler on_sighting_;
    ScanHandler done_;
};

} // namespace kizuna
