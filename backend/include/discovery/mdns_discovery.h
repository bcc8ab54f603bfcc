#pragma once

#include <array>
#include <asio.hpp>
#include <memory>
#include <optional>
#include <string>

#include "discovery/discovery_adapter.h"

namespace kizuna {

namespace mdns {

constexpr const char* kServiceType = "_kizuna._tcp.local";
constexpr const char* kMulticastGroup = "224.0.0.251";
constexpr uint16_t kPort = 5353;

/// DNS-SD PTR question for the service type.
Bytes encode_query();

/// PTR + SRV + TXT answers describing `beacon`.
Bytes encode_response(const Beacon& beacon);

/// True for a query asking about the service type.
bool is_service_query(const Bytes& packet);

/// Beacon carried by a response's TXT and SRV records, if any.
std::optional<Beacon> decode_response(const Bytes& packet);

} // namespace mdns

/**
 * DNS-SD over multicast DNS for `_kizuna._tcp.local`.
 */
class MdnsDiscovery : public DiscoveryAdapter, public std::enable_shared_from_this<MdnsDiscovery> {
public:
    explicit MdnsDiscovery(asio::io_context& io, uint16_t port = mdns::kPort);

    std::string method() const override { return "mdns"; }
    std::error_code start(const Beacon& local) override;
    void stop() override;
    void async_scan(std::chrono::milliseconds timeout,
                    std::chrono::milliseconds interval,
                    SightingHandler on_sighting,
                    ScanHandler done) override;
    void cancel() override;

private:
    void do_receive();
    void handle_packet(std::size_t size);
    void send(Bytes packet);
    void send_query(uint64_t generation, std::chrono::milliseconds interval);
    void finish_scan(std::error_code ec);

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint group_;
    asio::ip::udp::endpoint sender_;
    std::array<uint8_t, 9000> buffer_{};
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
