/**
 * UdpDiscovery: LAN beacons over UDP broadcast.
 *
 * A scan broadcasts queries; peers that hear one answer with an
 * announce sent straight back to the asker.
 */

#include "discovery/udp_discovery.h"

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

UdpDiscovery::UdpDiscovery(asio::io_context& io, uint16_t port)
    : strand_(asio::make_strand(io))
    , socket_(strand_)
    , port_(port)
    , deadline_(strand_)
    , query_timer_(strand_) {}

std::error_code UdpDiscovery::start(const Beacon& local) {
    local_ = local;

    asio::error_code ec;
    socket_.open(asio::ip::udp::v4(), ec);
    if (ec)
        return ec;
    socket_.set_option(asio::ip::udp::socket::reuse_address(true), ec);
    socket_.set_option(asio::socket_base::broadcast(true), ec);
    if (ec) {
        asio::error_code ignored;
        socket_.close(ignored);
        return ec;
    }
    socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port_), ec);
    if (ec) {
        asio::error_code ignored;
        socket_.close(ignored);
        return ec;
    }

    started_ = true;
    spdlog::info("Discovery: udp responder on port {}", port_);
    asio::post(strand_, [self = shared_from_this()] { self->do_receive(); });
    return {};
}

void UdpDiscovery::stop() {
    asio::post(strand_, [self = shared_from_this()] {
        self->finish_scan(errc::cancelled);
        self->started_ = false;
        asio::error_code ec;
        self->socket_.close(ec);
        if (ec)
            spdlog::warn("Discovery: closing udp socket: {}", ec.message());
    });
}

void UdpDiscovery::do_receive() {
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
        [self = shared_from_this()](const asio::error_code& ec, std::size_t size) {
            if (ec == asio::error::operation_aborted || !self->socket_.is_open())
                return;
            if (ec)
                spdlog::debug("Discovery: udp receive: {}", ec.message());
            else
                self->handle_datagram(size);
            self->do_receive();
        });
}

void UdpDiscovery::handle_datagram(std::size_t size) {
    auto beacon = decode_beacon(std::string(buffer_.data(), size));
    if (!beacon || beacon->id == local_.id)
        return;

    if (beacon->type == "query")
        send_beacon("announce", sender_);

    if (on_sighting_)
        on_sighting_(beacon_to_sighting(*beacon, sender_.address().to_string(), method()));
}

void UdpDiscovery::send_beacon(const std::string& type, const asio::ip::udp::endpoint& to) {
    Beacon beacon = local_;
    beacon.type = type;
    auto payload = std::make_shared<std::string>(encode_beacon(beacon));
    socket_.async_send_to(asio::buffer(*payload), to,
        [payload](const asio::error_code& ec, std::size_t) {
            if (ec)
                spdlog::debug("Discovery: udp send: {}", ec.message());
        });
}

void UdpDiscovery::async_scan(std::chrono::milliseconds timeout,
                              std::chrono::milliseconds interval,
                              SightingHandler on_sighting,
                              ScanHandler done) {
    asio::post(strand_, [self = shared_from_this(), timeout, interval,
                         on_sighting = std::move(on_sighting), done = std::move(done)]() mutable {
        if (!self->started_) {
            asio::post(self->strand_, [done = std::move(done)] { done(errc::discovery_adapter_error); });
            return;
        }
        self->finish_scan(errc::cancelled);

        uint64_t generation = ++self->generation_;
        self->on_sighting_ = std::move(on_sighting);
        self->done_ = std::move(done);

        self->deadline_.expires_after(timeout);
        self->deadline_.async_wait([self, generation](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted || generation != self->generation_)
                return;
            self->finish_scan({});
        });
        self->send_query(generation, interval);
    });
}

void UdpDiscovery::send_query(uint64_t generation, std::chrono::milliseconds interval) {
    if (generation != generation_ || !done_)
        return;

    send_beacon("query", asio::ip::udp::endpoint(asio::ip::address_v4::broadcast(), port_));

    query_timer_.expires_after(interval);
    query_timer_.async_wait([self = shared_from_this(), generation, interval](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        self->send_query(generation, interval);
    });
}

void UdpDiscovery::cancel() {
    asio::post(strand_, [self = shared_from_this()] { self->finish_scan(errc::cancelled); });
}

void UdpDiscovery::finish_scan(std::error_code ec) {
    if (!done_)
        return;
    ++generation_;
    deadline_.cancel();
    query_timer_.cancel();
    on_sighting_ = nullptr;
    auto done = std::move(done_);
    done_ = nullptr;
    done(ec);
}

} // namespace kizuna
