/**
 * MdnsDiscovery: DNS-SD browsing and advertising over multicast DNS.
 *
 * Only the records this service needs are produced and understood:
 *   PTR  _kizuna._tcp.local        -> <instance>._kizuna._tcp.local
 *   SRV  <instance>._kizuna._tcp   -> port, <instance>.local
 *   TXT  <instance>._kizuna._tcp   -> proto, v, id, name, user, caps, ...
 * The peer address is taken from the packet source.
 */

#include "discovery/mdns_discovery.h"

#include <cctype>
#include <map>
#include <sstream>

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

namespace mdns {

namespace {

constexpr uint16_t kTypePtr = 12;
constexpr uint16_t kTypeTxt = 16;
constexpr uint16_t kTypeSrv = 33;
constexpr uint16_t kClassIn = 1;
constexpr uint16_t kCacheFlush = 0x8000;
constexpr uint16_t kFlagResponse = 0x8400;
constexpr uint32_t kTtl = 120;

void put16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void put32(Bytes& out, uint32_t v) {
    put16(out, static_cast<uint16_t>(v >> 16));
    put16(out, static_cast<uint16_t>(v));
}

void put_name(Bytes& out, const std::string& name) {
    std::stringstream ss(name);
    std::string label;
    while (std::getline(ss, label, '.')) {
        if (label.empty())
            continue;
        if (label.size() > 63)
            label.resize(63);
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
}

void put_header(Bytes& out, uint16_t flags, uint16_t questions, uint16_t answers) {
    put16(out, 0);          // id is always zero in mDNS
    put16(out, flags);
    put16(out, questions);
    put16(out, answers);
    put16(out, 0);
    put16(out, 0);
}

void put_record(Bytes& out, const std::string& name, uint16_t type, uint16_t klass, const Bytes& rdata) {
    put_name(out, name);
    put16(out, type);
    put16(out, klass);
    put32(out, kTtl);
    put16(out, static_cast<uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += ',';
        out += item;
    }
    return out;
}

std::vector<std::string> split(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

std::string instance_label(const Beacon& beacon) {
    return "kz-" + beacon.id.substr(0, 16);
}

/// Bounds-checked cursor over a received packet.
class Reader {
public:
    explicit Reader(const Bytes& packet) : data_(packet) {}

    bool u16(uint16_t& v) {
        if (pos_ + 2 > data_.size())
            return false;
        v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool u32(uint32_t& v) {
        uint16_t hi = 0, lo = 0;
        if (!u16(hi) || !u16(lo))
            return false;
        v = (uint32_t{hi} << 16) | lo;
        return true;
    }

    bool name(std::string& out) { return read_name(pos_, out, true); }

    bool skip(std::size_t n) {
        if (pos_ + n > data_.size())
            return false;
        pos_ += n;
        return true;
    }

    std::size_t pos() const { return pos_; }

private:
    bool read_name(std::size_t& at, std::string& out, bool advance) {
        std::size_t cursor = at;
        bool jumped = false;
        int hops = 0;
        out.clear();
        while (true) {
            if (cursor >= data_.size())
                return false;
            uint8_t len = data_[cursor];
            if ((len & 0xC0) == 0xC0) {
                if (cursor + 1 >= data_.size() || ++hops > 16)
                    return false;
                std::size_t target = ((len & 0x3F) << 8) | data_[cursor + 1];
                if (!jumped && advance)
                    at = cursor + 2;
                jumped = true;
                cursor = target;
                continue;
            }
            if (len == 0) {
                if (!jumped && advance)
                    at = cursor + 1;
                return true;
            }
            if (cursor + 1 + len > data_.size())
                return false;
            if (!out.empty())
                out += '.';
            out.append(reinterpret_cast<const char*>(&data_[cursor + 1]), len);
            cursor += 1 + len;
        }
    }

    const Bytes& data_;
    std::size_t pos_ = 0;
};

bool same_name(std::string a, std::string b) {
    auto lower = [](std::string& s) {
        for (auto& c : s)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (!s.empty() && s.back() == '.')
            s.pop_back();
    };
    lower(a);
    lower(b);
    return a == b;
}

} // namespace

Bytes encode_query() {
    Bytes out;
    put_header(out, 0, 1, 0);
    put_name(out, kServiceType);
    put16(out, kTypePtr);
    put16(out, kClassIn);
    return out;
}

Bytes encode_response(const Beacon& beacon) {
    const std::string label = instance_label(beacon);
    const std::string instance = label + "." + kServiceType;

    Bytes ptr;
    put_name(ptr, instance);

    Bytes srv;
    put16(srv, 0);          // priority
    put16(srv, 0);          // weight
    put16(srv, beacon.port);
    put_name(srv, label + ".local");

    std::vector<std::string> pairs = {
        "proto=kizuna",
        "v=" + std::to_string(beacon.version),
        "id=" + beacon.id,
        "name=" + beacon.name,
        "user=" + beacon.user,
        "port=" + std::to_string(beacon.port),
        "caps=" + join(beacon.caps),
        "transports=" + join(beacon.transports),
    };
    if (!beacon.addrs.empty())
        pairs.push_back("addrs=" + join(beacon.addrs));

    Bytes txt;
    for (auto& pair : pairs) {
        if (pair.size() > 255)
            pair.resize(255);
        txt.push_back(static_cast<uint8_t>(pair.size()));
        txt.insert(txt.end(), pair.begin(), pair.end());
    }

    Bytes out;
    put_header(out, kFlagResponse, 0, 3);
    put_record(out, kServiceType, kTypePtr, kClassIn, ptr);
    put_record(out, instance, kTypeSrv, kClassIn | kCacheFlush, srv);
    put_record(out, instance, kTypeTxt, kClassIn | kCacheFlush, txt);
    return out;
}

bool is_service_query(const Bytes& packet) {
    Reader r(packet);
    uint16_t id = 0, flags = 0, qd = 0, an = 0, ns = 0, ar = 0;
    if (!r.u16(id) || !r.u16(flags) || !r.u16(qd) || !r.u16(an) || !r.u16(ns) || !r.u16(ar))
        return false;
    if (flags & 0x8000)
        return false;

    for (uint16_t i = 0; i < qd; ++i) {
        std::string name;
        uint16_t type = 0, klass = 0;
        if (!r.name(name) || !r.u16(type) || !r.u16(klass))
            return false;
        if ((type == kTypePtr || type == 255) && same_name(name, kServiceType))
            return true;
    }
    return false;
}

std::optional<Beacon> decode_response(const Bytes& packet) {
    Reader r(packet);
    uint16_t id = 0, flags = 0, qd = 0, an = 0, ns = 0, ar = 0;
    if (!r.u16(id) || !r.u16(flags) || !r.u16(qd) || !r.u16(an) || !r.u16(ns) || !r.u16(ar))
        return std::nullopt;
    if (!(flags & 0x8000))
        return std::nullopt;

    for (uint16_t i = 0; i < qd; ++i) {
        std::string name;
        if (!r.name(name) || !r.skip(4))
            return std::nullopt;
    }

    std::map<std::string, std::string> txt;
    std::optional<uint16_t> srv_port;
    const unsigned records = unsigned{an} + ns + ar;
    for (unsigned i = 0; i < records; ++i) {
        std::string name;
        uint16_t type = 0, klass = 0, length = 0;
        uint32_t ttl = 0;
        if (!r.name(name) || !r.u16(type) || !r.u16(klass) || !r.u32(ttl) || !r.u16(length))
            return std::nullopt;
        const std::size_t start = r.pos();
        if (start + length > packet.size())
            return std::nullopt;

        if (type == kTypeTxt && txt.empty()) {
            std::size_t at = start;
            while (at < start + length) {
                std::size_t n = packet[at];
                if (at + 1 + n > start + length)
                    break;
                std::string entry(reinterpret_cast<const char*>(&packet[at + 1]), n);
                auto eq = entry.find('=');
                if (eq != std::string::npos)
                    txt[entry.substr(0, eq)] = entry.substr(eq + 1);
                at += 1 + n;
            }
        } else if (type == kTypeSrv && length >= 6 && !srv_port) {
            srv_port = static_cast<uint16_t>((packet[start + 4] << 8) | packet[start + 5]);
        }
        if (!r.skip(length))
            return std::nullopt;
    }

    if (txt["proto"] != "kizuna" || txt["id"].empty())
        return std::nullopt;

    Beacon beacon;
    try {
        beacon.version = std::stoi(txt["v"]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (beacon.version < 1)
        return std::nullopt;

    beacon.id = txt["id"];
    beacon.name = txt["name"];
    beacon.user = txt["user"];
    beacon.caps = split(txt["caps"]);
    beacon.transports = split(txt["transports"]);
    beacon.addrs = split(txt["addrs"]);
    if (srv_port) {
        beacon.port = *srv_port;
    } else {
        try {
            unsigned long port = std::stoul(txt["port"]);
            if (port <= 65535)
                beacon.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            beacon.port = 0;
        }
    }
    return beacon;
}

} // namespace mdns

// ── MdnsDiscovery ───────────────────────────────────────────────────────────

MdnsDiscovery::MdnsDiscovery(asio::io_context& io, uint16_t port)
    : strand_(asio::make_strand(io))
    , socket_(strand_)
    , group_(asio::ip::make_address(mdns::kMulticastGroup), port)
    , port_(port)
    , deadline_(strand_)
    , query_timer_(strand_) {}

std::error_code MdnsDiscovery::start(const Beacon& local) {
    local_ = local;

    asio::error_code ec;
    socket_.open(asio::ip::udp::v4(), ec);
    if (ec)
        return ec;
    socket_.set_option(asio::ip::udp::socket::reuse_address(true), ec);
    if (!ec)
        socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port_), ec);
    if (!ec)
        socket_.set_option(asio::ip::multicast::join_group(group_.address()), ec);
    if (!ec)
        socket_.set_option(asio::ip::multicast::enable_loopback(true), ec);
    if (ec) {
        asio::error_code ignored;
        socket_.close(ignored);
        return ec;
    }

    started_ = true;
    spdlog::info("Discovery: mdns responder for {} on port {}", mdns::kServiceType, port_);
    asio::post(strand_, [self = shared_from_this()] { self->do_receive(); });
    return {};
}

void MdnsDiscovery::stop() {
    asio::post(strand_, [self = shared_from_this()] {
        self->finish_scan(errc::cancelled);
        self->started_ = false;
        asio::error_code ec;
        self->socket_.close(ec);
        if (ec)
            spdlog::warn("Discovery: closing mdns socket: {}", ec.message());
    });
}

void MdnsDiscovery::do_receive() {
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
        [self = shared_from_this()](const asio::error_code& ec, std::size_t size) {
            if (ec == asio::error::operation_aborted || !self->socket_.is_open())
                return;
            if (ec)
                spdlog::debug("Discovery: mdns receive: {}", ec.message());
            else
                self->handle_packet(size);
            self->do_receive();
        });
}

void MdnsDiscovery::handle_packet(std::size_t size) {
    Bytes packet(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size));

    if (mdns::is_service_query(packet)) {
        send(mdns::encode_response(local_));
        return;
    }

    auto beacon = mdns::decode_response(packet);
    if (!beacon || beacon->id == local_.id || !on_sighting_)
        return;
    on_sighting_(beacon_to_sighting(*beacon, sender_.address().to_string(), method()));
}

void MdnsDiscovery::send(Bytes packet) {
    auto payload = std::make_shared<Bytes>(std::move(packet));
    socket_.async_send_to(asio::buffer(*payload), group_,
        [payload](const asio::error_code& ec, std::size_t) {
            if (ec)
                spdlog::debug("Discovery: mdns send: {}", ec.message());
        });
}

void MdnsDiscovery::async_scan(std::chrono::milliseconds timeout,
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

void MdnsDiscovery::send_query(uint64_t generation, std::chrono::milliseconds interval) {
    if (generation != generation_ || !done_)
        return;

    send(mdns::encode_query());

    query_timer_.expires_after(interval);
    query_timer_.async_wait([self = shared_from_this(), generation, interval](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        self->send_query(generation, interval);
    });
}

void MdnsDiscovery::cancel() {
    asio::post(strand_, [self = shared_from_this()] { self->finish_scan(errc::cancelled); });
}

void MdnsDiscovery::finish_scan(std::error_code ec) {
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
