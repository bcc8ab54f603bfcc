#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "common/error.h"
#include "common/types.h"
#include "common/wire.h"
#include "crypto/crypto_manager.h"
#include "crypto/hash.h"

using namespace kizuna;

TEST_CASE("frame header is big endian") {
    auto header = wire::encode_header(0x01020304);
    CHECK(header[0] == 0x01);
    CHECK(header[1] == 0x02);
    CHECK(header[2] == 0x03);
    CHECK(header[3] == 0x04);
    CHECK(wire::decode_header(header) == 0x01020304u);
}

TEST_CASE("messages keep binary payloads") {
    auto message = wire::make_message(wire::kTransfer, "chunk");
    message["data"] = nlohmann::json::binary(Bytes{0x00, 0xff, 0x10});

    auto decoded = wire::decode_message(wire::encode_message(message));
    REQUIRE(decoded);
    CHECK((*decoded)["ch"] == "transfer");
    CHECK((*decoded)["t"] == "chunk");
    REQUIRE((*decoded)["data"].is_binary());
    CHECK((*decoded)["data"].get_binary().size() == 3);
}

TEST_CASE("garbage is not a message") {
    CHECK_FALSE(wire::decode_message(Bytes{0xff, 0x00, 0x13}));
}

TEST_CASE("split_address") {
    auto parts = split_address("tcp://10.0.0.7:41400");
    REQUIRE(parts);
    CHECK(parts->first == "tcp");
    CHECK(parts->second == "10.0.0.7:41400");
    CHECK_FALSE(split_address("10.0.0.7:41400"));
    CHECK_FALSE(split_address("://x"));
}

TEST_CASE("transport priority order") {
    const auto& order = transport_priority();
    REQUIRE(order.size() == 5);
    CHECK(order.front() == TransportKind::quic);
    CHECK(order[3] == TransportKind::tcp);
    CHECK(transport_kind_from_string("websocket") == TransportKind::websocket);
    CHECK_FALSE(transport_kind_from_string("carrier-pigeon"));
}

TEST_CASE("error codes carry their own category") {
    std::error_code ec = errc::integrity_error;
    CHECK(ec.category() == error_category());
    CHECK_FALSE(ec.message().empty());
    CHECK(is_transient(errc::timed_out));
    CHECK_FALSE(is_transient(errc::trust_denied));
}

TEST_CASE("sha256 hex") {
    REQUIRE(CryptoManager::init());
    CHECK(to_hex(sha256(std::string("abc"))) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Sha256 incremental;
    incremental.update(Bytes{'a'});
    incremental.update(Bytes{'b', 'c'});
    CHECK(to_hex(incremental.finish()) == to_hex(sha256(std::string("abc"))));

    auto back = from_hex("00ff10");
    REQUIRE(back);
    CHECK(*back == Bytes{0x00, 0xff, 0x10});
    CHECK_FALSE(from_hex("zz"));
}
