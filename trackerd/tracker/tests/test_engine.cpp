#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <array>
#include <memory>
#include <vector>

#include "../../logger/logger.hpp"
#include "../include/engine.hpp"

using namespace trackerd::tracker;
using trackerd::logger::LogLevel;
using trackerd::logger::LogRecord;

// --------------------- helpers ---------------------

// Counts up from a base so every issued id is distinct and predictable.
class CountingRandom : public IRandomSource {
public:
    explicit CountingRandom(std::uint64_t base) : next_(base) {}
    std::uint64_t nextU64() override { return next_++; }
private:
    std::uint64_t next_;
};

class CaptureSink : public trackerd::logger::ILoggerSink {
public:
    void write(const LogRecord& rec) override { records.push_back(rec); }
    std::vector<LogRecord> records;
};

static std::unique_ptr<TrackerEngine> make_engine(EngineConfig cfg = {},
                                                  std::shared_ptr<trackerd::logger::Logger> log = nullptr) {
    return std::make_unique<TrackerEngine>(cfg, std::make_unique<CountingRandom>(0x5000), std::move(log));
}

static InfoHash make_infohash(uint8_t seed) {
    InfoHash ih{};
    for (size_t i = 0; i < ih.bytes.size(); ++i) ih.bytes[i] = static_cast<uint8_t>(seed ^ i);
    return ih;
}

static SocketAddress peer(uint8_t last, uint16_t port = 6881) {
    return SocketAddress::fromV4({172, 16, 0, last}, port);
}

// Runs a request through the byte-level entry point and decodes the reply.
static std::optional<Response> roundtrip(TrackerEngine& engine, const Request& req, const SocketAddress& src) {
    std::vector<uint8_t> out;
    if (!engine.handleDatagram(WireCodec::encodeRequest(req), src, out)) {
        REQUIRE(out.empty());
        return std::nullopt;
    }
    auto resp = WireCodec::decodeResponse(out);
    REQUIRE(resp.has_value());
    return resp.get();
}

static ConnectionId connect(TrackerEngine& engine, const SocketAddress& src, TransactionId tx = 1) {
    auto resp = roundtrip(engine, ConnectRequest{kProtocolMagic, tx}, src);
    REQUIRE(resp.has_value());
    REQUIRE(std::holds_alternative<ConnectResponse>(*resp));
    return std::get<ConnectResponse>(*resp).connectionId;
}

static AnnounceRequest make_announce(ConnectionId cid, const InfoHash& h, AnnounceEvent ev,
                                     TransactionId tx = 100, std::int32_t numWant = -1) {
    AnnounceRequest a;
    a.connectionId = cid;
    a.transactionId = tx;
    a.infoHash = h;
    a.peerId.bytes.fill(0x2D);
    a.event = ev;
    a.numWant = numWant;
    a.port = 51413;
    return a;
}

static AnnounceResponse announce(TrackerEngine& engine, const SocketAddress& src, ConnectionId cid,
                                 const InfoHash& h, AnnounceEvent ev, std::int32_t numWant = -1) {
    auto resp = roundtrip(engine, make_announce(cid, h, ev, 100, numWant), src);
    REQUIRE(resp.has_value());
    REQUIRE(std::holds_alternative<AnnounceResponse>(*resp));
    return std::get<AnnounceResponse>(*resp);
}

// --------------------- connect ---------------------

TEST_CASE("TrackerEngine: connect with the protocol magic gets a fresh id") {
    auto engine = make_engine();

    auto resp = roundtrip(*engine, ConnectRequest{kProtocolMagic, 0xABCD}, peer(1));
    REQUIRE(resp.has_value());
    const auto& c = std::get<ConnectResponse>(*resp);
    CHECK(c.transactionId == 0xABCD);
    CHECK(c.connectionId == 0x5000);
    CHECK(engine->connections().validate(peer(1), 0x5000));
    CHECK(engine->stats().connects == 1);
}

TEST_CASE("TrackerEngine: connect without the magic is dropped") {
    auto engine = make_engine();

    CHECK_FALSE(roundtrip(*engine, ConnectRequest{0x41727101981ULL, 1}, peer(1)).has_value());
    CHECK_FALSE(roundtrip(*engine, ConnectRequest{0, 1}, peer(1)).has_value());
    CHECK(engine->connections().size() == 0);
    CHECK(engine->stats().droppedUnauthorized == 2);
}

TEST_CASE("TrackerEngine: reconnect invalidates the previous id") {
    auto engine = make_engine();
    const auto h = make_infohash(1);

    const auto first = connect(*engine, peer(1));
    const auto second = connect(*engine, peer(1));
    REQUIRE(first != second);

    CHECK_FALSE(roundtrip(*engine, make_announce(first, h, AnnounceEvent::started), peer(1)).has_value());
    CHECK(roundtrip(*engine, make_announce(second, h, AnnounceEvent::started), peer(1)).has_value());
}

// --------------------- authorization ---------------------

TEST_CASE("TrackerEngine: announce without a prior connect is dropped and changes nothing") {
    auto engine = make_engine();
    const auto h = make_infohash(2);

    CHECK_FALSE(roundtrip(*engine, make_announce(0x5000, h, AnnounceEvent::started), peer(1)).has_value());
    CHECK(engine->swarms().size() == 0);
    CHECK(engine->stats().droppedUnauthorized == 1);
    CHECK(engine->stats().announces == 0);
}

TEST_CASE("TrackerEngine: a connection id is bound to the address it was issued to") {
    auto engine = make_engine();
    const auto h = make_infohash(3);
    const auto cid = connect(*engine, peer(1));

    CHECK_FALSE(roundtrip(*engine, make_announce(cid, h, AnnounceEvent::started), peer(2)).has_value());
    CHECK_FALSE(roundtrip(*engine, make_announce(cid, h, AnnounceEvent::started), peer(1, 9999)).has_value());
    CHECK_FALSE(roundtrip(*engine, make_announce(cid + 1, h, AnnounceEvent::started), peer(1)).has_value());
    CHECK(engine->swarms().size() == 0);
}

TEST_CASE("TrackerEngine: unauthorized scrape is dropped") {
    auto engine = make_engine();
    const auto cid = connect(*engine, peer(1));

    CHECK_FALSE(roundtrip(*engine, ScrapeRequest{cid ^ 1, 5, {make_infohash(4)}}, peer(1)).has_value());
    CHECK_FALSE(roundtrip(*engine, ScrapeRequest{cid, 5, {make_infohash(4)}}, peer(2)).has_value());
    CHECK(engine->stats().scrapes == 0);
}

// --------------------- malformed input ---------------------

TEST_CASE("TrackerEngine: malformed datagrams are dropped without a reply") {
    auto engine = make_engine();
    std::vector<uint8_t> out{0x01};

    const std::vector<std::vector<uint8_t>> junk = {
        {},
        {0x00},
        std::vector<uint8_t>(11, 0xFF),
        std::vector<uint8_t>(15, 0x00),
        std::vector<uint8_t>(97, 0x00),
        std::vector<uint8_t>(2048, 0xFF),
    };
    for (const auto& j : junk) {
        CHECK_FALSE(engine->handleDatagram(j, peer(1), out));
        CHECK(out.empty());
    }
    CHECK(engine->stats().droppedMalformed == junk.size());
}

TEST_CASE("TrackerEngine: truncated announce after a valid connect is dropped") {
    auto engine = make_engine();
    const auto cid = connect(*engine, peer(1));

    auto bytes = WireCodec::encodeRequest(make_announce(cid, make_infohash(5), AnnounceEvent::started));
    bytes.pop_back();

    std::vector<uint8_t> out;
    CHECK_FALSE(engine->handleDatagram(bytes, peer(1), out));
    CHECK(engine->swarms().size() == 0);
}

// --------------------- announce ---------------------

TEST_CASE("TrackerEngine: swarm lifecycle through announces") {
    auto engine = make_engine();
    const auto h = make_infohash(6);
    const auto a = peer(1);
    const auto b = peer(2);
    const auto cidA = connect(*engine, a);
    const auto cidB = connect(*engine, b);

    auto r1 = announce(*engine, a, cidA, h, AnnounceEvent::started);
    CHECK(r1.seeders == 1);
    CHECK(r1.leechers == 0);
    CHECK(r1.interval == 900);
    CHECK(r1.transactionId == 100);

    auto r2 = announce(*engine, b, cidB, h, AnnounceEvent::started);
    CHECK(r2.seeders == 1);
    CHECK(r2.leechers == 1);
    CHECK(r2.peers.size() == 2);

    auto r3 = announce(*engine, a, cidA, h, AnnounceEvent::completed);
    CHECK(r3.seeders == 2);
    CHECK(r3.leechers == 0);
    CHECK(engine->swarms().scrape(h).completed == 1);
}

TEST_CASE("TrackerEngine: repeated started announces count the peer once") {
    auto engine = make_engine();
    const auto h = make_infohash(7);
    const auto cidA = connect(*engine, peer(1));
    const auto cidB = connect(*engine, peer(2));

    announce(*engine, peer(1), cidA, h, AnnounceEvent::started);
    announce(*engine, peer(2), cidB, h, AnnounceEvent::started);
    announce(*engine, peer(2), cidB, h, AnnounceEvent::started);
    auto r = announce(*engine, peer(2), cidB, h, AnnounceEvent::started);

    CHECK(r.leechers == 1);
    CHECK(r.peers.size() == 2);
}

TEST_CASE("TrackerEngine: peers are registered under the observed source address") {
    auto engine = make_engine();
    const auto h = make_infohash(8);
    const auto src = peer(42, 7000);
    const auto cid = connect(*engine, src);

    auto req = make_announce(cid, h, AnnounceEvent::started);
    req.ip = 0x01020304;   // client-supplied override
    req.port = 1234;

    auto resp = roundtrip(*engine, req, src);
    REQUIRE(resp.has_value());
    const auto& a = std::get<AnnounceResponse>(*resp);
    REQUIRE(a.peers.size() == 1);
    CHECK(a.peers[0] == *src.toPeerV4());
}

TEST_CASE("TrackerEngine: num_want limits the peer sample") {
    EngineConfig cfg;
    cfg.defaultNumWant = 4;
    cfg.maxPeersPerReply = 6;
    auto engine = make_engine(cfg);
    const auto h = make_infohash(9);

    ConnectionId last = 0;
    for (uint8_t i = 1; i <= 10; ++i) {
        last = connect(*engine, peer(i));
        announce(*engine, peer(i), last, h, AnnounceEvent::started);
    }

    CHECK(announce(*engine, peer(10), last, h, AnnounceEvent::none, 2).peers.size() == 2);
    CHECK(announce(*engine, peer(10), last, h, AnnounceEvent::none, 0).peers.empty());
    CHECK(announce(*engine, peer(10), last, h, AnnounceEvent::none, -1).peers.size() == 4);
    CHECK(announce(*engine, peer(10), last, h, AnnounceEvent::none, 1000).peers.size() == 6);
}

TEST_CASE("TrackerEngine: peer cap never exceeds one datagram") {
    EngineConfig cfg;
    cfg.maxPeersPerReply = 100000;
    auto engine = make_engine(cfg);
    CHECK(engine->config().maxPeersPerReply == kMaxPeersPerDatagram);
    CHECK(kAnnounceResponseMinSize + kMaxPeersPerDatagram * kCompactPeerSize <= kMaxDatagramSize);
}

TEST_CASE("TrackerEngine: oversized peer cap is clamped with a warning") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<trackerd::logger::Logger>(sink);
    log->setLevel(LogLevel::debug);

    EngineConfig cfg;
    cfg.maxPeersPerReply = 5000;
    auto engine = make_engine(cfg, log);

    REQUIRE(sink->records.size() == 2);
    CHECK(sink->records[0].level == LogLevel::warn);
    CHECK(sink->records[0].logger == "TrackerEngine");
    CHECK(sink->records[0].msg.find("5000") != std::string::npos);
    CHECK(sink->records[1].level == LogLevel::debug);
    CHECK(sink->records[1].msg.find("max_peers=338") != std::string::npos);
}

TEST_CASE("TrackerEngine: a cap that fits needs no warning") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<trackerd::logger::Logger>(sink);
    log->setLevel(LogLevel::warn);

    EngineConfig cfg;
    cfg.maxPeersPerReply = 50;
    auto engine = make_engine(cfg, log);

    CHECK(sink->records.empty());
    CHECK(engine->config().maxPeersPerReply == 50);
}

TEST_CASE("TrackerEngine: configured interval is reported") {
    EngineConfig cfg;
    cfg.announceInterval = 1800;
    auto engine = make_engine(cfg);
    const auto cid = connect(*engine, peer(1));

    CHECK(announce(*engine, peer(1), cid, make_infohash(10), AnnounceEvent::started).interval == 1800);
}

TEST_CASE("TrackerEngine: IPv6 announcers get a reply but are never registered") {
    auto engine = make_engine();
    const auto h = make_infohash(11);
    std::array<std::uint8_t,16> ip{};
    ip[15] = 1;
    const auto v6 = SocketAddress::fromV6(ip, 6881);
    const auto cid = connect(*engine, v6);

    auto r = announce(*engine, v6, cid, h, AnnounceEvent::started);
    CHECK(r.seeders == 0);
    CHECK(r.leechers == 0);
    CHECK(r.peers.empty());
    CHECK(engine->swarms().size() == 0);
}

// --------------------- scrape ---------------------

TEST_CASE("TrackerEngine: scrape reports known and unknown hashes in request order") {
    auto engine = make_engine();
    const auto known = make_infohash(12);
    const auto unknown = make_infohash(13);

    std::vector<ConnectionId> ids;
    for (uint8_t i = 1; i <= 8; ++i) ids.push_back(connect(*engine, peer(i)));

    announce(*engine, peer(1), ids[0], known, AnnounceEvent::started);           // s1 l0 c0
    for (uint8_t i = 2; i <= 8; ++i)
        announce(*engine, peer(i), ids[i - 1], known, AnnounceEvent::started);   // s1 l7 c0
    for (uint8_t i = 2; i <= 6; ++i)
        announce(*engine, peer(i), ids[i - 1], known, AnnounceEvent::completed); // s6 l2 c5
    for (uint8_t i = 2; i <= 4; ++i)
        announce(*engine, peer(i), ids[i - 1], known, AnnounceEvent::stopped);   // s6 l-1 c5
    REQUIRE(engine->swarms().scrape(known) == ScrapeStats{6, 5, -1});

    const auto example = make_infohash(14);
    announce(*engine, peer(1), ids[0], example, AnnounceEvent::started);         // s1 l0
    for (uint8_t i = 2; i <= 8; ++i)
        announce(*engine, peer(i), ids[i - 1], example, AnnounceEvent::started); // s1 l7
    announce(*engine, peer(2), ids[1], example, AnnounceEvent::completed);       // s2 l6 c1
    announce(*engine, peer(3), ids[2], example, AnnounceEvent::completed);       // s3 l5 c2
    for (uint8_t i = 4; i <= 6; ++i)
        announce(*engine, peer(i), ids[i - 1], example, AnnounceEvent::stopped); // s3 l2 c2
    REQUIRE(engine->swarms().scrape(example) == ScrapeStats{3, 2, 2});

    auto resp = roundtrip(*engine, ScrapeRequest{ids[0], 77, {example, unknown, known}}, peer(1));
    REQUIRE(resp.has_value());
    const auto& s = std::get<ScrapeResponse>(*resp);
    CHECK(s.transactionId == 77);
    REQUIRE(s.stats.size() == 3);
    CHECK(s.stats[0] == ScrapeStats{3, 2, 2});
    CHECK(s.stats[1] == ScrapeStats{0, 0, 0});
    CHECK(s.stats[2] == ScrapeStats{6, 5, -1});
    CHECK(engine->stats().scrapes == 1);
}

TEST_CASE("TrackerEngine: scrape with no hashes gets an empty reply") {
    auto engine = make_engine();
    const auto cid = connect(*engine, peer(1));

    auto resp = roundtrip(*engine, ScrapeRequest{cid, 3, {}}, peer(1));
    REQUIRE(resp.has_value());
    CHECK(std::get<ScrapeResponse>(*resp).stats.empty());
}

TEST_CASE("TrackerEngine: scrape does not create swarms") {
    auto engine = make_engine();
    const auto cid = connect(*engine, peer(1));

    roundtrip(*engine, ScrapeRequest{cid, 3, {make_infohash(15)}}, peer(1));
    CHECK(engine->swarms().size() == 0);
}

// --------------------- logging ---------------------

TEST_CASE("TrackerEngine: drops and announces are logged at debug") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<trackerd::logger::Logger>(sink);
    log->setLevel(LogLevel::debug);
    auto engine = make_engine({}, log);
    sink->records.clear();

    std::vector<uint8_t> out;
    engine->handleDatagram(std::vector<uint8_t>(5, 0), peer(1), out);
    REQUIRE(sink->records.size() == 1);
    CHECK(sink->records[0].logger == "TrackerEngine");
    CHECK(sink->records[0].msg.find("insufficient_bytes") != std::string::npos);

    const auto cid = connect(*engine, peer(1));
    sink->records.clear();
    announce(*engine, peer(1), cid, make_infohash(16), AnnounceEvent::started);

    bool sawAnnounce = false;
    for (const auto& rec : sink->records) {
        if (rec.action == "announce") {
            sawAnnounce = true;
            CHECK(rec.event == "started");
            CHECK(rec.endpoint == "172.16.0.1:6881");
            CHECK(rec.peers == 1);
            CHECK(rec.interval == 900);
        }
    }
    CHECK(sawAnnounce);
}

TEST_CASE("TrackerEngine: info level keeps the request path quiet") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<trackerd::logger::Logger>(sink);
    log->setLevel(LogLevel::info);
    auto engine = make_engine({}, log);

    const auto cid = connect(*engine, peer(1));
    announce(*engine, peer(1), cid, make_infohash(17), AnnounceEvent::started);
    CHECK(sink->records.empty());
}

TEST_CASE("TrackerEngine: handleRequest works on decoded requests") {
    auto engine = make_engine();

    auto c = engine->handleRequest(ConnectRequest{kProtocolMagic, 9}, peer(3));
    REQUIRE(c.has_value());
    const auto cid = std::get<ConnectResponse>(*c).connectionId;

    auto s = engine->handleRequest(ScrapeRequest{cid, 10, {make_infohash(18)}}, peer(3));
    REQUIRE(s.has_value());
    CHECK(std::get<ScrapeResponse>(*s) == ScrapeResponse{10, {ScrapeStats{}}});

    CHECK_FALSE(engine->handleRequest(ScrapeRequest{cid, 11, {}}, peer(4)).has_value());
    CHECK(engine->stats().droppedMalformed == 0);
}
