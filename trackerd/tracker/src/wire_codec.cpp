#include <algorithm>
#include "../include/wire_codec.hpp"


namespace trackerd::tracker {


    // ---------- Binary helpers (network byte order, big-endian) ----------
    static inline void put_u16(std::vector<uint8_t>& b, uint16_t v) {
        b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        b.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    static inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
        b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        b.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    static inline void put_u64(std::vector<uint8_t>& b, uint64_t v) {
        put_u32(b, static_cast<uint32_t>(v >> 32));
        put_u32(b, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    }
    template <std::size_t N>
    static inline void put_bytes(std::vector<uint8_t>& b, const std::array<uint8_t, N>& a) {
        b.insert(b.end(), a.begin(), a.end());
    }

    static inline uint16_t get_u16(const uint8_t* p) {
        return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
    }
    static inline uint32_t get_u32(const uint8_t* p) {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }
    static inline uint64_t get_u64(const uint8_t* p) {
        return (uint64_t(get_u32(p)) << 32) | get_u32(p + 4);
    }
    template <std::size_t N>
    static inline std::array<uint8_t, N> get_bytes(const uint8_t* p) {
        std::array<uint8_t, N> a{};
        std::copy(p, p + N, a.begin());
        return a;
    }


    const char* actionName(Action a) {
        switch (a) {
            case Action::connect:  return "connect";
            case Action::announce: return "announce";
            case Action::scrape:   return "scrape";
            case Action::error:    return "error";
        }
        return "unknown";
    }


    template <typename T>
    static Expected<T> tooShort(const char* what, std::size_t have, std::size_t need) {
        return Expected<T>::failure(Errc::insufficient_bytes,
            std::string(what) + ": need " + std::to_string(need) + " bytes, got " + std::to_string(have));
    }


    // ---------- Request decoding ----------

    namespace {

        struct RequestHeader {
            ConnectionId connectionId;
            Action action;
        };

        Expected<RequestHeader> decodeHeader(std::span<const uint8_t> b) {
            if (b.size() < kRequestHeaderSize) {
                return tooShort<RequestHeader>("request header", b.size(), kRequestHeaderSize);
            }
            const uint32_t action = get_u32(b.data() + 8);
            if (action > static_cast<uint32_t>(Action::scrape)) {
                return Expected<RequestHeader>::failure(Errc::unknown_action,
                    "unknown request action " + std::to_string(action));
            }
            return Expected<RequestHeader>::success(
                RequestHeader{get_u64(b.data()), static_cast<Action>(action)});
        }

        Expected<Request> decodeConnect(ConnectionId cid, std::span<const uint8_t> b) {
            if (b.size() < kConnectRequestSize) {
                return tooShort<Request>("connect request", b.size(), kConnectRequestSize);
            }
            ConnectRequest r;
            r.connectionId  = cid;
            r.transactionId = get_u32(b.data() + 12);
            return Expected<Request>::success(r);
        }

        Expected<Request> decodeAnnounce(ConnectionId cid, std::span<const uint8_t> b) {
            if (b.size() < kAnnounceRequestSize) {
                return tooShort<Request>("announce request", b.size(), kAnnounceRequestSize);
            }
            const uint8_t* p = b.data();

            const uint32_t ev = get_u32(p + 80);
            if (ev > static_cast<uint32_t>(AnnounceEvent::stopped)) {
                return Expected<Request>::failure(Errc::unknown_announce_event,
                    "unknown announce event " + std::to_string(ev));
            }

            AnnounceRequest r;
            r.connectionId    = cid;
            r.transactionId   = get_u32(p + 12);
            r.infoHash.bytes  = get_bytes<20>(p + 16);
            r.peerId.bytes    = get_bytes<20>(p + 36);
            r.downloaded      = static_cast<int64_t>(get_u64(p + 56));
            r.left            = static_cast<int64_t>(get_u64(p + 64));
            r.uploaded        = static_cast<int64_t>(get_u64(p + 72));
            r.event           = static_cast<AnnounceEvent>(ev);
            r.ip              = get_u32(p + 84);
            r.key             = get_u32(p + 88);
            r.numWant         = static_cast<int32_t>(get_u32(p + 92));
            r.port            = get_u16(p + 96);
            return Expected<Request>::success(std::move(r));
        }

        Expected<Request> decodeScrape(ConnectionId cid, std::span<const uint8_t> b) {
            if (b.size() < kScrapeRequestMinSize) {
                return tooShort<Request>("scrape request", b.size(), kScrapeRequestMinSize);
            }
            const std::size_t body = b.size() - kScrapeRequestMinSize;
            if (body % kInfoHashSize != 0) {
                return Expected<Request>::failure(Errc::insufficient_bytes,
                    "scrape request: " + std::to_string(body) + " trailing bytes is not a multiple of 20");
            }

            ScrapeRequest r;
            r.connectionId  = cid;
            r.transactionId = get_u32(b.data() + 12);
            r.infoHashes.reserve(body / kInfoHashSize);
            for (std::size_t off = kScrapeRequestMinSize; off < b.size(); off += kInfoHashSize) {
                InfoHash h;
                h.bytes = get_bytes<20>(b.data() + off);
                r.infoHashes.push_back(h);
            }
            return Expected<Request>::success(std::move(r));
        }

    } // namespace


    Expected<Request> WireCodec::decodeRequest(std::span<const std::uint8_t> bytes)
    {
        auto header = decodeHeader(bytes);
        if (!header.has_value()) {
            return Expected<Request>::failure(*header.error);
        }

        const auto& h = header.get();
        switch (h.action) {
            case Action::connect:  return decodeConnect(h.connectionId, bytes);
            case Action::announce: return decodeAnnounce(h.connectionId, bytes);
            case Action::scrape:   return decodeScrape(h.connectionId, bytes);
            case Action::error:    break;
        }
        return Expected<Request>::failure(Errc::unknown_action, "error action is not a request");
    }


    // ---------- Response decoding ----------

    Expected<Response> WireCodec::decodeResponse(std::span<const std::uint8_t> b)
    {
        if (b.size() < 8) {
            return tooShort<Response>("response header", b.size(), 8);
        }
        const uint8_t* p = b.data();
        const uint32_t action = get_u32(p);
        const TransactionId tx = get_u32(p + 4);

        switch (action) {
            case static_cast<uint32_t>(Action::connect): {
                if (b.size() < kConnectResponseSize) {
                    return tooShort<Response>("connect response", b.size(), kConnectResponseSize);
                }
                return Expected<Response>::success(ConnectResponse{tx, get_u64(p + 8)});
            }
            case static_cast<uint32_t>(Action::announce): {
                if (b.size() < kAnnounceResponseMinSize) {
                    return tooShort<Response>("announce response", b.size(), kAnnounceResponseMinSize);
                }
                const std::size_t body = b.size() - kAnnounceResponseMinSize;
                if (body % kCompactPeerSize != 0) {
                    return Expected<Response>::failure(Errc::insufficient_bytes,
                        "announce response: peer list is not a multiple of 6 bytes");
                }
                AnnounceResponse r;
                r.transactionId = tx;
                r.interval = get_u32(p + 8);
                r.leechers = static_cast<int32_t>(get_u32(p + 12));
                r.seeders  = static_cast<int32_t>(get_u32(p + 16));
                r.peers.reserve(body / kCompactPeerSize);
                for (std::size_t off = kAnnounceResponseMinSize; off < b.size(); off += kCompactPeerSize) {
                    PeerAddrV4 peer;
                    peer.ip   = get_bytes<4>(p + off);
                    peer.port = get_u16(p + off + 4);
                    r.peers.push_back(peer);
                }
                return Expected<Response>::success(std::move(r));
            }
            case static_cast<uint32_t>(Action::scrape): {
                const std::size_t body = b.size() - kScrapeResponseMinSize;
                if (body % kScrapeEntrySize != 0) {
                    return Expected<Response>::failure(Errc::insufficient_bytes,
                        "scrape response: stats are not a multiple of 12 bytes");
                }
                ScrapeResponse r;
                r.transactionId = tx;
                r.stats.reserve(body / kScrapeEntrySize);
                for (std::size_t off = kScrapeResponseMinSize; off < b.size(); off += kScrapeEntrySize) {
                    ScrapeStats s;
                    s.seeders   = static_cast<int32_t>(get_u32(p + off + 0));
                    s.completed = static_cast<int32_t>(get_u32(p + off + 4));
                    s.leechers  = static_cast<int32_t>(get_u32(p + off + 8));
                    r.stats.push_back(s);
                }
                return Expected<Response>::success(std::move(r));
            }
            case static_cast<uint32_t>(Action::error): {
                ErrorResponse r;
                r.transactionId = tx;
                r.message.assign(reinterpret_cast<const char*>(p) + kErrorResponseMinSize,
                                 b.size() - kErrorResponseMinSize);
                return Expected<Response>::success(std::move(r));
            }
            default:
                return Expected<Response>::failure(Errc::unknown_action,
                    "unknown response action " + std::to_string(action));
        }
    }


    // ---------- Encoding ----------

    namespace {

        struct RequestWriter {
            std::vector<uint8_t>& b;

            void operator()(const ConnectRequest& r) const {
                put_u64(b, r.connectionId);
                put_u32(b, static_cast<uint32_t>(Action::connect));
                put_u32(b, r.transactionId);
            }
            void operator()(const AnnounceRequest& r) const {
                put_u64(b, r.connectionId);
                put_u32(b, static_cast<uint32_t>(Action::announce));
                put_u32(b, r.transactionId);
                put_bytes(b, r.infoHash.bytes);
                put_bytes(b, r.peerId.bytes);
                put_u64(b, static_cast<uint64_t>(r.downloaded));
                put_u64(b, static_cast<uint64_t>(r.left));
                put_u64(b, static_cast<uint64_t>(r.uploaded));
                put_u32(b, static_cast<uint32_t>(r.event));
                put_u32(b, r.ip);
                put_u32(b, r.key);
                put_u32(b, static_cast<uint32_t>(r.numWant));
                put_u16(b, r.port);
            }
            void operator()(const ScrapeRequest& r) const {
                put_u64(b, r.connectionId);
                put_u32(b, static_cast<uint32_t>(Action::scrape));
                put_u32(b, r.transactionId);
                for (const auto& h : r.infoHashes) put_bytes(b, h.bytes);
            }
        };

        struct ResponseWriter {
            std::vector<uint8_t>& b;

            void operator()(const ConnectResponse& r) const {
                put_u32(b, static_cast<uint32_t>(Action::connect));
                put_u32(b, r.transactionId);
                put_u64(b, r.connectionId);
            }
            void operator()(const AnnounceResponse& r) const {
                put_u32(b, static_cast<uint32_t>(Action::announce));
                put_u32(b, r.transactionId);
                put_u32(b, r.interval);
                put_u32(b, static_cast<uint32_t>(r.leechers));
                put_u32(b, static_cast<uint32_t>(r.seeders));
                for (const auto& peer : r.peers) {
                    put_bytes(b, peer.ip);
                    put_u16(b, peer.port);
                }
            }
            void operator()(const ScrapeResponse& r) const {
                put_u32(b, static_cast<uint32_t>(Action::scrape));
                put_u32(b, r.transactionId);
                for (const auto& s : r.stats) {
                    put_u32(b, static_cast<uint32_t>(s.seeders));
                    put_u32(b, static_cast<uint32_t>(s.completed));
                    put_u32(b, static_cast<uint32_t>(s.leechers));
                }
            }
            void operator()(const ErrorResponse& r) const {
                put_u32(b, static_cast<uint32_t>(Action::error));
                put_u32(b, r.transactionId);
                b.insert(b.end(), r.message.begin(), r.message.end());
            }
        };

    } // namespace


    void WireCodec::encodeRequestInto(const Request& req, std::vector<std::uint8_t>& out) {
        std::visit(RequestWriter{out}, req);
    }

    void WireCodec::encodeResponseInto(const Response& resp, std::vector<std::uint8_t>& out) {
        std::visit(ResponseWriter{out}, resp);
    }

    std::vector<std::uint8_t> WireCodec::encodeRequest(const Request& req) {
        std::vector<std::uint8_t> out;
        encodeRequestInto(req, out);
        return out;
    }

    std::vector<std::uint8_t> WireCodec::encodeResponse(const Response& resp) {
        std::vector<std::uint8_t> out;
        encodeResponseInto(resp, out);
        return out;
    }

} // namespace trackerd::tracker
