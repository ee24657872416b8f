#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "expected.hpp"
#include "types.hpp"


namespace trackerd::tracker {


    /// Connection id a client must present in a Connect request.
    inline constexpr ConnectionId kProtocolMagic = 0x41727101980ULL;

    enum class Action : std::uint32_t { connect = 0, announce = 1, scrape = 2, error = 3 };

    const char* actionName(Action a);

    // ---- Message sizes (bytes) ----
    inline constexpr std::size_t kRequestHeaderSize     = 12;
    inline constexpr std::size_t kConnectRequestSize    = 16;
    inline constexpr std::size_t kAnnounceRequestSize   = 98;
    inline constexpr std::size_t kScrapeRequestMinSize  = 16;
    inline constexpr std::size_t kConnectResponseSize   = 16;
    inline constexpr std::size_t kAnnounceResponseMinSize = 20;
    inline constexpr std::size_t kScrapeResponseMinSize = 8;
    inline constexpr std::size_t kErrorResponseMinSize  = 8;
    inline constexpr std::size_t kCompactPeerSize       = 6;
    inline constexpr std::size_t kScrapeEntrySize       = 12;
    inline constexpr std::size_t kInfoHashSize          = 20;


    // ---------------- Requests (client -> tracker) ----------------

    struct ConnectRequest
    {
        ConnectionId connectionId{kProtocolMagic};
        TransactionId transactionId{0};
        bool operator==(const ConnectRequest&) const = default;
    };

    struct AnnounceRequest
    {
        ConnectionId connectionId{0};
        TransactionId transactionId{0};
        InfoHash infoHash;
        PeerID peerId;
        std::int64_t downloaded{0};
        std::int64_t left{0};
        std::int64_t uploaded{0};
        AnnounceEvent event{AnnounceEvent::none};
        std::uint32_t ip{0};          // client override; ignored by the engine
        std::uint32_t key{0};
        std::int32_t numWant{-1};     // negative = no preference
        std::uint16_t port{0};
        bool operator==(const AnnounceRequest&) const = default;
    };

    struct ScrapeRequest
    {
        ConnectionId connectionId{0};
        TransactionId transactionId{0};
        std::vector<InfoHash> infoHashes;
        bool operator==(const ScrapeRequest&) const = default;
    };

    using Request = std::variant<ConnectRequest, AnnounceRequest, ScrapeRequest>;


    // ---------------- Responses (tracker -> client) ----------------

    struct ConnectResponse
    {
        TransactionId transactionId{0};
        ConnectionId connectionId{0};
        bool operator==(const ConnectResponse&) const = default;
    };

    struct AnnounceResponse
    {
        TransactionId transactionId{0};
        std::uint32_t interval{0};
        std::int32_t leechers{0};
        std::int32_t seeders{0};
        std::vector<PeerAddrV4> peers;
        bool operator==(const AnnounceResponse&) const = default;
    };

    struct ScrapeResponse
    {
        TransactionId transactionId{0};
        std::vector<ScrapeStats> stats;   // one entry per requested hash, request order
        bool operator==(const ScrapeResponse&) const = default;
    };

    struct ErrorResponse
    {
        TransactionId transactionId{0};
        std::string message;
        bool operator==(const ErrorResponse&) const = default;
    };

    using Response = std::variant<ConnectResponse, AnnounceResponse, ScrapeResponse, ErrorResponse>;


    /**
     * @brief BEP-15 binary codec.
     *
     * All integers are big-endian. Decoders check lengths before touching any
     * offset and report the first problem as an Error; they never throw.
     * Encoders append to `out` so callers can reuse a buffer across datagrams.
     */
    struct WireCodec
    {
        static Expected<Request> decodeRequest(std::span<const std::uint8_t> bytes);
        static Expected<Response> decodeResponse(std::span<const std::uint8_t> bytes);

        static void encodeRequestInto(const Request& req, std::vector<std::uint8_t>& out);
        static void encodeResponseInto(const Response& resp, std::vector<std::uint8_t>& out);

        static std::vector<std::uint8_t> encodeRequest(const Request& req);
        static std::vector<std::uint8_t> encodeResponse(const Response& resp);
    };

} // namespace trackerd::tracker
