#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>


namespace trackerd::tracker {


    using TransactionId = std::uint32_t;
    using ConnectionId  = std::uint64_t;

    // Wire values (BEP 15).
    enum class AnnounceEvent : std::uint32_t { none = 0, completed = 1, started = 2, stopped = 3 };

    const char* eventName(AnnounceEvent ev);

    struct InfoHash
    {
        std::array<std::uint8_t,20> bytes{};
        std::string toHex() const;
        auto operator<=>(const InfoHash&) const = default;
    };


    struct PeerID
    {
        std::array<std::uint8_t,20> bytes{};
        auto operator<=>(const PeerID&) const = default;
    };


    /// A registered swarm member: IPv4 address (network order) and port.
    struct PeerAddrV4
    {
        std::array<std::uint8_t,4> ip{};
        std::uint16_t port{0};
        std::string toString() const;
        auto operator<=>(const PeerAddrV4&) const = default;
    };


    enum class AddressFamily : std::uint8_t { v4, v6 };

    /**
     * @brief Observed source (or destination) of a datagram.
     *
     * IPv4 addresses occupy the first 4 bytes of `bytes`; the rest stay zero so
     * that the defaulted ordering is well defined for both families.
     */
    struct SocketAddress
    {
        AddressFamily family{AddressFamily::v4};
        std::array<std::uint8_t,16> bytes{};
        std::uint16_t port{0};

        static SocketAddress fromV4(std::array<std::uint8_t,4> ip, std::uint16_t port);
        static SocketAddress fromV6(std::array<std::uint8_t,16> ip, std::uint16_t port);

        bool isV4() const { return family == AddressFamily::v4; }
        std::optional<PeerAddrV4> toPeerV4() const;
        std::string toString() const;   // "1.2.3.4:80" or "[::1]:80"

        auto operator<=>(const SocketAddress&) const = default;
    };


    struct ScrapeStats
    {
        std::int32_t seeders{0};
        std::int32_t completed{0};
        std::int32_t leechers{0};
        bool operator==(const ScrapeStats&) const = default;
    };

} // namespace trackerd::tracker
