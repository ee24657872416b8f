#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "../../logger/logger.hpp"
#include "connection_registry.hpp"
#include "random_source.hpp"
#include "swarm_registry.hpp"
#include "types.hpp"
#include "wire_codec.hpp"


namespace trackerd::tracker {


    /// Largest datagram the server reads or writes.
    inline constexpr std::size_t kMaxDatagramSize = 2048;

    /// Peers that fit in one announce response datagram.
    inline constexpr std::size_t kMaxPeersPerDatagram =
        (kMaxDatagramSize - kAnnounceResponseMinSize) / kCompactPeerSize;


    struct EngineConfig
    {
        std::uint32_t announceInterval{900};
        std::uint32_t defaultNumWant{200};      // used when num_want < 0
        std::uint32_t maxPeersPerReply{kMaxPeersPerDatagram};
    };


    struct EngineStats
    {
        std::uint64_t connects{0};
        std::uint64_t announces{0};
        std::uint64_t scrapes{0};
        std::uint64_t droppedMalformed{0};
        std::uint64_t droppedUnauthorized{0};
    };


    /**
     * @brief The tracker state machine, one datagram at a time.
     *
     * Owns both registries. No socket access: `handleDatagram` encodes the
     * response into `out` and returns true, or returns false when the datagram
     * is dropped. Drops are silent on the wire (no action=3 reply) and only
     * show up in stats and debug logs.
     *
     * Not thread safe; the server calls it from a single thread.
     */
    class TrackerEngine {
    public:
        explicit TrackerEngine(EngineConfig cfg = {},
                               std::unique_ptr<IRandomSource> rng = nullptr,
                               std::shared_ptr<logger::Logger> log = nullptr);

        TrackerEngine(const TrackerEngine&) = delete;
        TrackerEngine& operator=(const TrackerEngine&) = delete;

        bool handleDatagram(std::span<const std::uint8_t> bytes,
                            const SocketAddress& source,
                            std::vector<std::uint8_t>& out);

        // Decoded request entry point (used by handleDatagram and tests).
        std::optional<Response> handleRequest(const Request& req, const SocketAddress& source);

        const EngineConfig& config() const { return cfg_; }
        const EngineStats& stats() const { return stats_; }
        const ConnectionRegistry& connections() const { return connections_; }
        const SwarmRegistry& swarms() const { return swarms_; }

    private:
        std::optional<Response> handle(const ConnectRequest& req, const SocketAddress& source);
        std::optional<Response> handle(const AnnounceRequest& req, const SocketAddress& source);
        std::optional<Response> handle(const ScrapeRequest& req, const SocketAddress& source);

        std::size_t peerLimit(std::int32_t numWant) const;

        EngineConfig cfg_;
        std::unique_ptr<IRandomSource> rng_;
        std::shared_ptr<logger::Logger> log_;
        ConnectionRegistry connections_;
        SwarmRegistry swarms_;
        EngineStats stats_;
    };


} // namespace trackerd::tracker
