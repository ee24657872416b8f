#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

#include "types.hpp"


namespace trackerd::tracker {


    /**
     * @brief Per-info-hash swarm state.
     *
     * `seeders` and `leechers` follow announce events, not the peer set: a
     * stopped peer stays in `peers`, and the counters can go negative when
     * stop/complete events arrive for peers that were never counted.
     */
    /// Counter step that wraps modulo 2^32 instead of overflowing, matching the u32 wire encoding.
    inline std::int32_t wrappingAdd(std::int32_t value, std::int32_t delta) {
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(value) + static_cast<std::uint32_t>(delta));
    }


    struct TorrentSwarm
    {
        std::int32_t seeders{0};
        std::int32_t leechers{0};
        std::int32_t completed{0};
        std::set<PeerAddrV4> peers;
    };


    class SwarmRegistry {
    public:
        /**
         * Returns the swarm state after the announce. An unseen hash starts a
         * swarm whose only member is `addr`, counted as a seeder; a known hash
         * gets `event` applied. IPv6 addresses never create or change a swarm.
         */
        TorrentSwarm getOrCreate(const InfoHash& hash, const SocketAddress& addr, AnnounceEvent event);

        /// Applies `event` for `addr` to an existing swarm. Returns false if the hash is unknown.
        bool applyEvent(const InfoHash& hash, const SocketAddress& addr, AnnounceEvent event);

        std::vector<PeerAddrV4> samplePeers(const InfoHash& hash, std::size_t limit) const;

        ScrapeStats scrape(const InfoHash& hash) const;

        const TorrentSwarm* find(const InfoHash& hash) const;
        std::size_t size() const { return swarms_.size(); }

    private:
        static void apply(TorrentSwarm& swarm, const PeerAddrV4& peer, AnnounceEvent event);

        std::map<InfoHash, TorrentSwarm> swarms_;
    };


} // namespace trackerd::tracker
